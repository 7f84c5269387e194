#include <vkenc/command_pool.hpp>
#include <vkenc/device.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace vkenc {

CommandPool::~CommandPool() {
    if (pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(device_, pool_, nullptr);
}

CommandPool::CommandPool(CommandPool&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)),
      pool_(std::exchange(o.pool_, VK_NULL_HANDLE)) {}

CommandPool& CommandPool::operator=(CommandPool&& o) noexcept {
    if (this != &o) {
        if (pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(device_, pool_, nullptr);
        device_ = std::exchange(o.device_, VK_NULL_HANDLE);
        pool_   = std::exchange(o.pool_, VK_NULL_HANDLE);
    }
    return *this;
}

Result<CommandPool> CommandPool::create(const Device& device) {
    VkCommandPoolCreateInfo ci{};
    ci.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    ci.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    ci.queueFamilyIndex = device.queueFamily();

    CommandPool pool;
    pool.device_ = device.vkDevice();

    VkResult vr = vkCreateCommandPool(pool.device_, &ci, nullptr, &pool.pool_);
    if (vr != VK_SUCCESS) {
        return Error{"create command pool", static_cast<std::int32_t>(vr),
                     "vkCreateCommandPool failed for queue family " +
                     std::to_string(device.queueFamily())};
    }
    return pool;
}

Result<VkCommandBuffer> CommandPool::allocate() {
    VkCommandBufferAllocateInfo ai{};
    ai.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool        = pool_;
    ai.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    ai.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkResult vr = vkAllocateCommandBuffers(device_, &ai, &cmd);
    if (vr != VK_SUCCESS) {
        return Error{"allocate command buffer", static_cast<std::int32_t>(vr),
                     "vkAllocateCommandBuffers failed"};
    }
    return cmd;
}

Result<void> CommandPool::reset() {
    VkResult vr = vkResetCommandPool(device_, pool_, 0);
    if (vr != VK_SUCCESS) {
        return Error{"reset command pool", static_cast<std::int32_t>(vr),
                     "vkResetCommandPool failed"};
    }
    return {};
}

} // namespace vkenc
