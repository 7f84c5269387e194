#include "one_shot.hpp"

#include <vkenc/device.hpp>

#include <cstdint>

namespace vkenc::detail {

Result<void> submitOneShot(const Device& device, const char* operation,
                           const std::function<void(VkCommandBuffer)>& fn) {
    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    poolCI.queueFamilyIndex = device.queueFamily();

    VkCommandPool cmdPool = VK_NULL_HANDLE;
    VkResult vr = vkCreateCommandPool(device.vkDevice(), &poolCI, nullptr, &cmdPool);
    if (vr != VK_SUCCESS) {
        return Error{operation, static_cast<std::int32_t>(vr),
                     "failed to create transient command pool"};
    }

    auto fail = [&](VkResult r, const char* what) -> Result<void> {
        vkDestroyCommandPool(device.vkDevice(), cmdPool, nullptr);
        return Error{operation, static_cast<std::int32_t>(r), what};
    };

    VkCommandBufferAllocateInfo cmdAI{};
    cmdAI.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cmdAI.commandPool        = cmdPool;
    cmdAI.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cmdAI.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    vr = vkAllocateCommandBuffers(device.vkDevice(), &cmdAI, &cmd);
    if (vr != VK_SUCCESS) return fail(vr, "failed to allocate command buffer");

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vr = vkBeginCommandBuffer(cmd, &beginInfo);
    if (vr != VK_SUCCESS) return fail(vr, "vkBeginCommandBuffer failed");

    fn(cmd);

    vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) return fail(vr, "vkEndCommandBuffer failed");

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = cmd;

    VkSubmitInfo2 submitInfo{};
    submitInfo.sType                  = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submitInfo.commandBufferInfoCount = 1;
    submitInfo.pCommandBufferInfos    = &cmdInfo;

    vr = vkQueueSubmit2(device.queue(), 1, &submitInfo, VK_NULL_HANDLE);
    if (vr != VK_SUCCESS) return fail(vr, "vkQueueSubmit2 failed");

    // VKENC_BLOCKING_WAIT: init-time submission waits for completion.
    vr = vkQueueWaitIdle(device.queue());
    if (vr != VK_SUCCESS) return fail(vr, "vkQueueWaitIdle failed");

    vkDestroyCommandPool(device.vkDevice(), cmdPool, nullptr);
    return {};
}

} // namespace vkenc::detail
