#include <vkenc/allocator.hpp>
#include <vkenc/device.hpp>
#include <vkenc/instance.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>
#include <utility>

namespace vkenc {

Allocator::~Allocator() {
    if (allocator_ != nullptr) vmaDestroyAllocator(allocator_);
}

Allocator::Allocator(Allocator&& o) noexcept
    : allocator_(std::exchange(o.allocator_, nullptr)) {}

Allocator& Allocator::operator=(Allocator&& o) noexcept {
    if (this != &o) {
        if (allocator_ != nullptr) vmaDestroyAllocator(allocator_);
        allocator_ = std::exchange(o.allocator_, nullptr);
    }
    return *this;
}

Result<Allocator> Allocator::create(const Instance& instance, const Device& device) {
    // No VMA flags: the device enables neither buffer device address nor
    // memory budget.
    VmaAllocatorCreateInfo ci{};
    ci.instance         = instance.vkInstance();
    ci.physicalDevice   = device.vkPhysicalDevice();
    ci.device           = device.vkDevice();
    ci.vulkanApiVersion = VK_API_VERSION_1_3;

    Allocator a;
    VkResult vr = vmaCreateAllocator(&ci, &a.allocator_);
    if (vr != VK_SUCCESS) {
        return Error{"create allocator", static_cast<std::int32_t>(vr),
                     "vmaCreateAllocator failed"};
    }
    return a;
}

} // namespace vkenc
