#include <vkenc/device.hpp>
#include <vkenc/fence.hpp>

#include <string>

namespace vkenc {

Fence::~Fence() {
    if (fence_ != VK_NULL_HANDLE) {
        vkDestroyFence(device_, fence_, nullptr);
    }
}

Fence::Fence(Fence&& o) noexcept
    : device_(o.device_), fence_(o.fence_) {
    o.device_ = VK_NULL_HANDLE;
    o.fence_  = VK_NULL_HANDLE;
}

Fence& Fence::operator=(Fence&& o) noexcept {
    if (this != &o) {
        if (fence_ != VK_NULL_HANDLE) {
            vkDestroyFence(device_, fence_, nullptr);
        }
        device_   = o.device_;
        fence_    = o.fence_;
        o.device_ = VK_NULL_HANDLE;
        o.fence_  = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Fence> Fence::create(const Device& device, bool signaled) {
    VkFenceCreateInfo fenceCI{};
    fenceCI.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceCI.flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : 0u;

    Fence f;
    f.device_ = device.vkDevice();

    VkResult vr = vkCreateFence(f.device_, &fenceCI, nullptr, &f.fence_);
    if (vr != VK_SUCCESS) {
        return Error{"create fence", static_cast<std::int32_t>(vr),
                     "vkCreateFence failed"};
    }

    return f;
}

Result<void> Fence::wait(std::uint64_t timeoutNs) const {
    // VKENC_BLOCKING_WAIT: host waits for the submission that signals this fence.
    VkResult vr = vkWaitForFences(device_, 1, &fence_, VK_TRUE, timeoutNs);
    if (vr == VK_TIMEOUT) {
        return Error{"wait for fence", static_cast<std::int32_t>(vr),
                     "fence not signaled within " + std::to_string(timeoutNs) + " ns"};
    }
    if (vr != VK_SUCCESS) {
        return Error{"wait for fence", static_cast<std::int32_t>(vr),
                     "vkWaitForFences failed"};
    }
    return {};
}

Result<void> Fence::reset() {
    VkResult vr = vkResetFences(device_, 1, &fence_);
    if (vr != VK_SUCCESS) {
        return Error{"reset fence", static_cast<std::int32_t>(vr),
                     "vkResetFences failed"};
    }
    return {};
}

bool Fence::signaled() const {
    return vkGetFenceStatus(device_, fence_) == VK_SUCCESS;
}

} // namespace vkenc
