#pragma once

#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkenc {

class Device;

// RAII VkFence. Submissions signal it; the host waits on it before
// reading results or re-recording resources the submission used.
//
// Thread safety: thread-confined.
class Fence {
public:
    [[nodiscard]] static Result<Fence> create(const Device& device, bool signaled = false);

    ~Fence();
    Fence(Fence&&) noexcept;
    Fence& operator=(Fence&&) noexcept;
    Fence(const Fence&) = delete;
    Fence& operator=(const Fence&) = delete;

    [[nodiscard]] VkFence native()  const { return fence_; }
    [[nodiscard]] VkFence vkFence() const { return native(); }

    // A timeout comes back as a recoverable VK_TIMEOUT error.
    [[nodiscard]] Result<void> wait(std::uint64_t timeoutNs = UINT64_MAX) const;
    [[nodiscard]] Result<void> reset();

    // Non-blocking status query.
    [[nodiscard]] bool signaled() const;

private:
    Fence() = default;

    VkDevice device_ = VK_NULL_HANDLE;
    VkFence  fence_  = VK_NULL_HANDLE;
};

} // namespace vkenc
