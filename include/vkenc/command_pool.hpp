#pragma once

#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

namespace vkenc {

class Device;

// Primary command buffers for CommandEncoder::record() on the device queue.
// Every buffer can be re-recorded on its own, since record() begins each
// one afresh with ONE_TIME_SUBMIT.
//
// Thread safety: thread-confined. Each recording thread needs its own pool.
class CommandPool {
public:
    [[nodiscard]] static Result<CommandPool> create(const Device& device);

    ~CommandPool();
    CommandPool(CommandPool&&) noexcept;
    CommandPool& operator=(CommandPool&&) noexcept;
    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

    [[nodiscard]] VkCommandPool vkCommandPool() const { return pool_; }

    // Freed with the pool.
    [[nodiscard]] Result<VkCommandBuffer> allocate();

    // Returns every buffer from this pool to the initial state. None may be
    // pending on the queue.
    [[nodiscard]] Result<void> reset();

private:
    CommandPool() = default;

    VkDevice      device_ = VK_NULL_HANDLE;
    VkCommandPool pool_   = VK_NULL_HANDLE;
};

} // namespace vkenc
