#pragma once

#include <vkenc/encoder/command.hpp>
#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <vector>

namespace vkenc {

class Device;

struct SemaphoreWait {
    VkSemaphore           semaphore = VK_NULL_HANDLE;
    VkPipelineStageFlags2 stage     = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    std::uint64_t         value     = 0; // timeline semaphores only
};

struct SemaphoreSignal {
    VkSemaphore           semaphore = VK_NULL_HANDLE;
    VkPipelineStageFlags2 stage     = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    std::uint64_t         value     = 0;
};

// Synchronization for one vkQueueSubmit2. All members optional.
struct SubmitSync {
    std::vector<SemaphoreWait>   waits;
    std::vector<SemaphoreSignal> signals;
    VkFence                      fence = VK_NULL_HANDLE;
};

// Replays a formatted command list into a command buffer in the recording
// state. Does not begin or end the command buffer.
void replayCommands(VkCommandBuffer cmd, const std::vector<Command>& commands);

// Begin (ONE_TIME_SUBMIT), replay, end.
[[nodiscard]] Result<void> recordCommands(VkCommandBuffer cmd, const std::vector<Command>& commands);

// One vkQueueSubmit2 of `cmd` on the device queue.
[[nodiscard]] Result<void> submitCommandBuffer(const Device& device, VkCommandBuffer cmd,
                                               const SubmitSync& sync);

} // namespace vkenc
