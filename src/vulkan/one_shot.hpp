#pragma once

#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <functional>

namespace vkenc {

class Device;

namespace detail {

// Records `fn` into a transient command buffer, submits it to the device
// queue and blocks until the queue is idle. Init-time work only.
[[nodiscard]] Result<void> submitOneShot(const Device& device, const char* operation,
                                         const std::function<void(VkCommandBuffer)>& fn);

} // namespace detail
} // namespace vkenc
