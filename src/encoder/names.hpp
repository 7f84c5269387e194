#pragma once

#include <vkenc/resource.hpp>

#include <vulkan/vulkan.h>

#include <string>

// Internal helpers shared by dumpLog(), format() tracing and validation
// messages. Not installed.

namespace vkenc::detail {

[[nodiscard]] const char* layoutName(VkImageLayout layout);

void appendStageBits(std::string& out, VkPipelineStageFlags2 flags);
void appendAccessBits(std::string& out, VkAccessFlags2 flags);

// "image 0x... mip M layer L"
[[nodiscard]] std::string describe(const SubresourceKey& key);
[[nodiscard]] std::string describe(VkBuffer buffer);

} // namespace vkenc::detail
