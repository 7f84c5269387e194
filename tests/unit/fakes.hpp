#pragma once

// Slices over made-up handles. The encoder and scheduler never call Vulkan,
// so any distinct non-null handle value works.

#include <vkenc/resource.hpp>

#include <cstdint>

namespace fakes {

template <typename Handle>
Handle handle(std::uintptr_t v) {
    return reinterpret_cast<Handle>(v);
}

inline vkenc::TextureSlice texture(std::uintptr_t id, VkImageLayout resting,
                                   VkImageUsageFlags usage, std::uint32_t mips = 1,
                                   std::uint32_t layers = 1,
                                   VkFormat format = VK_FORMAT_R8G8B8A8_UNORM) {
    vkenc::TextureSlice s;
    s.image         = handle<VkImage>(id);
    s.view          = handle<VkImageView>(id + 1);
    s.format        = format;
    s.extent        = {64, 64, 1};
    s.aspect        = vkenc::aspectFromFormat(format);
    s.usage         = usage;
    s.restingLayout = resting;
    s.mipLevels     = mips;
    s.arrayLayers   = layers;
    s.range         = {0, mips, 0, layers};
    return s;
}

constexpr VkImageUsageFlags AllColorUsage =
    VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
    VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
    VK_IMAGE_USAGE_TRANSFER_DST_BIT;

// Color target resting in GENERAL.
inline vkenc::TextureSlice colorTexture(std::uintptr_t id,
                                        VkImageLayout resting = VK_IMAGE_LAYOUT_GENERAL) {
    return texture(id, resting, AllColorUsage);
}

inline vkenc::TextureSlice depthTexture(std::uintptr_t id) {
    return texture(id, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL,
                   VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
                   1, 1, VK_FORMAT_D32_SFLOAT);
}

inline vkenc::TextureSlice cubemap(std::uintptr_t id, std::uint32_t mips = 1) {
    return texture(id, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, AllColorUsage, mips, 6);
}

inline vkenc::BufferSlice buffer(std::uintptr_t id, VkDeviceSize size = 1024,
                                 VkBufferUsageFlags usage = VK_BUFFER_USAGE_TRANSFER_SRC_BIT |
                                                            VK_BUFFER_USAGE_TRANSFER_DST_BIT |
                                                            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT |
                                                            VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT |
                                                            VK_BUFFER_USAGE_VERTEX_BUFFER_BIT |
                                                            VK_BUFFER_USAGE_INDEX_BUFFER_BIT) {
    return {handle<VkBuffer>(id), 0, size, usage};
}

} // namespace fakes
