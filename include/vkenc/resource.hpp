#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <functional>

namespace vkenc {

// A contiguous range of mip levels and array layers.
struct SubresourceRange {
    std::uint32_t baseMipLevel   = 0;
    std::uint32_t levelCount     = 1;
    std::uint32_t baseArrayLayer = 0;
    std::uint32_t layerCount     = 1;

    [[nodiscard]] bool contains(const SubresourceRange& other) const;
    [[nodiscard]] bool overlaps(const SubresourceRange& other) const;
    [[nodiscard]] bool operator==(const SubresourceRange&) const = default;

    // End indices (exclusive) for interval arithmetic.
    [[nodiscard]] std::uint32_t mipEnd()   const { return baseMipLevel + levelCount; }
    [[nodiscard]] std::uint32_t layerEnd() const { return baseArrayLayer + layerCount; }

    // Visit every (mip, layer) pair, mips outermost.
    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (std::uint32_t m = baseMipLevel; m < mipEnd(); ++m)
            for (std::uint32_t l = baseArrayLayer; l < layerEnd(); ++l)
                fn(m, l);
    }
};

// Identity of one (mip, layer) of one image. Tracking never coarsens past
// this: cube faces and mip chain levels are scheduled independently.
// Identity is the VkImage handle, so two slices or views of the same image
// name the same subresources regardless of the view format.
struct SubresourceKey {
    VkImage       image = VK_NULL_HANDLE;
    std::uint32_t mip   = 0;
    std::uint32_t layer = 0;

    [[nodiscard]] bool operator==(const SubresourceKey&) const = default;
};

struct SubresourceKeyHash {
    std::size_t operator()(const SubresourceKey& k) const noexcept {
        std::size_t h = std::hash<VkImage>{}(k.image);
        std::size_t v = static_cast<std::size_t>(k.mip) << 16 | k.layer;
        return h ^ (v + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// Non-owning description of a texture region as seen by the encoder.
// Commands copy these by value; the owning Texture (or the external owner of
// an imported image) must outlive the submission that uses them.
struct TextureSlice {
    VkImage               image         = VK_NULL_HANDLE;
    VkImageView           view          = VK_NULL_HANDLE; // needed only for attachments
    VkFormat              format        = VK_FORMAT_UNDEFINED;
    VkExtent3D            extent        = {0, 0, 1};      // extent of mip 0
    VkImageAspectFlags    aspect        = VK_IMAGE_ASPECT_COLOR_BIT;
    VkImageUsageFlags     usage         = 0;
    VkSampleCountFlagBits samples       = VK_SAMPLE_COUNT_1_BIT;
    VkImageLayout         restingLayout = VK_IMAGE_LAYOUT_GENERAL;
    std::uint32_t         mipLevels     = 1;              // of the whole image
    std::uint32_t         arrayLayers   = 1;              // of the whole image
    SubresourceRange      range;

    [[nodiscard]] SubresourceKey key(std::uint32_t mip, std::uint32_t layer) const {
        return {image, mip, layer};
    }

    [[nodiscard]] bool isDepth() const {
        return (aspect & (VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT)) != 0;
    }

    // Range lies inside the image's mips and layers.
    [[nodiscard]] bool rangeValid() const;

    // Extent of the given mip level (clamped to 1).
    [[nodiscard]] VkExtent3D mipExtent(std::uint32_t mip) const;

    [[nodiscard]] VkImageSubresourceRange  vkRange() const;

    // Base mip of the range, all layers. Copies and blits address one mip.
    [[nodiscard]] VkImageSubresourceLayers vkLayers() const;

    // Narrowed copies. The view is dropped since it no longer matches.
    [[nodiscard]] TextureSlice mip(std::uint32_t level) const;
    [[nodiscard]] TextureSlice layer(std::uint32_t index) const;
    [[nodiscard]] TextureSlice subrange(const SubresourceRange& r) const;
};

// Non-owning description of a buffer region. Identity for scheduling is the
// VkBuffer handle; barriers always cover the whole buffer.
struct BufferSlice {
    VkBuffer           buffer = VK_NULL_HANDLE;
    VkDeviceSize       offset = 0;
    VkDeviceSize       size   = 0;
    VkBufferUsageFlags usage  = 0;

    [[nodiscard]] BufferSlice sub(VkDeviceSize off, VkDeviceSize bytes) const {
        return {buffer, offset + off, bytes, usage};
    }
};

// Any bit that makes an access a write.
[[nodiscard]] bool isWriteAccess(VkAccessFlags2 access);

// Whether `next` must be ordered after `previous` by a barrier.
// Read-after-read is the only pair that needs nothing.
[[nodiscard]] bool hasHazard(VkAccessFlags2 previous, VkAccessFlags2 next);

// Derive aspect flags from image format.
// Depth formats -> DEPTH_BIT, depth+stencil -> DEPTH|STENCIL, else COLOR.
[[nodiscard]] VkImageAspectFlags aspectFromFormat(VkFormat format);

// Size of one texel for uncompressed color and depth formats, 0 when the
// format is compressed or not known here (size checks are then skipped).
[[nodiscard]] std::uint32_t bytesPerTexel(VkFormat format);

// Layouts a texture may rest in between command lists.
[[nodiscard]] bool isRestingLayoutValid(VkImageLayout layout);

} // namespace vkenc
