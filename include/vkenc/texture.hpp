#pragma once

#include <vkenc/error.hpp>
#include <vkenc/resource.hpp>
#include <vkenc/result.hpp>
#include <vkenc/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkenc {

class Allocator;
class Device;

// A VMA-backed image that always rests in one declared layout between
// command lists. The builder transitions it out of UNDEFINED once, at
// creation; from then on every encoded list hands it back in that layout.
//
// Thread safety: immutable after construction.
class Texture {
public:
    ~Texture();
    Texture(Texture&&) noexcept;
    Texture& operator=(Texture&&) noexcept;
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] VkImage               native()        const { return image_; }
    [[nodiscard]] VkImage               vkImage()       const { return native(); }
    [[nodiscard]] VkImageView           vkImageView()   const { return view_; }
    [[nodiscard]] VkFormat              format()        const { return format_; }
    [[nodiscard]] VkExtent3D            extent()        const { return extent_; }
    [[nodiscard]] std::uint32_t         mipLevels()     const { return mipLevels_; }
    [[nodiscard]] std::uint32_t         arrayLayers()   const { return arrayLayers_; }
    [[nodiscard]] VkSampleCountFlagBits samples()       const { return samples_; }
    [[nodiscard]] VkImageUsageFlags     usage()         const { return usage_; }
    [[nodiscard]] VkImageAspectFlags    aspect()        const { return aspect_; }
    [[nodiscard]] VkImageLayout         restingLayout() const { return restingLayout_; }

    // Every mip and layer. Carries the default view, which covers the whole
    // image, so a single-mip single-layer texture can be used as an
    // attachment directly.
    [[nodiscard]] TextureSlice slice() const;

    // A sub-range. The slice has no view; create a TextureView for it when
    // it is used as an attachment.
    [[nodiscard]] TextureSlice slice(const SubresourceRange& range) const;

private:
    friend class TextureBuilder;
    Texture() = default;

    void destroy();

    VmaAllocator          allocator_     = nullptr;
    VkDevice              device_        = VK_NULL_HANDLE;
    VkImage               image_         = VK_NULL_HANDLE;
    VkImageView           view_          = VK_NULL_HANDLE;
    VmaAllocation         allocation_    = nullptr;
    VkFormat              format_        = VK_FORMAT_UNDEFINED;
    VkExtent3D            extent_        = {0, 0, 1};
    std::uint32_t         mipLevels_     = 1;
    std::uint32_t         arrayLayers_   = 1;
    VkSampleCountFlagBits samples_       = VK_SAMPLE_COUNT_1_BIT;
    VkImageUsageFlags     usage_         = 0;
    VkImageAspectFlags    aspect_        = VK_IMAGE_ASPECT_COLOR_BIT;
    VkImageLayout         restingLayout_ = VK_IMAGE_LAYOUT_GENERAL;
};

class TextureBuilder {
public:
    // The device is needed for the one-shot transition into the resting layout.
    TextureBuilder(const Device& device, const Allocator& allocator);

    TextureBuilder& size(std::uint32_t width, std::uint32_t height);
    TextureBuilder& format(VkFormat fmt);

    // Convenience methods -- set usage + resting layout for common patterns.
    TextureBuilder& colorTarget();   // COLOR_ATTACHMENT | SAMPLED | TRANSFER_SRC/DST, rests in COLOR_ATTACHMENT_OPTIMAL
    TextureBuilder& depthTarget();   // DEPTH_STENCIL_ATTACHMENT, defaults D32_SFLOAT, rests in DEPTH_STENCIL_ATTACHMENT_OPTIMAL
    TextureBuilder& sampledTexture(); // SAMPLED | TRANSFER_SRC/DST, rests in SHADER_READ_ONLY_OPTIMAL
    TextureBuilder& storageTexture(); // STORAGE | SAMPLED | TRANSFER_SRC/DST, rests in GENERAL
    TextureBuilder& cubemap();        // 6 layers, CUBE_COMPATIBLE
    TextureBuilder& mipmapped();      // full mip chain, computed in build()

    // Escape hatches
    TextureBuilder& usage(VkImageUsageFlags flags);
    TextureBuilder& addUsage(VkImageUsageFlags flags);
    TextureBuilder& samples(VkSampleCountFlagBits s);
    TextureBuilder& mipLevels(std::uint32_t levels);
    TextureBuilder& arrayLayers(std::uint32_t layers);
    TextureBuilder& restingLayout(VkImageLayout layout);

    [[nodiscard]] Result<Texture> build();

private:
    const Device*         device_        = nullptr;
    VmaAllocator          allocator_     = nullptr;
    std::uint32_t         width_         = 0;
    std::uint32_t         height_        = 0;
    VkFormat              format_        = VK_FORMAT_UNDEFINED;
    VkImageUsageFlags     usage_         = 0;
    VkSampleCountFlagBits samples_       = VK_SAMPLE_COUNT_1_BIT;
    std::uint32_t         mipLevels_     = 1;
    std::uint32_t         arrayLayers_   = 1;
    VkImageLayout         restingLayout_ = VK_IMAGE_LAYOUT_GENERAL;
    bool                  cube_          = false;
    bool                  mipmapped_     = false;
};

// A view over part of a texture, e.g. one cube face or one mip, for use as
// an attachment. Non-owning over the image; the texture must outlive it.
//
// Thread safety: immutable after construction.
class TextureView {
public:
    [[nodiscard]] static Result<TextureView> create(const Device& device, const TextureSlice& slice);

    ~TextureView();
    TextureView(TextureView&&) noexcept;
    TextureView& operator=(TextureView&&) noexcept;
    TextureView(const TextureView&) = delete;
    TextureView& operator=(const TextureView&) = delete;

    [[nodiscard]] VkImageView native()      const { return view_; }
    [[nodiscard]] VkImageView vkImageView() const { return native(); }

    // The slice the view was created from, with the view filled in.
    [[nodiscard]] const TextureSlice& slice() const { return slice_; }

private:
    TextureView() = default;

    VkDevice     device_ = VK_NULL_HANDLE;
    VkImageView  view_   = VK_NULL_HANDLE;
    TextureSlice slice_;
};

[[nodiscard]] std::uint32_t calculateMipLevels(std::uint32_t width, std::uint32_t height);

} // namespace vkenc
