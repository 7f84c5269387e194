#include <vkenc/texture.hpp>
#include <vkenc/allocator.hpp>
#include <vkenc/device.hpp>

#include "one_shot.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

namespace vkenc {

void Texture::destroy() {
    if (view_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_, view_, nullptr);
        view_ = VK_NULL_HANDLE;
    }
    if (image_ != VK_NULL_HANDLE) {
        vmaDestroyImage(allocator_, image_, allocation_);
        image_      = VK_NULL_HANDLE;
        allocation_ = nullptr;
    }
}

Texture::~Texture() {
    destroy();
}

Texture::Texture(Texture&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_), image_(o.image_),
      view_(o.view_), allocation_(o.allocation_), format_(o.format_),
      extent_(o.extent_), mipLevels_(o.mipLevels_), arrayLayers_(o.arrayLayers_),
      samples_(o.samples_), usage_(o.usage_), aspect_(o.aspect_),
      restingLayout_(o.restingLayout_) {
    o.allocator_  = nullptr;
    o.device_     = VK_NULL_HANDLE;
    o.image_      = VK_NULL_HANDLE;
    o.view_       = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
}

Texture& Texture::operator=(Texture&& o) noexcept {
    if (this != &o) {
        destroy();
        allocator_     = o.allocator_;
        device_        = o.device_;
        image_         = o.image_;
        view_          = o.view_;
        allocation_    = o.allocation_;
        format_        = o.format_;
        extent_        = o.extent_;
        mipLevels_     = o.mipLevels_;
        arrayLayers_   = o.arrayLayers_;
        samples_       = o.samples_;
        usage_         = o.usage_;
        aspect_        = o.aspect_;
        restingLayout_ = o.restingLayout_;
        o.allocator_  = nullptr;
        o.device_     = VK_NULL_HANDLE;
        o.image_      = VK_NULL_HANDLE;
        o.view_       = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
    }
    return *this;
}

TextureSlice Texture::slice() const {
    TextureSlice s;
    s.image         = image_;
    s.view          = view_;
    s.format        = format_;
    s.extent        = extent_;
    s.aspect        = aspect_;
    s.usage         = usage_;
    s.samples       = samples_;
    s.restingLayout = restingLayout_;
    s.mipLevels     = mipLevels_;
    s.arrayLayers   = arrayLayers_;
    s.range         = {0, mipLevels_, 0, arrayLayers_};
    return s;
}

TextureSlice Texture::slice(const SubresourceRange& range) const {
    return slice().subrange(range);
}

TextureBuilder::TextureBuilder(const Device& device, const Allocator& allocator)
    : device_(&device), allocator_(allocator.vmaAllocator()) {}

TextureBuilder& TextureBuilder::size(std::uint32_t width, std::uint32_t height) {
    width_  = width;
    height_ = height;
    return *this;
}

TextureBuilder& TextureBuilder::format(VkFormat fmt) {
    format_ = fmt;
    return *this;
}

TextureBuilder& TextureBuilder::colorTarget() {
    usage_ = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
             VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    restingLayout_ = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    return *this;
}

TextureBuilder& TextureBuilder::depthTarget() {
    usage_ = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    if (format_ == VK_FORMAT_UNDEFINED) {
        format_ = VK_FORMAT_D32_SFLOAT;
    }
    restingLayout_ = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    return *this;
}

TextureBuilder& TextureBuilder::sampledTexture() {
    usage_ = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
             VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    restingLayout_ = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    return *this;
}

TextureBuilder& TextureBuilder::storageTexture() {
    usage_ = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
             VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    restingLayout_ = VK_IMAGE_LAYOUT_GENERAL;
    return *this;
}

TextureBuilder& TextureBuilder::cubemap() {
    cube_        = true;
    arrayLayers_ = 6;
    return *this;
}

TextureBuilder& TextureBuilder::mipmapped() {
    mipmapped_ = true;
    return *this;
}

TextureBuilder& TextureBuilder::usage(VkImageUsageFlags flags) {
    usage_ = flags;
    return *this;
}

TextureBuilder& TextureBuilder::addUsage(VkImageUsageFlags flags) {
    usage_ |= flags;
    return *this;
}

TextureBuilder& TextureBuilder::samples(VkSampleCountFlagBits s) {
    samples_ = s;
    return *this;
}

TextureBuilder& TextureBuilder::mipLevels(std::uint32_t levels) {
    mipLevels_ = levels;
    return *this;
}

TextureBuilder& TextureBuilder::arrayLayers(std::uint32_t layers) {
    arrayLayers_ = layers;
    return *this;
}

TextureBuilder& TextureBuilder::restingLayout(VkImageLayout layout) {
    restingLayout_ = layout;
    return *this;
}

Result<Texture> TextureBuilder::build() {
    if (width_ == 0 || height_ == 0) {
        return Error{"create texture", 0,
                     "texture size is 0 -- call size(width, height)"};
    }
    if (format_ == VK_FORMAT_UNDEFINED) {
        return Error{"create texture", 0,
                     "no format set -- call format(VkFormat) or a convenience method"};
    }
    if (usage_ == 0) {
        return Error{"create texture", 0,
                     "no usage flags -- call colorTarget(), sampledTexture(), etc."};
    }
    if (!isRestingLayoutValid(restingLayout_)) {
        return Error{"create texture", 0,
                     "resting layout cannot be UNDEFINED or PREINITIALIZED"};
    }
    if (cube_ && (width_ != height_ || arrayLayers_ % 6 != 0)) {
        return Error{"create texture", 0,
                     "cube textures need square faces and a multiple of 6 layers"};
    }
    if (arrayLayers_ == 0 || mipLevels_ == 0) {
        return Error{"create texture", 0, "mip and layer counts must be at least 1"};
    }

    if (mipmapped_) {
        mipLevels_ = calculateMipLevels(width_, height_);
    }

    VkImageAspectFlags aspect = aspectFromFormat(format_);

    VkImageCreateInfo imageCI{};
    imageCI.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageCI.flags         = cube_ ? VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT : 0;
    imageCI.imageType     = VK_IMAGE_TYPE_2D;
    imageCI.format        = format_;
    imageCI.extent        = {width_, height_, 1};
    imageCI.mipLevels     = mipLevels_;
    imageCI.arrayLayers   = arrayLayers_;
    imageCI.samples       = samples_;
    imageCI.tiling        = VK_IMAGE_TILING_OPTIMAL;
    imageCI.usage         = usage_;
    imageCI.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    imageCI.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;

    Texture tex;
    tex.allocator_     = allocator_;
    tex.device_        = device_->vkDevice();
    tex.format_        = format_;
    tex.extent_        = {width_, height_, 1};
    tex.mipLevels_     = mipLevels_;
    tex.arrayLayers_   = arrayLayers_;
    tex.samples_       = samples_;
    tex.usage_         = usage_;
    tex.aspect_        = aspect;
    tex.restingLayout_ = restingLayout_;

    VkResult vr = vmaCreateImage(allocator_, &imageCI, &allocCI,
                                 &tex.image_, &tex.allocation_, nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"create texture", static_cast<std::int32_t>(vr),
                     "vmaCreateImage failed"};
    }

    constexpr VkImageUsageFlags viewUsage =
        VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_STORAGE_BIT |
        VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT |
        VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT;

    if (usage_ & viewUsage) {
        VkImageViewCreateInfo viewCI{};
        viewCI.sType    = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewCI.image    = tex.image_;
        viewCI.viewType = cube_ && arrayLayers_ == 6 ? VK_IMAGE_VIEW_TYPE_CUBE
                        : arrayLayers_ > 1           ? VK_IMAGE_VIEW_TYPE_2D_ARRAY
                                                     : VK_IMAGE_VIEW_TYPE_2D;
        viewCI.format   = format_;
        viewCI.subresourceRange = {aspect, 0, mipLevels_, 0, arrayLayers_};

        vr = vkCreateImageView(tex.device_, &viewCI, nullptr, &tex.view_);
        if (vr != VK_SUCCESS) {
            tex.destroy(); // image and allocation
            return Error{"create texture view", static_cast<std::int32_t>(vr),
                         "vkCreateImageView failed for VMA-allocated image"};
        }
    }

    // Out of UNDEFINED exactly once; encoded lists assume the resting layout.
    auto transitioned = detail::submitOneShot(*device_, "create texture", [&](VkCommandBuffer cmd) {
        VkImageMemoryBarrier2 barrier{};
        barrier.sType            = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        barrier.srcStageMask     = VK_PIPELINE_STAGE_2_NONE;
        barrier.srcAccessMask    = VK_ACCESS_2_NONE;
        barrier.dstStageMask     = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.dstAccessMask    = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT;
        barrier.oldLayout        = VK_IMAGE_LAYOUT_UNDEFINED;
        barrier.newLayout        = restingLayout_;
        barrier.image            = tex.image_;
        barrier.subresourceRange = {aspect, 0, VK_REMAINING_MIP_LEVELS,
                                    0, VK_REMAINING_ARRAY_LAYERS};

        VkDependencyInfo dep{};
        dep.sType                   = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dep.imageMemoryBarrierCount = 1;
        dep.pImageMemoryBarriers    = &barrier;
        vkCmdPipelineBarrier2(cmd, &dep);
    });
    if (!transitioned.ok()) return transitioned.error();

    return tex;
}

TextureView::~TextureView() {
    if (view_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_, view_, nullptr);
    }
}

TextureView::TextureView(TextureView&& o) noexcept
    : device_(o.device_), view_(o.view_), slice_(o.slice_) {
    o.device_ = VK_NULL_HANDLE;
    o.view_   = VK_NULL_HANDLE;
}

TextureView& TextureView::operator=(TextureView&& o) noexcept {
    if (this != &o) {
        if (view_ != VK_NULL_HANDLE) {
            vkDestroyImageView(device_, view_, nullptr);
        }
        device_   = o.device_;
        view_     = o.view_;
        slice_    = o.slice_;
        o.device_ = VK_NULL_HANDLE;
        o.view_   = VK_NULL_HANDLE;
    }
    return *this;
}

Result<TextureView> TextureView::create(const Device& device, const TextureSlice& slice) {
    if (slice.image == VK_NULL_HANDLE) {
        return Error{"create texture view", 0, "slice has no image"};
    }
    if (!slice.rangeValid()) {
        return Error{"create texture view", 0,
                     "range [mip " + std::to_string(slice.range.baseMipLevel) + "+" +
                     std::to_string(slice.range.levelCount) + ", layer " +
                     std::to_string(slice.range.baseArrayLayer) + "+" +
                     std::to_string(slice.range.layerCount) + "] is outside the texture"};
    }

    VkImageViewCreateInfo viewCI{};
    viewCI.sType            = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewCI.image            = slice.image;
    viewCI.viewType         = slice.range.layerCount > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY
                                                         : VK_IMAGE_VIEW_TYPE_2D;
    viewCI.format           = slice.format;
    viewCI.subresourceRange = slice.vkRange();

    TextureView tv;
    tv.device_ = device.vkDevice();
    tv.slice_  = slice;

    VkResult vr = vkCreateImageView(tv.device_, &viewCI, nullptr, &tv.view_);
    if (vr != VK_SUCCESS) {
        return Error{"create texture view", static_cast<std::int32_t>(vr),
                     "vkCreateImageView failed"};
    }
    tv.slice_.view = tv.view_;

    return tv;
}

std::uint32_t calculateMipLevels(std::uint32_t width, std::uint32_t height) {
    if (width == 0 || height == 0)
        return 1;
    return static_cast<std::uint32_t>(std::floor(std::log2(std::max(width, height)))) + 1;
}

} // namespace vkenc
