#include <vkenc/resource.hpp>

#include <algorithm>

namespace vkenc {

bool SubresourceRange::contains(const SubresourceRange& other) const {
    return other.baseMipLevel >= baseMipLevel && other.mipEnd() <= mipEnd() &&
           other.baseArrayLayer >= baseArrayLayer && other.layerEnd() <= layerEnd();
}

bool SubresourceRange::overlaps(const SubresourceRange& other) const {
    if (other.baseMipLevel >= mipEnd() || baseMipLevel >= other.mipEnd())
        return false;
    if (other.baseArrayLayer >= layerEnd() || baseArrayLayer >= other.layerEnd())
        return false;
    return true;
}

bool TextureSlice::rangeValid() const {
    if (range.levelCount == 0 || range.layerCount == 0) return false;
    return SubresourceRange{0, mipLevels, 0, arrayLayers}.contains(range);
}

VkExtent3D TextureSlice::mipExtent(std::uint32_t mip) const {
    return {std::max(1u, extent.width >> mip),
            std::max(1u, extent.height >> mip),
            std::max(1u, extent.depth >> mip)};
}

VkImageSubresourceRange TextureSlice::vkRange() const {
    VkImageSubresourceRange r{};
    r.aspectMask     = aspect;
    r.baseMipLevel   = range.baseMipLevel;
    r.levelCount     = range.levelCount;
    r.baseArrayLayer = range.baseArrayLayer;
    r.layerCount     = range.layerCount;
    return r;
}

VkImageSubresourceLayers TextureSlice::vkLayers() const {
    VkImageSubresourceLayers l{};
    l.aspectMask     = aspect;
    l.mipLevel       = range.baseMipLevel;
    l.baseArrayLayer = range.baseArrayLayer;
    l.layerCount     = range.layerCount;
    return l;
}

TextureSlice TextureSlice::mip(std::uint32_t level) const {
    return subrange({level, 1, range.baseArrayLayer, range.layerCount});
}

TextureSlice TextureSlice::layer(std::uint32_t index) const {
    return subrange({range.baseMipLevel, range.levelCount, index, 1});
}

TextureSlice TextureSlice::subrange(const SubresourceRange& r) const {
    TextureSlice s = *this;
    s.range = r;
    s.view  = VK_NULL_HANDLE;
    return s;
}

bool isWriteAccess(VkAccessFlags2 access) {
    constexpr VkAccessFlags2 writeBits =
        VK_ACCESS_2_SHADER_WRITE_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT |
        VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT | VK_ACCESS_2_TRANSFER_WRITE_BIT |
        VK_ACCESS_2_HOST_WRITE_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT |
        VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    return (access & writeBits) != 0;
}

bool hasHazard(VkAccessFlags2 previous, VkAccessFlags2 next) {
    if (previous == VK_ACCESS_2_NONE) return false;
    return isWriteAccess(previous) || isWriteAccess(next);
}

VkImageAspectFlags aspectFromFormat(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM:
    case VK_FORMAT_D32_SFLOAT:
    case VK_FORMAT_X8_D24_UNORM_PACK32:
        return VK_IMAGE_ASPECT_DEPTH_BIT;

    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;

    case VK_FORMAT_S8_UINT:
        return VK_IMAGE_ASPECT_STENCIL_BIT;

    default:
        return VK_IMAGE_ASPECT_COLOR_BIT;
    }
}

std::uint32_t bytesPerTexel(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8_UNORM:
    case VK_FORMAT_R8_SNORM:
    case VK_FORMAT_R8_UINT:
    case VK_FORMAT_R8_SINT:
    case VK_FORMAT_R8_SRGB:
    case VK_FORMAT_S8_UINT:
        return 1;

    case VK_FORMAT_R8G8_UNORM:
    case VK_FORMAT_R8G8_UINT:
    case VK_FORMAT_R16_UNORM:
    case VK_FORMAT_R16_UINT:
    case VK_FORMAT_R16_SFLOAT:
    case VK_FORMAT_D16_UNORM:
        return 2;

    case VK_FORMAT_R8G8B8A8_UNORM:
    case VK_FORMAT_R8G8B8A8_SNORM:
    case VK_FORMAT_R8G8B8A8_UINT:
    case VK_FORMAT_R8G8B8A8_SINT:
    case VK_FORMAT_R8G8B8A8_SRGB:
    case VK_FORMAT_B8G8R8A8_UNORM:
    case VK_FORMAT_B8G8R8A8_SRGB:
    case VK_FORMAT_A2B10G10R10_UNORM_PACK32:
    case VK_FORMAT_B10G11R11_UFLOAT_PACK32:
    case VK_FORMAT_R16G16_SFLOAT:
    case VK_FORMAT_R16G16_UNORM:
    case VK_FORMAT_R32_UINT:
    case VK_FORMAT_R32_SINT:
    case VK_FORMAT_R32_SFLOAT:
    case VK_FORMAT_D32_SFLOAT:
    case VK_FORMAT_X8_D24_UNORM_PACK32:
    case VK_FORMAT_D24_UNORM_S8_UINT:
        return 4;

    case VK_FORMAT_R16G16B16A16_UNORM:
    case VK_FORMAT_R16G16B16A16_SFLOAT:
    case VK_FORMAT_R32G32_UINT:
    case VK_FORMAT_R32G32_SFLOAT:
        return 8;

    case VK_FORMAT_R32G32B32A32_UINT:
    case VK_FORMAT_R32G32B32A32_SINT:
    case VK_FORMAT_R32G32B32A32_SFLOAT:
        return 16;

    default:
        return 0;
    }
}

bool isRestingLayoutValid(VkImageLayout layout) {
    return layout != VK_IMAGE_LAYOUT_UNDEFINED &&
           layout != VK_IMAGE_LAYOUT_PREINITIALIZED;
}

} // namespace vkenc
