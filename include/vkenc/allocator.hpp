#pragma once

#include <vkenc/error.hpp>
#include <vkenc/result.hpp>
#include <vkenc/vma_fwd.hpp>

#include <vulkan/vulkan.h>

namespace vkenc {

class Instance;
class Device;

// VMA allocator that Buffer and Texture memory comes from. Must outlive
// every buffer and texture built with it.
//
// Thread safety: VMA locks internally; one Allocator may be shared by
// threads that build buffers and textures.
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const Instance& instance, const Device& device);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator vmaAllocator() const { return allocator_; }

private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
};

} // namespace vkenc
