#pragma once

#include <vkenc/error.hpp>
#include <vkenc/resource.hpp>
#include <vkenc/result.hpp>
#include <vkenc/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>

namespace vkenc {

class Allocator;

// Thread safety: immutable after construction.
class Buffer {
public:
    ~Buffer();
    Buffer(Buffer&&) noexcept;
    Buffer& operator=(Buffer&&) noexcept;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] VkBuffer           native()     const { return buffer_; }
    [[nodiscard]] VkBuffer           vkBuffer()   const { return native(); }
    [[nodiscard]] VkDeviceSize       size()       const { return size_; }
    [[nodiscard]] VkBufferUsageFlags usage()      const { return usage_; }
    [[nodiscard]] void*              mappedData() const { return mapped_; }

    // Whole buffer, or a byte range of it, as the encoder sees it.
    [[nodiscard]] BufferSlice slice() const { return {buffer_, 0, size_, usage_}; }
    [[nodiscard]] BufferSlice slice(VkDeviceSize offset, VkDeviceSize bytes) const {
        return {buffer_, offset, bytes, usage_};
    }

    // Host-coherence maintenance for mapped buffers. No-ops on coherent memory.
    [[nodiscard]] Result<void> flush() const;
    [[nodiscard]] Result<void> invalidate() const;

private:
    friend class BufferBuilder;
    Buffer() = default;

    VmaAllocator       allocator_  = nullptr;
    VkBuffer           buffer_     = VK_NULL_HANDLE;
    VmaAllocation      allocation_ = nullptr;
    VkDeviceSize       size_       = 0;
    VkBufferUsageFlags usage_      = 0;
    void*              mapped_     = nullptr;
};

class BufferBuilder {
public:
    explicit BufferBuilder(const Allocator& allocator);

    BufferBuilder& size(VkDeviceSize bytes);

    // Convenience methods -- set usage + VMA flags for common patterns.
    BufferBuilder& vertexBuffer();  // VERTEX_BUFFER | TRANSFER_DST
    BufferBuilder& indexBuffer();   // INDEX_BUFFER  | TRANSFER_DST
    BufferBuilder& uniformBuffer(); // UNIFORM_BUFFER | TRANSFER_DST, host-mapped
    BufferBuilder& storageBuffer(); // STORAGE_BUFFER | TRANSFER_SRC | TRANSFER_DST, device-local
    BufferBuilder& stagingBuffer(); // TRANSFER_SRC, host-mapped for sequential writes
    BufferBuilder& readbackBuffer(); // TRANSFER_DST, host-mapped for random reads

    // Escape hatches
    BufferBuilder& usage(VkBufferUsageFlags flags);
    BufferBuilder& mapped();

    [[nodiscard]] Result<Buffer> build();

private:
    VmaAllocator       allocator_  = nullptr;
    VkDeviceSize       size_       = 0;
    VkBufferUsageFlags usage_      = 0;
    bool               mapped_     = false;
    bool               hostRandom_ = false;
};

} // namespace vkenc
