#include <vkenc/buffer.hpp>
#include <vkenc/allocator.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>

namespace vkenc {

Buffer::~Buffer() {
    if (buffer_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
    }
}

Buffer::Buffer(Buffer&& o) noexcept
    : allocator_(o.allocator_), buffer_(o.buffer_), allocation_(o.allocation_),
      size_(o.size_), usage_(o.usage_), mapped_(o.mapped_) {
    o.allocator_  = nullptr;
    o.buffer_     = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
    o.size_       = 0;
    o.usage_      = 0;
    o.mapped_     = nullptr;
}

Buffer& Buffer::operator=(Buffer&& o) noexcept {
    if (this != &o) {
        if (buffer_ != VK_NULL_HANDLE) {
            vmaDestroyBuffer(allocator_, buffer_, allocation_);
        }
        allocator_    = o.allocator_;
        buffer_       = o.buffer_;
        allocation_   = o.allocation_;
        size_         = o.size_;
        usage_        = o.usage_;
        mapped_       = o.mapped_;
        o.allocator_  = nullptr;
        o.buffer_     = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
        o.size_       = 0;
        o.usage_      = 0;
        o.mapped_     = nullptr;
    }
    return *this;
}

Result<void> Buffer::flush() const {
    VkResult vr = vmaFlushAllocation(allocator_, allocation_, 0, VK_WHOLE_SIZE);
    if (vr != VK_SUCCESS) {
        return Error{"flush buffer", static_cast<std::int32_t>(vr),
                     "vmaFlushAllocation failed"};
    }
    return {};
}

Result<void> Buffer::invalidate() const {
    VkResult vr = vmaInvalidateAllocation(allocator_, allocation_, 0, VK_WHOLE_SIZE);
    if (vr != VK_SUCCESS) {
        return Error{"invalidate buffer", static_cast<std::int32_t>(vr),
                     "vmaInvalidateAllocation failed"};
    }
    return {};
}

BufferBuilder::BufferBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()) {}

BufferBuilder& BufferBuilder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

BufferBuilder& BufferBuilder::vertexBuffer() {
    usage_ = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return *this;
}

BufferBuilder& BufferBuilder::indexBuffer() {
    usage_ = VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return *this;
}

BufferBuilder& BufferBuilder::uniformBuffer() {
    usage_  = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::storageBuffer() {
    usage_ = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT |
             VK_BUFFER_USAGE_TRANSFER_SRC_BIT |
             VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return *this;
}

BufferBuilder& BufferBuilder::stagingBuffer() {
    usage_  = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    mapped_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::readbackBuffer() {
    usage_      = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_     = true;
    hostRandom_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::usage(VkBufferUsageFlags flags) {
    usage_ = flags;
    return *this;
}

BufferBuilder& BufferBuilder::mapped() {
    mapped_ = true;
    return *this;
}

Result<Buffer> BufferBuilder::build() {
    if (size_ == 0) {
        return Error{"create buffer", 0,
                     "buffer size is 0 -- call size(bytes)"};
    }
    if (usage_ == 0) {
        return Error{"create buffer", 0,
                     "no usage flags -- call storageBuffer(), stagingBuffer(), etc."};
    }

    VkBufferCreateInfo bufCI{};
    bufCI.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufCI.size  = size_;
    bufCI.usage = usage_;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;

    if (mapped_) {
        allocCI.flags = VMA_ALLOCATION_CREATE_MAPPED_BIT |
                        (hostRandom_ ? VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT
                                     : VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT);
    }

    Buffer buf;
    buf.allocator_ = allocator_;
    buf.size_      = size_;
    buf.usage_     = usage_;

    VmaAllocationInfo allocInfo{};
    VkResult vr = vmaCreateBuffer(allocator_, &bufCI, &allocCI,
                                  &buf.buffer_, &buf.allocation_, &allocInfo);
    if (vr != VK_SUCCESS) {
        return Error{"create buffer", static_cast<std::int32_t>(vr),
                     "vmaCreateBuffer failed"};
    }

    if (mapped_) {
        buf.mapped_ = allocInfo.pMappedData;
    }

    return buf;
}

} // namespace vkenc
