#pragma once

#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkenc {

class Device;

// Timestamp queries for CommandEncoder::writeTimestamp(). Reset the range
// with CommandEncoder::resetQueryPool() in the same list before writing it.
//
// Thread safety: thread-confined.
class QueryPool {
public:
    // Fails when the device queue has no timestamp bits.
    [[nodiscard]] static Result<QueryPool> create(const Device& device, std::uint32_t count);

    ~QueryPool();
    QueryPool(QueryPool&&) noexcept;
    QueryPool& operator=(QueryPool&&) noexcept;
    QueryPool(const QueryPool&) = delete;
    QueryPool& operator=(const QueryPool&) = delete;

    [[nodiscard]] VkQueryPool   vkQueryPool() const { return pool_; }
    [[nodiscard]] std::uint32_t count()       const { return count_; }

    // Nanoseconds per tick on the device queue.
    [[nodiscard]] float period() const { return period_; }

    // Raw 64-bit ticks. With wait == false, queries the GPU has not
    // written yet come back as a recoverable VK_NOT_READY error.
    [[nodiscard]] Result<std::vector<std::uint64_t>> getResults(std::uint32_t first,
                                                                std::uint32_t resultCount,
                                                                bool wait = false) const;

    // Nanoseconds between two queries of this pool, waiting for both.
    [[nodiscard]] Result<double> elapsedNs(std::uint32_t begin, std::uint32_t end) const;

private:
    QueryPool() = default;

    VkDevice      device_ = VK_NULL_HANDLE;
    VkQueryPool   pool_   = VK_NULL_HANDLE;
    std::uint32_t count_  = 0;
    float         period_ = 0.0f;
};

// Tick delta between two timestamps, in nanoseconds. 0 when end < begin.
[[nodiscard]] double timestampDeltaNs(std::uint64_t begin, std::uint64_t end, float timestampPeriod);

} // namespace vkenc
