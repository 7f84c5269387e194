#include <vkenc/device.hpp>
#include <vkenc/query_pool.hpp>

#include <string>
#include <utility>

namespace vkenc {

QueryPool::~QueryPool() {
    if (pool_ != VK_NULL_HANDLE) vkDestroyQueryPool(device_, pool_, nullptr);
}

QueryPool::QueryPool(QueryPool&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)),
      pool_(std::exchange(o.pool_, VK_NULL_HANDLE)),
      count_(std::exchange(o.count_, 0u)),
      period_(o.period_) {}

QueryPool& QueryPool::operator=(QueryPool&& o) noexcept {
    if (this != &o) {
        if (pool_ != VK_NULL_HANDLE) vkDestroyQueryPool(device_, pool_, nullptr);
        device_ = std::exchange(o.device_, VK_NULL_HANDLE);
        pool_   = std::exchange(o.pool_, VK_NULL_HANDLE);
        count_  = std::exchange(o.count_, 0u);
        period_ = o.period_;
    }
    return *this;
}

Result<QueryPool> QueryPool::create(const Device& device, std::uint32_t count) {
    if (count == 0) {
        return Error{"create query pool", 0, "query count must be > 0"};
    }
    if (device.timestampValidBits() == 0) {
        return Error{"create query pool", 0,
                     "the device queue does not support timestamps (timestampValidBits == 0)"};
    }

    VkQueryPoolCreateInfo ci{};
    ci.sType      = VK_STRUCTURE_TYPE_QUERY_POOL_CREATE_INFO;
    ci.queryType  = VK_QUERY_TYPE_TIMESTAMP;
    ci.queryCount = count;

    QueryPool qp;
    qp.device_ = device.vkDevice();
    qp.count_  = count;
    qp.period_ = device.timestampPeriod();

    VkResult vr = vkCreateQueryPool(qp.device_, &ci, nullptr, &qp.pool_);
    if (vr != VK_SUCCESS) {
        return Error{"create query pool", static_cast<std::int32_t>(vr),
                     "vkCreateQueryPool failed"};
    }
    return qp;
}

Result<std::vector<std::uint64_t>> QueryPool::getResults(std::uint32_t first,
                                                         std::uint32_t resultCount,
                                                         bool wait) const {
    if (resultCount == 0 || first + resultCount > count_) {
        return Error{"get query pool results", 0,
                     "queries [" + std::to_string(first) + ", " +
                     std::to_string(first + resultCount) + ") are not inside the pool of " +
                     std::to_string(count_)};
    }

    VkQueryResultFlags flags = VK_QUERY_RESULT_64_BIT;
    if (wait) flags |= VK_QUERY_RESULT_WAIT_BIT;

    std::vector<std::uint64_t> ticks(resultCount);
    VkResult vr = vkGetQueryPoolResults(device_, pool_, first, resultCount,
                                        ticks.size() * sizeof(std::uint64_t), ticks.data(),
                                        sizeof(std::uint64_t), flags);
    if (vr != VK_SUCCESS) {
        return Error{"get query pool results", static_cast<std::int32_t>(vr),
                     vr == VK_NOT_READY ? "timestamps not written yet"
                                        : "vkGetQueryPoolResults failed"};
    }
    return ticks;
}

Result<double> QueryPool::elapsedNs(std::uint32_t begin, std::uint32_t end) const {
    auto a = getResults(begin, 1, true);
    if (!a.ok()) return a.error();
    auto b = getResults(end, 1, true);
    if (!b.ok()) return b.error();
    return timestampDeltaNs(a.value()[0], b.value()[0], period_);
}

double timestampDeltaNs(std::uint64_t begin, std::uint64_t end, float timestampPeriod) {
    if (end < begin) return 0.0;
    return static_cast<double>(end - begin) * static_cast<double>(timestampPeriod);
}

} // namespace vkenc
