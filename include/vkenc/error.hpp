#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vkenc {

// Thin error type that carries what we tried, what Vulkan said, and a human message.
// VkResult is stored as int32_t to avoid pulling <vulkan/vulkan.h> into every header.
struct Error {
    std::string operation; // e.g. "format command list"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;   // human-readable explanation + suggestion

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;

    // True when the caller can skip the frame and try again
    // (suboptimal/out-of-date swapchain, timeout, not ready).
    [[nodiscard]] bool recoverable() const;
};

// Recoverable-vs-fatal classification of a raw VkResult.
[[nodiscard]] bool isRecoverable(std::int32_t vkResult);

// Error unwrap hook used by Result<T>::orThrow() and by encoder usage checks.
// When VKENC_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When VKENC_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace vkenc
