#include <vkenc/error.hpp>

#include <vulkan/vulkan.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace vkenc {

#ifndef VKENC_ENABLE_EXCEPTIONS
#define VKENC_ENABLE_EXCEPTIONS 1
#endif

std::string Error::format() const {
    std::string out = "vkenc: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
        if (recoverable()) out += " [recoverable]";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

bool Error::recoverable() const {
    return isRecoverable(vkResult);
}

bool isRecoverable(std::int32_t vkResult) {
    switch (static_cast<VkResult>(vkResult)) {
    case VK_SUBOPTIMAL_KHR:
    case VK_ERROR_OUT_OF_DATE_KHR:
    case VK_TIMEOUT:
    case VK_NOT_READY:
        return true;
    default:
        return false;
    }
}

void throwError(const Error& e) {
#if VKENC_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace vkenc
