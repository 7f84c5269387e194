#pragma once

#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace vkenc {

enum class Validation {
    Off,
    On,
};

#ifdef NDEBUG
inline constexpr Validation DefaultValidation = Validation::Off;
#else
inline constexpr Validation DefaultValidation = Validation::On;
#endif

// Headless instance for command recording. The only optional extension is
// debug utils, enabled together with the validation layer.
//
// Thread safety: immutable after construction.
class Instance {
public:
    ~Instance();
    Instance(Instance&&) noexcept;
    Instance& operator=(Instance&&) noexcept;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] VkInstance native()     const { return instance_; }
    [[nodiscard]] VkInstance vkInstance() const { return native(); }
    [[nodiscard]] bool validationEnabled() const { return messenger_ != VK_NULL_HANDLE; }

private:
    friend class InstanceBuilder;
    Instance() = default;

    void destroy();

    VkInstance               instance_  = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
};

class InstanceBuilder {
public:
    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& requireVulkan(std::uint32_t major, std::uint32_t minor, std::uint32_t patch = 0);

    // Validation::On falls back to no validation, with a note on stderr,
    // when the Khronos layer or debug utils are not installed.
    InstanceBuilder& validation(Validation v);

    [[nodiscard]] Result<Instance> build();

private:
    std::string   appName_    = "vkenc_app";
    std::uint32_t apiVersion_ = VK_API_VERSION_1_3;
    Validation    validation_ = DefaultValidation;
};

// Enumerant name of a VkResult, used in error messages.
[[nodiscard]] const char* vkResultToString(VkResult r);

} // namespace vkenc
