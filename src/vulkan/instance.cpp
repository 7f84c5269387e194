#include <vkenc/instance.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace vkenc {

const char* vkResultToString(VkResult r) {
#define VKENC_RESULT_NAME(code) case code: return #code;
    switch (r) {
    VKENC_RESULT_NAME(VK_SUCCESS)
    VKENC_RESULT_NAME(VK_NOT_READY)
    VKENC_RESULT_NAME(VK_TIMEOUT)
    VKENC_RESULT_NAME(VK_INCOMPLETE)
    VKENC_RESULT_NAME(VK_ERROR_OUT_OF_HOST_MEMORY)
    VKENC_RESULT_NAME(VK_ERROR_OUT_OF_DEVICE_MEMORY)
    VKENC_RESULT_NAME(VK_ERROR_INITIALIZATION_FAILED)
    VKENC_RESULT_NAME(VK_ERROR_DEVICE_LOST)
    VKENC_RESULT_NAME(VK_ERROR_MEMORY_MAP_FAILED)
    VKENC_RESULT_NAME(VK_ERROR_LAYER_NOT_PRESENT)
    VKENC_RESULT_NAME(VK_ERROR_EXTENSION_NOT_PRESENT)
    VKENC_RESULT_NAME(VK_ERROR_FEATURE_NOT_PRESENT)
    VKENC_RESULT_NAME(VK_ERROR_INCOMPATIBLE_DRIVER)
    VKENC_RESULT_NAME(VK_ERROR_TOO_MANY_OBJECTS)
    VKENC_RESULT_NAME(VK_ERROR_FORMAT_NOT_SUPPORTED)
    VKENC_RESULT_NAME(VK_ERROR_OUT_OF_POOL_MEMORY)
    default: return "unknown VkResult";
    }
#undef VKENC_RESULT_NAME
}

namespace {

constexpr const char* ValidationLayer = "VK_LAYER_KHRONOS_validation";

VKAPI_ATTR VkBool32 VKAPI_CALL onValidationMessage(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/) {
    const char* level =
        (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) ? "error" : "warning";
    std::fprintf(stderr, "[vkenc] validation %s: %s\n", level, data->pMessage);
    return VK_FALSE;
}

// Both the layer and the extension that reports through it must be present.
bool validationInstalled() {
    std::uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);
    std::vector<VkLayerProperties> layers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, layers.data());

    bool hasLayer = false;
    for (const auto& l : layers) hasLayer = hasLayer || std::strcmp(l.layerName, ValidationLayer) == 0;
    if (!hasLayer) return false;

    std::uint32_t extCount = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, nullptr);
    std::vector<VkExtensionProperties> exts(extCount);
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, exts.data());

    for (const auto& e : exts)
        if (std::strcmp(e.extensionName, VK_EXT_DEBUG_UTILS_EXTENSION_NAME) == 0) return true;
    return false;
}

VkDebugUtilsMessengerCreateInfoEXT messengerInfo() {
    VkDebugUtilsMessengerCreateInfoEXT ci{};
    ci.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    ci.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    // Synchronization validation reports its hazards as VALIDATION messages.
    ci.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    ci.pfnUserCallback = onValidationMessage;
    return ci;
}

} // namespace

void Instance::destroy() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto destroyMessenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyMessenger) destroyMessenger(instance_, messenger_, nullptr);
        messenger_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

Instance::~Instance() {
    destroy();
}

Instance::Instance(Instance&& o) noexcept
    : instance_(std::exchange(o.instance_, VK_NULL_HANDLE)),
      messenger_(std::exchange(o.messenger_, VK_NULL_HANDLE)) {}

Instance& Instance::operator=(Instance&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_  = std::exchange(o.instance_, VK_NULL_HANDLE);
        messenger_ = std::exchange(o.messenger_, VK_NULL_HANDLE);
    }
    return *this;
}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::requireVulkan(std::uint32_t major,
                                                std::uint32_t minor,
                                                std::uint32_t patch) {
    apiVersion_ = VK_MAKE_API_VERSION(0, major, minor, patch);
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    if (apiVersion_ < VK_API_VERSION_1_3) {
        return Error{"create instance", 0,
                     "vkenc records with synchronization2 and dynamic rendering, "
                     "which need Vulkan 1.3 or newer"};
    }

    bool validate = validation_ == Validation::On;
    if (validate && !validationInstalled()) {
        std::fprintf(stderr, "[vkenc] %s or %s not installed; validation off\n",
                     ValidationLayer, VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        validate = false;
    }

    const char* debugUtils = VK_EXT_DEBUG_UTILS_EXTENSION_NAME;
    VkDebugUtilsMessengerCreateInfoEXT debugCI = messengerInfo();

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = appName_.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "vkenc";
    appInfo.apiVersion         = apiVersion_;

    VkInstanceCreateInfo ci{};
    ci.sType            = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo = &appInfo;
    if (validate) {
        ci.enabledExtensionCount   = 1;
        ci.ppEnabledExtensionNames = &debugUtils;
        ci.enabledLayerCount       = 1;
        ci.ppEnabledLayerNames     = &ValidationLayer;
        // Chained so instance creation and destruction are validated too.
        ci.pNext = &debugCI;
    }

    Instance inst;
    VkResult vr = vkCreateInstance(&ci, nullptr, &inst.instance_);
    if (vr != VK_SUCCESS) {
        std::string msg = vkResultToString(vr);
        if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
            msg += "; the driver does not offer Vulkan " +
                   std::to_string(VK_API_VERSION_MAJOR(apiVersion_)) + "." +
                   std::to_string(VK_API_VERSION_MINOR(apiVersion_));
        }
        return Error{"create instance", static_cast<std::int32_t>(vr), msg};
    }

    if (validate) {
        auto createMessenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(inst.instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createMessenger) {
            vr = createMessenger(inst.instance_, &debugCI, nullptr, &inst.messenger_);
            if (vr != VK_SUCCESS) {
                std::fprintf(stderr, "[vkenc] debug messenger unavailable (%s)\n",
                             vkResultToString(vr));
                inst.messenger_ = VK_NULL_HANDLE;
            }
        }
    }

    return inst;
}

} // namespace vkenc
