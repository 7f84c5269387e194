#include <vkenc/device.hpp>
#include <vkenc/instance.hpp>

#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace vkenc {

Device::~Device() {
    if (device_ != VK_NULL_HANDLE) {
        vkDestroyDevice(device_, nullptr);
    }
}

Device::Device(Device&& o) noexcept
    : device_(o.device_),
      physicalDevice_(o.physicalDevice_),
      queue_(o.queue_),
      queueFamily_(o.queueFamily_),
      caps_(o.caps_),
      timestampPeriod_(o.timestampPeriod_),
      timestampValidBits_(o.timestampValidBits_),
      gpuName_(std::move(o.gpuName_)) {
    o.device_         = VK_NULL_HANDLE;
    o.physicalDevice_ = VK_NULL_HANDLE;
    o.queue_          = VK_NULL_HANDLE;
    o.queueFamily_    = UINT32_MAX;
}

Device& Device::operator=(Device&& o) noexcept {
    if (this != &o) {
        if (device_ != VK_NULL_HANDLE) {
            vkDestroyDevice(device_, nullptr);
        }
        device_             = o.device_;
        physicalDevice_     = o.physicalDevice_;
        queue_              = o.queue_;
        queueFamily_        = o.queueFamily_;
        caps_               = o.caps_;
        timestampPeriod_    = o.timestampPeriod_;
        timestampValidBits_ = o.timestampValidBits_;
        gpuName_            = std::move(o.gpuName_);
        o.device_         = VK_NULL_HANDLE;
        o.physicalDevice_ = VK_NULL_HANDLE;
        o.queue_          = VK_NULL_HANDLE;
        o.queueFamily_    = UINT32_MAX;
    }
    return *this;
}

Result<void> Device::waitIdle() const {
    if (device_ == VK_NULL_HANDLE) return {};
    VkResult vr = vkDeviceWaitIdle(device_);
    if (vr != VK_SUCCESS) {
        return Error{"wait for device idle", static_cast<std::int32_t>(vr),
                     vkResultToString(vr)};
    }
    return {};
}

DeviceBuilder::DeviceBuilder(const Instance& instance)
    : instance_(instance.vkInstance()) {}

DeviceBuilder& DeviceBuilder::needGraphics() {
    needGraphics_ = true;
    return *this;
}

DeviceBuilder& DeviceBuilder::needCompute() {
    needCompute_ = true;
    return *this;
}

DeviceBuilder& DeviceBuilder::needTransfer() {
    needTransfer_ = true;
    return *this;
}

DeviceBuilder& DeviceBuilder::preferDiscreteGpu() {
    return preferGpu(GpuPrefer::Discrete);
}

DeviceBuilder& DeviceBuilder::preferIntegratedGpu() {
    return preferGpu(GpuPrefer::Integrated);
}

DeviceBuilder& DeviceBuilder::preferGpu(GpuPrefer pref) {
    gpuPref_ = pref;
    return *this;
}

DeviceBuilder& DeviceBuilder::requireExtension(const char* name) {
    extensions_.push_back(name);
    return *this;
}

VkQueueFlags DeviceBuilder::requiredQueueFlags() const {
    if (!needGraphics_ && !needCompute_ && !needTransfer_) {
        return VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT;
    }
    VkQueueFlags flags = 0;
    if (needGraphics_) flags |= VK_QUEUE_GRAPHICS_BIT;
    if (needCompute_)  flags |= VK_QUEUE_COMPUTE_BIT;
    if (needTransfer_) flags |= VK_QUEUE_TRANSFER_BIT;
    return flags;
}

// Graphics and compute families implicitly support transfer operations.
static VkQueueFlags EffectiveFlags(VkQueueFlags flags) {
    if (flags & (VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT))
        flags |= VK_QUEUE_TRANSFER_BIT;
    return flags;
}

std::uint32_t DeviceBuilder::findQueueFamily(VkPhysicalDevice gpu, VkQueueFlags required) const {
    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, families.data());

    for (std::uint32_t i = 0; i < count; ++i) {
        if ((EffectiveFlags(families[i].queueFlags) & required) == required)
            return i;
    }
    return UINT32_MAX;
}

bool DeviceBuilder::supportsExtensions(VkPhysicalDevice gpu) const {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, available.data());

    for (auto* required : extensions_) {
        bool found = false;
        for (auto& ext : available) {
            if (std::strcmp(ext.extensionName, required) == 0) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

bool DeviceBuilder::supportsRequiredFeatures(VkPhysicalDevice gpu) const {
    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(gpu, &props);
    if (props.apiVersion < VK_API_VERSION_1_3) return false;

    VkPhysicalDeviceVulkan13Features supported13{};
    supported13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceFeatures2 query{};
    query.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    query.pNext = &supported13;
    vkGetPhysicalDeviceFeatures2(gpu, &query);

    return supported13.synchronization2 == VK_TRUE &&
           supported13.dynamicRendering == VK_TRUE;
}

int DeviceBuilder::scoreDevice(VkPhysicalDevice gpu, VkQueueFlags required) const {
    if (findQueueFamily(gpu, required) == UINT32_MAX) return -1;
    if (!supportsExtensions(gpu)) return -1;
    if (!supportsRequiredFeatures(gpu)) return -1;

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(gpu, &props);

    int score = 0;

    switch (gpuPref_) {
    case GpuPrefer::Discrete:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
            score += 100000;
        break;
    case GpuPrefer::Integrated:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
            score += 100000;
        break;
    case GpuPrefer::Any:
        break;
    }

    // Only dedicated VRAM counts: integrated GPUs expose shared system RAM
    // as DEVICE_LOCAL, but every memory type of such a heap is HOST_VISIBLE.
    VkPhysicalDeviceMemoryProperties mem;
    vkGetPhysicalDeviceMemoryProperties(gpu, &mem);
    for (std::uint32_t i = 0; i < mem.memoryHeapCount; ++i) {
        if (!(mem.memoryHeaps[i].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT))
            continue;
        bool hasDedicatedType = false;
        for (std::uint32_t t = 0; t < mem.memoryTypeCount; ++t) {
            if (mem.memoryTypes[t].heapIndex == i &&
                !(mem.memoryTypes[t].propertyFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT)) {
                hasDedicatedType = true;
                break;
            }
        }
        if (hasDedicatedType) {
            score += static_cast<int>(mem.memoryHeaps[i].size / (1024 * 1024));
            break;
        }
    }

    return score;
}

Result<Device> DeviceBuilder::build() {
    std::uint32_t gpuCount = 0;
    VkResult vr = vkEnumeratePhysicalDevices(instance_, &gpuCount, nullptr);
    if (vr != VK_SUCCESS || gpuCount == 0) {
        return Error{"select GPU", static_cast<std::int32_t>(vr),
                     "No Vulkan-capable GPUs found.\n"
                     "Make sure you have a GPU with Vulkan driver support."};
    }

    std::vector<VkPhysicalDevice> gpus(gpuCount);
    vkEnumeratePhysicalDevices(instance_, &gpuCount, gpus.data());

    VkQueueFlags required = requiredQueueFlags();

    VkPhysicalDevice bestGpu = VK_NULL_HANDLE;
    int bestScore = -1;

    for (auto gpu : gpus) {
        int score = scoreDevice(gpu, required);
        if (score > bestScore) {
            bestScore = score;
            bestGpu   = gpu;
        }
    }

    if (bestGpu == VK_NULL_HANDLE) {
        std::string msg = "No suitable GPU found. Requirements:\n";
        msg += "  - Vulkan 1.3 with synchronization2 and dynamicRendering\n";
        for (auto* ext : extensions_) {
            msg += "  - extension: ";
            msg += ext;
            msg += "\n";
        }
        msg += "  - one queue family with:";
        if (required & VK_QUEUE_GRAPHICS_BIT) msg += " graphics";
        if (required & VK_QUEUE_COMPUTE_BIT)  msg += " compute";
        if (required & VK_QUEUE_TRANSFER_BIT) msg += " transfer";
        msg += "\nAvailable GPUs:\n";
        for (auto gpu : gpus) {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(gpu, &props);
            msg += "  - ";
            msg += props.deviceName;
            msg += " (score: ";
            msg += std::to_string(scoreDevice(gpu, required));
            msg += ")\n";
        }
        return Error{"select GPU", 0, msg};
    }

    std::uint32_t family = findQueueFamily(bestGpu, required);

    float priority = 1.0f;
    VkDeviceQueueCreateInfo qci{};
    qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex = family;
    qci.queueCount       = 1;
    qci.pQueuePriorities = &priority;

    // Every recorded list uses vkCmdPipelineBarrier2 and vkCmdBeginRendering.
    VkPhysicalDeviceVulkan13Features features13{};
    features13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    features13.synchronization2 = VK_TRUE;
    features13.dynamicRendering = VK_TRUE;

    VkPhysicalDeviceFeatures2 features2{};
    features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features2.pNext = &features13;

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &features2;
    ci.queueCreateInfoCount    = 1;
    ci.pQueueCreateInfos       = &qci;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions_.size());
    ci.ppEnabledExtensionNames = extensions_.data();

    Device dev;
    dev.physicalDevice_ = bestGpu;
    dev.queueFamily_    = family;

    vr = vkCreateDevice(bestGpu, &ci, nullptr, &dev.device_);
    if (vr != VK_SUCCESS) {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(bestGpu, &props);
        std::string msg = "vkCreateDevice failed for '";
        msg += props.deviceName;
        msg += "'";
        if (vr == VK_ERROR_FEATURE_NOT_PRESENT) {
            msg += ".\nA requested Vulkan feature is not supported by this GPU.";
        }
        return Error{"create device", static_cast<std::int32_t>(vr), msg};
    }

    vkGetDeviceQueue(dev.device_, family, 0, &dev.queue_);

    std::uint32_t familyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(bestGpu, &familyCount, nullptr);
    std::vector<VkQueueFamilyProperties> families(familyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(bestGpu, &familyCount, families.data());
    VkQueueFlags flags = EffectiveFlags(families[family].queueFlags);

    dev.caps_.graphics     = (flags & VK_QUEUE_GRAPHICS_BIT) != 0;
    dev.caps_.compute      = (flags & VK_QUEUE_COMPUTE_BIT)  != 0;
    dev.caps_.transfer     = (flags & VK_QUEUE_TRANSFER_BIT) != 0;
    dev.timestampValidBits_ = families[family].timestampValidBits;

    VkPhysicalDeviceProperties devProps;
    vkGetPhysicalDeviceProperties(bestGpu, &devProps);
    dev.timestampPeriod_ = devProps.limits.timestampPeriod;
    dev.gpuName_         = devProps.deviceName;

#ifndef NDEBUG
    std::fprintf(stderr, "[vkenc] device '%s', queue family %u\n",
                 dev.gpuName_.c_str(), family);
#endif

    return dev;
}

} // namespace vkenc
