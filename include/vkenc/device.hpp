#pragma once

#include <vkenc/capabilities.hpp>
#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vkenc {

class Instance;

enum class GpuPrefer {
    Discrete,
    Integrated,
    Any,
};

// One logical device with one queue. The queue family is the first that
// satisfies every capability the builder asked for, so a single encoder
// can target it.
//
// Thread safety: immutable after construction. The VkQueue returned by
// queue() follows Vulkan's externally-synchronized rules.
class Device {
public:
    ~Device();
    Device(Device&&) noexcept;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice          native()           const { return device_; }
    [[nodiscard]] VkDevice          vkDevice()         const { return native(); }
    [[nodiscard]] VkPhysicalDevice  vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkQueue           queue()            const { return queue_; }
    [[nodiscard]] std::uint32_t     queueFamily()      const { return queueFamily_; }
    [[nodiscard]] QueueCapabilities capabilities()     const { return caps_; }
    [[nodiscard]] float             timestampPeriod()  const { return timestampPeriod_; }
    [[nodiscard]] std::uint32_t     timestampValidBits() const { return timestampValidBits_; }
    [[nodiscard]] const char*       gpuName()          const { return gpuName_.c_str(); }

    // Blocks until the device is idle. Returns VK_ERROR_DEVICE_LOST and
    // other failures as an Error.
    [[nodiscard]] Result<void> waitIdle() const;

private:
    friend class DeviceBuilder;
    Device() = default;

    VkDevice          device_             = VK_NULL_HANDLE;
    VkPhysicalDevice  physicalDevice_     = VK_NULL_HANDLE;
    VkQueue           queue_              = VK_NULL_HANDLE;
    std::uint32_t     queueFamily_        = UINT32_MAX;
    QueueCapabilities caps_;
    float             timestampPeriod_    = 0.0f;
    std::uint32_t     timestampValidBits_ = 0;
    std::string       gpuName_;
};

class DeviceBuilder {
public:
    explicit DeviceBuilder(const Instance& instance);

    // Capabilities the chosen queue family must offer. Nothing requested
    // means graphics + compute + transfer.
    DeviceBuilder& needGraphics();
    DeviceBuilder& needCompute();
    DeviceBuilder& needTransfer();

    DeviceBuilder& preferDiscreteGpu();
    DeviceBuilder& preferIntegratedGpu();
    DeviceBuilder& preferGpu(GpuPrefer pref);

    DeviceBuilder& requireExtension(const char* name);

    [[nodiscard]] Result<Device> build();

private:
    [[nodiscard]] std::uint32_t findQueueFamily(VkPhysicalDevice gpu, VkQueueFlags required) const;
    [[nodiscard]] bool          supportsExtensions(VkPhysicalDevice gpu) const;
    [[nodiscard]] bool          supportsRequiredFeatures(VkPhysicalDevice gpu) const;
    [[nodiscard]] int           scoreDevice(VkPhysicalDevice gpu, VkQueueFlags required) const;
    [[nodiscard]] VkQueueFlags  requiredQueueFlags() const;

    VkInstance               instance_ = VK_NULL_HANDLE;
    GpuPrefer                gpuPref_  = GpuPrefer::Discrete;
    std::vector<const char*> extensions_;
    bool needGraphics_ = false;
    bool needCompute_  = false;
    bool needTransfer_ = false;
};

} // namespace vkenc
