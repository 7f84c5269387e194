#include <vkenc/vkenc.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdio>
#include <utility>

int main() {
    auto instance = vkenc::InstanceBuilder{}
                        .appName("test_device")
                        .requireVulkan(1, 3)
                        .validation(vkenc::Validation::Off)
                        .build();
    assert(instance.ok());
    assert(instance.value().vkInstance() != VK_NULL_HANDLE);
    assert(!instance.value().validationEnabled());

    // 1. Default device: one queue with every capability
    {
        auto device = vkenc::DeviceBuilder(instance.value()).preferDiscreteGpu().build();
        assert(device.ok());

        const vkenc::Device& d = device.value();
        assert(d.vkDevice() != VK_NULL_HANDLE);
        assert(d.vkPhysicalDevice() != VK_NULL_HANDLE);
        assert(d.queue() != VK_NULL_HANDLE);
        assert(d.queueFamily() != UINT32_MAX);
        assert(d.capabilities().graphics);
        assert(d.capabilities().compute);
        assert(d.capabilities().transfer);
        assert(d.timestampPeriod() > 0.0f);
        assert(d.gpuName()[0] != '\0');
        std::printf("  default device (%s): ok\n", d.gpuName());
    }

    // 2. Compute-only request still yields a usable queue
    {
        auto device = vkenc::DeviceBuilder(instance.value())
                          .needCompute()
                          .preferGpu(vkenc::GpuPrefer::Any)
                          .build();
        assert(device.ok());
        assert(device.value().capabilities().compute);
        // Compute queues always support transfer.
        assert(device.value().capabilities().transfer);
        std::printf("  compute device: ok\n");
    }

    // 3. Unknown extension is reported, not ignored
    {
        auto device = vkenc::DeviceBuilder(instance.value())
                          .requireExtension("VK_VKENC_not_a_real_extension")
                          .build();
        assert(!device.ok());
        assert(device.error().operation == "select GPU");
        std::printf("  missing extension: ok\n");
    }

    auto device = vkenc::DeviceBuilder(instance.value()).build();
    assert(device.ok());

    // 4. Encoder picks up the queue capabilities
    {
        vkenc::CommandEncoder enc(device.value());
        assert(enc.capabilities().graphics == device.value().capabilities().graphics);
        assert(enc.capabilities().compute == device.value().capabilities().compute);
        std::printf("  encoder capabilities: ok\n");
    }

    // 5. Command pool allocate / reset
    {
        auto pool = vkenc::CommandPool::create(device.value());
        assert(pool.ok());
        assert(pool.value().vkCommandPool() != VK_NULL_HANDLE);

        auto one = pool.value().allocate();
        assert(one.ok());
        assert(one.value() != VK_NULL_HANDLE);

        auto two = pool.value().allocate();
        assert(two.ok());
        assert(two.value() != one.value());

        auto r = pool.value().reset();
        assert(r.ok());

        VkCommandPool handle = pool.value().vkCommandPool();
        vkenc::CommandPool moved = std::move(pool.value());
        assert(moved.vkCommandPool() == handle);
        std::printf("  command pool: ok\n");
    }

    // 6. Allocator
    {
        auto allocator = vkenc::Allocator::create(instance.value(), device.value());
        assert(allocator.ok());
        assert(allocator.value().vmaAllocator() != nullptr);

        vkenc::Allocator moved = std::move(allocator.value());
        assert(moved.vmaAllocator() != nullptr);
        assert(allocator.value().vmaAllocator() == nullptr);
        std::printf("  allocator: ok\n");
    }

    // 7. An empty list records and submits
    {
        auto pool  = vkenc::CommandPool::create(device.value());
        auto fence = vkenc::Fence::create(device.value());
        assert(pool.ok() && fence.ok());
        auto cmd = pool.value().allocate();
        assert(cmd.ok());

        vkenc::CommandEncoder enc(device.value());
        vkenc::SubmitSync sync;
        sync.fence = fence.value().vkFence();
        auto r = enc.submit(device.value(), cmd.value(), sync);
        assert(r.ok());
        assert(enc.formatted());
        assert(enc.size() == 0);

        auto w = fence.value().wait();
        assert(w.ok());
        std::printf("  empty submit: ok\n");
    }

    auto idle = device.value().waitIdle();
    assert(idle.ok());
    std::printf("  waitIdle: ok\n");

    return 0;
}
