#include <vkenc/error.hpp>
#include <vkenc/instance.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <string>

int main() {
    // Vulkan error with message
    {
        vkenc::Error e{"create device", -3, "GPU only supports Vulkan 1.2"};
        std::string s = e.format();
        assert(s.find("create device") != std::string::npos);
        assert(s.find("VkResult -3") != std::string::npos);
        assert(s.find("GPU only supports Vulkan 1.2") != std::string::npos);
        assert(s.find("[recoverable]") == std::string::npos);
    }

    // Non-Vulkan error (vkResult == 0)
    {
        vkenc::Error e{"format command list", 0, "command 3 (GraphicsPass) needs ..."};
        std::string s = e.format();
        assert(s.find("format command list") != std::string::npos);
        assert(s.find("VkResult") == std::string::npos);
        assert(s.find("GraphicsPass") != std::string::npos);
        assert(!e.recoverable());
    }

    // No message
    {
        vkenc::Error e{"create instance", -1, ""};
        std::string s = e.format();
        assert(s.find("create instance") != std::string::npos);
        assert(s.find("VkResult -1") != std::string::npos);
    }

    // Recoverable classification
    {
        assert(vkenc::isRecoverable(VK_TIMEOUT));
        assert(vkenc::isRecoverable(VK_NOT_READY));
        assert(vkenc::isRecoverable(VK_SUBOPTIMAL_KHR));
        assert(vkenc::isRecoverable(VK_ERROR_OUT_OF_DATE_KHR));
        assert(!vkenc::isRecoverable(VK_SUCCESS));
        assert(!vkenc::isRecoverable(VK_ERROR_DEVICE_LOST));
        assert(!vkenc::isRecoverable(VK_ERROR_OUT_OF_DEVICE_MEMORY));
    }

    // Recoverable errors say so when formatted
    {
        vkenc::Error e{"wait for fence", VK_TIMEOUT, "fence not signaled within 0 ns"};
        assert(e.recoverable());
        assert(e.format().find("[recoverable]") != std::string::npos);
    }

    // VkResult names
    {
        assert(std::string(vkenc::vkResultToString(VK_ERROR_DEVICE_LOST)) ==
               "VK_ERROR_DEVICE_LOST");
        assert(std::string(vkenc::vkResultToString(VK_TIMEOUT)) == "VK_TIMEOUT");
        assert(std::string(vkenc::vkResultToString(VK_ERROR_OUT_OF_DATE_KHR)) ==
               "unknown VkResult");
    }

    return 0;
}
