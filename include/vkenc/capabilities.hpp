#pragma once

namespace vkenc {

// Which kinds of work the queue an encoder targets can execute.
// Filled from the queue family flags by DeviceBuilder; encoder methods
// refuse commands the queue cannot run.
struct QueueCapabilities {
    bool graphics = true;
    bool compute  = true;
    bool transfer = true;

    [[nodiscard]] static QueueCapabilities all() { return {}; }
    [[nodiscard]] static QueueCapabilities transferOnly() { return {false, false, true}; }
    [[nodiscard]] static QueueCapabilities computeOnly() { return {false, true, true}; }
};

} // namespace vkenc
