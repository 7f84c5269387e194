#pragma once

#include <vkenc/encoder/command.hpp>
#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace vkenc {

// What the nearest touches of one subresource (or buffer) left behind,
// seen from one scan direction. Non-barrier touches with no barrier between
// them accumulate access and stage, so a barrier waits on every reader, not
// only the last one.
struct LastTouch {
    VkAccessFlags2        access        = VK_ACCESS_2_NONE;
    VkPipelineStageFlags2 stage         = VK_PIPELINE_STAGE_2_NONE;
    VkImageLayout         layout        = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageLayout         restingLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageAspectFlags    aspect        = VK_IMAGE_ASPECT_COLOR_BIT;
    bool                  fromBarrier   = false; // nearest event was a barrier record
};

struct TouchTables {
    std::unordered_map<SubresourceKey, LastTouch, SubresourceKeyHash> textures;
    std::unordered_map<VkBuffer, LastTouch>                           buffers;
};

// Forward scan. Fills srcAccess/srcStage/srcLayout of every barrier record
// from the nearest earlier touches:
//   no earlier touch        -> TOP_OF_PIPE, no access, resting layout
//   earlier barrier record  -> ALL_COMMANDS, no access, that barrier's dstLayout
// Returns the table left after the last command (input to the restore barrier).
TouchTables resolveBarrierSources(std::vector<Command>& commands);

// Backward scan. Fills dstAccess/dstStage/dstLayout from the nearest later
// touches:
//   no later touch          -> BOTTOM_OF_PIPE, no access, dstLayout kept
//   later barrier record    -> ALL_COMMANDS, no access, dstLayout kept
void resolveBarrierDestinations(std::vector<Command>& commands);

// Barrier returning every subresource whose final layout differs from its
// resting layout. nullopt when everything already rests.
[[nodiscard]] std::optional<PipelineBarrier> buildRestoreBarrier(const TouchTables& finalState);

// Checks the list is schedulable: no command needs a layout other than the
// tracked one, no write hazard lacks a barrier, no command touches one
// subresource in two layouts.
[[nodiscard]] Result<void> validateCommands(const std::vector<Command>& commands);

// Append-time half of scheduling. Tracks the running layout and the access
// since the last barrier of every subresource, and produces the stub barrier
// a command needs in front of it.
//
// A stub record is produced when the command needs a layout other than the
// running one, or when its access conflicts with the access since the last
// barrier (anything involving a write).
//
// Thread safety: thread-confined.
class StubPlanner {
public:
    // Stub for `command` (possibly empty). Updates the running state as if
    // the stub and the command were appended. Barrier commands produce no
    // stub; their layout changes are applied and hazard tracking resets.
    [[nodiscard]] PipelineBarrier plan(const Command& command);

    // Running layout of a subresource, or `resting` when never touched.
    [[nodiscard]] VkImageLayout currentLayout(const SubresourceKey& key,
                                              VkImageLayout resting) const;

    void reset();

private:
    struct Running {
        VkImageLayout  layout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkAccessFlags2 access = VK_ACCESS_2_NONE;
    };

    std::unordered_map<SubresourceKey, Running, SubresourceKeyHash> textures_;
    std::unordered_map<VkBuffer, VkAccessFlags2>                    buffers_;
};

// Ordered list of commands plus the formatted flag.
//
// append() is raw: no stub is inserted. CommandEncoder is the normal entry
// point; CommandList is exposed for callers that place barriers themselves.
//
// Thread safety: thread-confined.
class CommandList {
public:
    // Appends after format() drop the restore barrier and clear the flag.
    void append(Command command);

    // Validate, resolve both directions, append the restore barrier.
    // No-op when already formatted. On error the list stays unformatted
    // and unmodified.
    [[nodiscard]] Result<void> format();

    [[nodiscard]] bool formatted()          const { return formatted_; }
    [[nodiscard]] bool hasRestoreBarrier()  const { return hasRestore_; }
    [[nodiscard]] std::size_t size()        const { return commands_.size(); }
    [[nodiscard]] bool empty()              const { return commands_.empty(); }

    [[nodiscard]] const std::vector<Command>& commands() const { return commands_; }

    void clear();

private:
    std::vector<Command> commands_;
    bool formatted_  = false;
    bool hasRestore_ = false;
};

} // namespace vkenc
