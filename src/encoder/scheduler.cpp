#include <vkenc/encoder/scheduler.hpp>

#include "names.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <string>
#include <utility>

namespace vkenc {

namespace {

constexpr const char* FormatOp = "format command list";

std::string commandLabel(std::size_t index, const Command& command) {
    return "command " + std::to_string(index) + " (" + commandName(command) + ")";
}

// Fold a non-barrier touch into the table entry for one direction.
void accumulate(LastTouch& entry, bool existed, VkAccessFlags2 access,
                VkPipelineStageFlags2 stage, VkImageLayout layout) {
    if (existed && !entry.fromBarrier) {
        entry.access |= access;
        entry.stage  |= stage;
        entry.layout  = layout;
        return;
    }
    entry.access      = access;
    entry.stage       = stage;
    entry.layout      = layout;
    entry.fromBarrier = false;
}

void recordTouches(TouchTables& tables, const Command& command) {
    for (const auto& t : touchedTextures(command)) {
        auto [it, inserted] = tables.textures.try_emplace(t.key);
        LastTouch& e = it->second;
        accumulate(e, !inserted, t.access, t.stage, t.layout);
        e.restingLayout = t.restingLayout;
        e.aspect        = t.aspect;
    }
    for (const auto& b : touchedBuffers(command)) {
        auto [it, inserted] = tables.buffers.try_emplace(b.buffer);
        accumulate(it->second, !inserted, b.access, b.stage, VK_IMAGE_LAYOUT_UNDEFINED);
    }
}

VkPipelineStageFlags2 unionOrDefault(VkPipelineStageFlags2 stages, VkPipelineStageFlags2 fallback) {
    return stages != VK_PIPELINE_STAGE_2_NONE ? stages : fallback;
}

} // namespace

TouchTables resolveBarrierSources(std::vector<Command>& commands) {
    TouchTables tables;

    for (auto& command : commands) {
        auto* barrier = std::get_if<PipelineBarrier>(&command);
        if (!barrier) {
            recordTouches(tables, command);
            continue;
        }

        VkPipelineStageFlags2 srcUnion = VK_PIPELINE_STAGE_2_NONE;

        for (auto& rec : barrier->textures) {
            auto it = tables.textures.find(rec.key);
            if (it == tables.textures.end()) {
                rec.srcAccess = VK_ACCESS_2_NONE;
                rec.srcStage  = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
                rec.srcLayout = rec.restingLayout;
            } else if (it->second.fromBarrier) {
                rec.srcAccess = VK_ACCESS_2_NONE;
                rec.srcStage  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
                rec.srcLayout = it->second.layout;
#ifndef NDEBUG
                std::fprintf(stderr,
                             "[vkenc perf] back-to-back barriers on %s; "
                             "resolved with ALL_COMMANDS\n",
                             detail::describe(rec.key).c_str());
#endif
            } else {
                rec.srcAccess = it->second.access;
                rec.srcStage  = it->second.stage;
                rec.srcLayout = it->second.layout;
            }
            srcUnion |= rec.srcStage;

            LastTouch& e    = tables.textures[rec.key];
            e.access        = VK_ACCESS_2_NONE;
            e.stage         = VK_PIPELINE_STAGE_2_NONE;
            e.layout        = rec.dstLayout;
            e.restingLayout = rec.restingLayout;
            e.aspect        = rec.aspect;
            e.fromBarrier   = true;
        }

        for (auto& rec : barrier->buffers) {
            auto it = tables.buffers.find(rec.buffer);
            if (it == tables.buffers.end()) {
                rec.srcAccess = VK_ACCESS_2_NONE;
                rec.srcStage  = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
            } else if (it->second.fromBarrier) {
                rec.srcAccess = VK_ACCESS_2_NONE;
                rec.srcStage  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            } else {
                rec.srcAccess = it->second.access;
                rec.srcStage  = it->second.stage;
            }
            srcUnion |= rec.srcStage;

            LastTouch& e  = tables.buffers[rec.buffer];
            e.access      = VK_ACCESS_2_NONE;
            e.stage       = VK_PIPELINE_STAGE_2_NONE;
            e.fromBarrier = true;
        }

        barrier->srcStage = unionOrDefault(srcUnion, VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);
    }

    return tables;
}

void resolveBarrierDestinations(std::vector<Command>& commands) {
    TouchTables tables;

    for (auto cit = commands.rbegin(); cit != commands.rend(); ++cit) {
        auto* barrier = std::get_if<PipelineBarrier>(&*cit);
        if (!barrier) {
            recordTouches(tables, *cit);
            continue;
        }

        VkPipelineStageFlags2 dstUnion = VK_PIPELINE_STAGE_2_NONE;

        for (auto& rec : barrier->textures) {
            auto it = tables.textures.find(rec.key);
            if (it == tables.textures.end()) {
                rec.dstAccess = VK_ACCESS_2_NONE;
                rec.dstStage  = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
            } else if (it->second.fromBarrier) {
                rec.dstAccess = VK_ACCESS_2_NONE;
                rec.dstStage  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            } else {
                rec.dstAccess = it->second.access;
                rec.dstStage  = it->second.stage;
                rec.dstLayout = it->second.layout;
            }
            dstUnion |= rec.dstStage;

            LastTouch& e    = tables.textures[rec.key];
            e.access        = VK_ACCESS_2_NONE;
            e.stage         = VK_PIPELINE_STAGE_2_NONE;
            e.layout        = rec.srcLayout;
            e.restingLayout = rec.restingLayout;
            e.aspect        = rec.aspect;
            e.fromBarrier   = true;
        }

        for (auto& rec : barrier->buffers) {
            auto it = tables.buffers.find(rec.buffer);
            if (it == tables.buffers.end()) {
                rec.dstAccess = VK_ACCESS_2_NONE;
                rec.dstStage  = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
            } else if (it->second.fromBarrier) {
                rec.dstAccess = VK_ACCESS_2_NONE;
                rec.dstStage  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            } else {
                rec.dstAccess = it->second.access;
                rec.dstStage  = it->second.stage;
            }
            dstUnion |= rec.dstStage;

            LastTouch& e  = tables.buffers[rec.buffer];
            e.access      = VK_ACCESS_2_NONE;
            e.stage       = VK_PIPELINE_STAGE_2_NONE;
            e.fromBarrier = true;
        }

        barrier->dstStage = unionOrDefault(dstUnion, VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);
    }
}

std::optional<PipelineBarrier> buildRestoreBarrier(const TouchTables& finalState) {
    PipelineBarrier restore;
    restore.srcStage = VK_PIPELINE_STAGE_2_NONE;

    for (const auto& [key, touch] : finalState.textures) {
        if (touch.layout == touch.restingLayout) continue;

        TextureAccess rec;
        rec.key           = key;
        rec.aspect        = touch.aspect;
        rec.restingLayout = touch.restingLayout;
        rec.srcLayout     = touch.layout;
        rec.dstLayout     = touch.restingLayout;
        rec.srcAccess     = touch.fromBarrier ? VK_ACCESS_2_NONE : touch.access;
        rec.srcStage      = touch.fromBarrier ? VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT : touch.stage;
        rec.dstAccess     = VK_ACCESS_2_NONE;
        rec.dstStage      = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
        restore.srcStage |= rec.srcStage;
        restore.textures.push_back(rec);
    }

    if (restore.textures.empty()) return std::nullopt;

    // Hash order is not stable across runs; keep the emitted list deterministic.
    std::sort(restore.textures.begin(), restore.textures.end(),
              [](const TextureAccess& a, const TextureAccess& b) {
                  if (a.key.image != b.key.image)
                      return std::less<VkImage>{}(a.key.image, b.key.image);
                  if (a.key.mip != b.key.mip) return a.key.mip < b.key.mip;
                  return a.key.layer < b.key.layer;
              });

    restore.dstStage = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
    return restore;
}

Result<void> validateCommands(const std::vector<Command>& commands) {
    struct Tracked {
        VkImageLayout  layout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkAccessFlags2 access = VK_ACCESS_2_NONE;
    };
    std::unordered_map<SubresourceKey, Tracked, SubresourceKeyHash> textures;
    std::unordered_map<VkBuffer, VkAccessFlags2>                    buffers;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const Command& command = commands[i];

        if (const auto* barrier = std::get_if<PipelineBarrier>(&command)) {
            for (const auto& rec : barrier->textures) {
                if (rec.dstLayout == VK_IMAGE_LAYOUT_UNDEFINED ||
                    rec.dstLayout == VK_IMAGE_LAYOUT_PREINITIALIZED) {
                    return Error{FormatOp, 0,
                                 commandLabel(i, command) + " moves " +
                                 detail::describe(rec.key) + " into " +
                                 detail::layoutName(rec.dstLayout)};
                }
            }
            for (const auto& change : layoutChanges(command))
                textures[change.key] = {change.layout, VK_ACCESS_2_NONE};
            for (const auto& rec : barrier->buffers)
                buffers[rec.buffer] = VK_ACCESS_2_NONE;
            continue;
        }

        auto touches = touchedTextures(command);

        for (std::size_t a = 0; a < touches.size(); ++a) {
            for (std::size_t b = a + 1; b < touches.size(); ++b) {
                if (touches[a].key == touches[b].key) {
                    return Error{FormatOp, 0,
                                 commandLabel(i, command) + " uses " +
                                 detail::describe(touches[a].key) + " in two layouts (" +
                                 detail::layoutName(touches[a].layout) + " and " +
                                 detail::layoutName(touches[b].layout) + ")"};
                }
            }
        }

        for (const auto& t : touches) {
            auto it = textures.find(t.key);
            VkImageLayout  current = it != textures.end() ? it->second.layout : t.restingLayout;
            VkAccessFlags2 prior   = it != textures.end() ? it->second.access : VK_ACCESS_2_NONE;

            if (current != t.layout) {
                return Error{FormatOp, 0,
                             commandLabel(i, command) + " needs " +
                             detail::describe(t.key) + " in " + detail::layoutName(t.layout) +
                             " but it is in " + detail::layoutName(current) +
                             " with no barrier in between"};
            }
            if (hasHazard(prior, t.access)) {
                std::string priorBits, nextBits;
                detail::appendAccessBits(priorBits, prior);
                detail::appendAccessBits(nextBits, t.access);
                return Error{FormatOp, 0,
                             commandLabel(i, command) + " accesses " +
                             detail::describe(t.key) + " (" + nextBits +
                             ") after " + priorBits + " with no barrier in between"};
            }
        }

        for (const auto& b : touchedBuffers(command)) {
            auto it = buffers.find(b.buffer);
            VkAccessFlags2 prior = it != buffers.end() ? it->second : VK_ACCESS_2_NONE;
            if (hasHazard(prior, b.access)) {
                std::string priorBits, nextBits;
                detail::appendAccessBits(priorBits, prior);
                detail::appendAccessBits(nextBits, b.access);
                return Error{FormatOp, 0,
                             commandLabel(i, command) + " accesses " +
                             detail::describe(b.buffer) + " (" + nextBits +
                             ") after " + priorBits + " with no barrier in between"};
            }
        }

        for (const auto& t : touches) {
            Tracked& tracked = textures[t.key];
            tracked.layout  = t.layout;
            tracked.access |= t.access;
        }
        for (const auto& b : touchedBuffers(command))
            buffers[b.buffer] |= b.access;
    }

    return {};
}

PipelineBarrier StubPlanner::plan(const Command& command) {
    PipelineBarrier stub;

    if (const auto* barrier = std::get_if<PipelineBarrier>(&command)) {
        for (const auto& change : layoutChanges(command))
            textures_[change.key] = {change.layout, VK_ACCESS_2_NONE};
        for (const auto& rec : barrier->buffers)
            buffers_[rec.buffer] = VK_ACCESS_2_NONE;
        return stub;
    }

    for (const auto& t : touchedTextures(command)) {
        auto [it, inserted] = textures_.try_emplace(t.key, Running{t.restingLayout, VK_ACCESS_2_NONE});
        Running& running = it->second;

        if (running.layout == t.layout && !hasHazard(running.access, t.access)) {
            running.access |= t.access;
            continue;
        }

        TextureAccess rec;
        rec.key           = t.key;
        rec.aspect        = t.aspect;
        rec.restingLayout = t.restingLayout;
        rec.srcLayout     = t.restingLayout;
        rec.dstLayout     = t.layout;
        rec.dstAccess     = t.access;
        stub.textures.push_back(rec);

        running.layout = t.layout;
        running.access = t.access;
    }

    for (const auto& b : touchedBuffers(command)) {
        VkAccessFlags2& running = buffers_[b.buffer];
        if (!hasHazard(running, b.access)) {
            running |= b.access;
            continue;
        }

        BufferAccess rec;
        rec.buffer    = b.buffer;
        rec.dstAccess = b.access;
        stub.buffers.push_back(rec);

        running = b.access;
    }

    return stub;
}

VkImageLayout StubPlanner::currentLayout(const SubresourceKey& key, VkImageLayout resting) const {
    auto it = textures_.find(key);
    return it != textures_.end() ? it->second.layout : resting;
}

void StubPlanner::reset() {
    textures_.clear();
    buffers_.clear();
}

void CommandList::append(Command command) {
    if (hasRestore_) {
        commands_.pop_back();
        hasRestore_ = false;
    }
    formatted_ = false;
    commands_.push_back(std::move(command));
}

Result<void> CommandList::format() {
    if (formatted_) return {};

    auto valid = validateCommands(commands_);
    if (!valid.ok()) return valid;

    TouchTables finalState = resolveBarrierSources(commands_);
    resolveBarrierDestinations(commands_);

    if (auto restore = buildRestoreBarrier(finalState)) {
        commands_.push_back(std::move(*restore));
        hasRestore_ = true;
    }

    formatted_ = true;
    return {};
}

void CommandList::clear() {
    commands_.clear();
    formatted_  = false;
    hasRestore_ = false;
}

} // namespace vkenc
