#include <vkenc/encoder/command_encoder.hpp>

#include "names.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

namespace vkenc {

namespace detail {

const char* layoutName(VkImageLayout layout) {
    switch (layout) {
    case VK_IMAGE_LAYOUT_UNDEFINED:
        return "UNDEFINED";
    case VK_IMAGE_LAYOUT_GENERAL:
        return "GENERAL";
    case VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL:
        return "COLOR_ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL:
        return "DEPTH_STENCIL_ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL:
        return "DEPTH_STENCIL_READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL:
        return "SHADER_READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL:
        return "TRANSFER_SRC_OPTIMAL";
    case VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL:
        return "TRANSFER_DST_OPTIMAL";
    case VK_IMAGE_LAYOUT_PREINITIALIZED:
        return "PREINITIALIZED";
    case VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL:
        return "DEPTH_ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_DEPTH_READ_ONLY_OPTIMAL:
        return "DEPTH_READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_READ_ONLY_OPTIMAL:
        return "READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_ATTACHMENT_OPTIMAL:
        return "ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_PRESENT_SRC_KHR:
        return "PRESENT_SRC_KHR";
    default:
        return "(other)";
    }
}

void appendStageBits(std::string& out, VkPipelineStageFlags2 flags) {
    if (flags == VK_PIPELINE_STAGE_2_NONE) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkPipelineStageFlags2 bit, const char* name) {
        if (flags & bit) {
            if (!first)
                out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT, "TOP_OF_PIPE");
    add(VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT, "DRAW_INDIRECT");
    add(VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT, "INDEX_INPUT");
    add(VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT, "VERTEX_ATTRIBUTE_INPUT");
    add(VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT, "VERTEX_SHADER");
    add(VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT, "FRAGMENT_SHADER");
    add(VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT, "EARLY_FRAG");
    add(VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT, "LATE_FRAG");
    add(VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, "COLOR_ATTACHMENT_OUTPUT");
    add(VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, "COMPUTE_SHADER");
    add(VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT, "ALL_TRANSFER");
    add(VK_PIPELINE_STAGE_2_COPY_BIT, "COPY");
    add(VK_PIPELINE_STAGE_2_BLIT_BIT, "BLIT");
    add(VK_PIPELINE_STAGE_2_RESOLVE_BIT, "RESOLVE");
    add(VK_PIPELINE_STAGE_2_CLEAR_BIT, "CLEAR");
    add(VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT, "BOTTOM_OF_PIPE");
    add(VK_PIPELINE_STAGE_2_ALL_GRAPHICS_BIT, "ALL_GRAPHICS");
    add(VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, "ALL_COMMANDS");

    if (first) {
        // Unrecognized bits.
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx64, static_cast<std::uint64_t>(flags));
        out += buf;
    }
}

void appendAccessBits(std::string& out, VkAccessFlags2 flags) {
    if (flags == VK_ACCESS_2_NONE) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkAccessFlags2 bit, const char* name) {
        if (flags & bit) {
            if (!first)
                out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT, "INDIRECT_READ");
    add(VK_ACCESS_2_INDEX_READ_BIT, "INDEX_READ");
    add(VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT, "VERTEX_READ");
    add(VK_ACCESS_2_UNIFORM_READ_BIT, "UNIFORM_READ");
    add(VK_ACCESS_2_INPUT_ATTACHMENT_READ_BIT, "INPUT_ATTACHMENT_READ");
    add(VK_ACCESS_2_SHADER_READ_BIT, "SHADER_READ");
    add(VK_ACCESS_2_SHADER_WRITE_BIT, "SHADER_WRITE");
    add(VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT, "COLOR_ATTACHMENT_READ");
    add(VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT, "COLOR_ATTACHMENT_WRITE");
    add(VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT, "DEPTH_STENCIL_READ");
    add(VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT, "DEPTH_STENCIL_WRITE");
    add(VK_ACCESS_2_TRANSFER_READ_BIT, "TRANSFER_READ");
    add(VK_ACCESS_2_TRANSFER_WRITE_BIT, "TRANSFER_WRITE");
    add(VK_ACCESS_2_HOST_READ_BIT, "HOST_READ");
    add(VK_ACCESS_2_HOST_WRITE_BIT, "HOST_WRITE");
    add(VK_ACCESS_2_MEMORY_READ_BIT, "MEMORY_READ");
    add(VK_ACCESS_2_MEMORY_WRITE_BIT, "MEMORY_WRITE");
    add(VK_ACCESS_2_SHADER_SAMPLED_READ_BIT, "SHADER_SAMPLED_READ");
    add(VK_ACCESS_2_SHADER_STORAGE_READ_BIT, "SHADER_STORAGE_READ");
    add(VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT, "SHADER_STORAGE_WRITE");

    if (first) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx64, static_cast<std::uint64_t>(flags));
        out += buf;
    }
}

namespace {

template <typename Handle>
std::uint64_t handleBits(Handle h) {
    std::uint64_t bits{};
    std::memcpy(&bits, &h, sizeof(h));
    return bits;
}

} // namespace

std::string describe(const SubresourceKey& key) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "image 0x%" PRIx64 " mip %u layer %u",
                  handleBits(key.image), key.mip, key.layer);
    return buf;
}

std::string describe(VkBuffer buffer) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "buffer 0x%" PRIx64, handleBits(buffer));
    return buf;
}

} // namespace detail

namespace {

void dumpBarrier(std::FILE* out, const PipelineBarrier& b) {
    std::string srcStage, dstStage;
    detail::appendStageBits(srcStage, b.srcStage);
    detail::appendStageBits(dstStage, b.dstStage);
    std::fprintf(out, "        %s -> %s\n", srcStage.c_str(), dstStage.c_str());

    for (const auto& rec : b.textures) {
        std::string srcStageBits, srcAccess, dstStageBits, dstAccess;
        detail::appendStageBits(srcStageBits, rec.srcStage);
        detail::appendStageBits(dstStageBits, rec.dstStage);
        detail::appendAccessBits(dstAccess, rec.dstAccess);
        detail::appendAccessBits(srcAccess, rec.srcAccess);

        std::fprintf(out,
                     "        IMG %s: %s -> %s\n"
                     "            src: %s / %s\n"
                     "            dst: %s / %s\n",
                     detail::describe(rec.key).c_str(), detail::layoutName(rec.srcLayout),
                     detail::layoutName(rec.dstLayout), srcStageBits.c_str(), srcAccess.c_str(),
                     dstStageBits.c_str(), dstAccess.c_str());
    }

    for (const auto& rec : b.buffers) {
        std::string srcStageBits, srcAccess, dstStageBits, dstAccess;
        detail::appendStageBits(srcStageBits, rec.srcStage);
        detail::appendStageBits(dstStageBits, rec.dstStage);
        detail::appendAccessBits(dstAccess, rec.dstAccess);
        detail::appendAccessBits(srcAccess, rec.srcAccess);

        std::fprintf(out,
                     "        BUF %s\n"
                     "            src: %s / %s\n"
                     "            dst: %s / %s\n",
                     detail::describe(rec.buffer).c_str(), srcStageBits.c_str(),
                     srcAccess.c_str(), dstStageBits.c_str(), dstAccess.c_str());
    }
}

} // namespace

void CommandEncoder::dumpLog(std::FILE* out) const {
    const auto& cmds = list_.commands();

    std::fprintf(out, "[vkenc] %zu commands (%s)\n", cmds.size(),
                 list_.formatted() ? "formatted" : "not formatted");

    std::size_t barrierCount = 0;
    std::size_t recordCount  = 0;

    for (std::size_t i = 0; i < cmds.size(); ++i) {
        const Command& cmd = cmds[i];
        bool restore = list_.hasRestoreBarrier() && i + 1 == cmds.size();
        std::fprintf(out, "  [%zu] %s%s\n", i, commandName(cmd), restore ? " (restore)" : "");

        if (const auto* b = std::get_if<PipelineBarrier>(&cmd)) {
            ++barrierCount;
            recordCount += b->textures.size() + b->buffers.size();
            dumpBarrier(out, *b);
            continue;
        }

        for (const auto& t : touchedTextures(cmd)) {
            std::string access;
            detail::appendAccessBits(access, t.access);
            std::fprintf(out, "        %s in %s, %s\n", detail::describe(t.key).c_str(),
                         detail::layoutName(t.layout), access.c_str());
        }
        for (const auto& b : touchedBuffers(cmd)) {
            std::string access;
            detail::appendAccessBits(access, b.access);
            std::fprintf(out, "        %s, %s\n", detail::describe(b.buffer).c_str(),
                         access.c_str());
        }
    }

    std::fprintf(out, "[vkenc] %zu barriers, %zu records\n", barrierCount, recordCount);
}

} // namespace vkenc
