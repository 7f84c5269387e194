#include <vkenc/encoder/command.hpp>

#include <algorithm>
#include <utility>

namespace vkenc {

namespace {

// Helper for std::visit over a closed set of lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Accumulates touches, merging repeats of a subresource in the same layout.
class TextureTouchSet {
public:
    void add(const TextureSlice& slice, const SubresourceRange& range, VkImageLayout layout,
             VkAccessFlags2 access, VkPipelineStageFlags2 stage) {
        range.forEach([&](std::uint32_t mip, std::uint32_t layer) {
            SubresourceKey key = slice.key(mip, layer);
            for (auto& t : touches_) {
                if (t.key == key && t.layout == layout) {
                    t.access |= access;
                    t.stage  |= stage;
                    return;
                }
            }
            touches_.push_back({key, slice.aspect, layout, slice.restingLayout, access, stage});
        });
    }

    // Whole range of the slice.
    void add(const TextureSlice& slice, VkImageLayout layout,
             VkAccessFlags2 access, VkPipelineStageFlags2 stage) {
        add(slice, slice.range, layout, access, stage);
    }

    // Copies and blits address only the base mip of the slice.
    void addBaseMip(const TextureSlice& slice, VkImageLayout layout,
                    VkAccessFlags2 access, VkPipelineStageFlags2 stage) {
        SubresourceRange r = slice.range;
        r.levelCount = 1;
        add(slice, r, layout, access, stage);
    }

    [[nodiscard]] std::vector<TextureTouch> take() { return std::move(touches_); }

private:
    std::vector<TextureTouch> touches_;
};

class BufferTouchSet {
public:
    void add(VkBuffer buffer, VkAccessFlags2 access, VkPipelineStageFlags2 stage) {
        for (auto& t : touches_) {
            if (t.buffer == buffer) {
                t.access |= access;
                t.stage  |= stage;
                return;
            }
        }
        touches_.push_back({buffer, access, stage});
    }

    [[nodiscard]] std::vector<BufferTouch> take() { return std::move(touches_); }

private:
    std::vector<BufferTouch> touches_;
};

void addDescriptorTouches(const BindDescriptorSet& bind, VkPipelineStageFlags2 passStages,
                          TextureTouchSet* textures, BufferTouchSet* buffers) {
    if (textures) {
        for (const auto& use : bind.textures) {
            VkPipelineStageFlags2 stage = use.stage != VK_PIPELINE_STAGE_2_NONE ? use.stage : passStages;
            textures->add(use.texture, use.layout, use.access, stage);
        }
    }
    if (buffers) {
        for (const auto& use : bind.buffers) {
            VkPipelineStageFlags2 stage = use.stage != VK_PIPELINE_STAGE_2_NONE ? use.stage : passStages;
            buffers->add(use.buffer.buffer, use.access, stage);
        }
    }
}

constexpr VkAccessFlags2 ColorAttachmentAccess =
    VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;
constexpr VkAccessFlags2 DepthAttachmentAccess =
    VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
constexpr VkPipelineStageFlags2 DepthTestStages =
    VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;

} // namespace

Attachment Attachment::color(const TextureSlice& texture, VkAttachmentLoadOp loadOp,
                             VkClearColorValue clearColor) {
    Attachment a;
    a.texture     = texture;
    a.layout      = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    a.loadOp      = loadOp;
    a.storeOp     = VK_ATTACHMENT_STORE_OP_STORE;
    a.clear.color = clearColor;
    return a;
}

Attachment Attachment::depth(const TextureSlice& texture, VkAttachmentLoadOp loadOp,
                             float clearDepth) {
    Attachment a;
    a.texture = texture;
    // Valid for depth-only formats too, without separateDepthStencilLayouts.
    a.layout  = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    a.loadOp  = loadOp;
    a.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    a.clear.depthStencil = {clearDepth, 0};
    return a;
}

TextureUse TextureUse::sampled(const TextureSlice& texture, VkPipelineStageFlags2 stage) {
    return {texture, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
            VK_ACCESS_2_SHADER_SAMPLED_READ_BIT, stage};
}

TextureUse TextureUse::storage(const TextureSlice& texture, bool writes,
                               VkPipelineStageFlags2 stage) {
    VkAccessFlags2 access = VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    if (writes) access |= VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    return {texture, VK_IMAGE_LAYOUT_GENERAL, access, stage};
}

BufferUse BufferUse::uniform(const BufferSlice& buffer, VkPipelineStageFlags2 stage) {
    return {buffer, VK_ACCESS_2_UNIFORM_READ_BIT, stage};
}

BufferUse BufferUse::storage(const BufferSlice& buffer, bool writes, VkPipelineStageFlags2 stage) {
    VkAccessFlags2 access = VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    if (writes) access |= VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    return {buffer, access, stage};
}

VkExtent2D GraphicsPass::renderArea() const {
    VkExtent2D area{UINT32_MAX, UINT32_MAX};
    auto shrink = [&](const Attachment& a) {
        VkExtent3D e = a.texture.mipExtent(a.texture.range.baseMipLevel);
        area.width  = std::min(area.width, e.width);
        area.height = std::min(area.height, e.height);
    };
    for (const auto& a : colors) shrink(a);
    for (const auto& a : resolves) shrink(a);
    if (depth) shrink(*depth);
    if (area.width == UINT32_MAX) return {0, 0};
    return area;
}

std::vector<TextureTouch> touchedTextures(const Command& command) {
    TextureTouchSet set;
    std::visit(Overloaded{
        [&](const PipelineBarrier&) {},
        [&](const UpdateBuffer&) {},
        [&](const ClearTexture& c) {
            set.add(c.texture, c.layout, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                    VK_PIPELINE_STAGE_2_CLEAR_BIT);
        },
        [&](const BlitTextures& c) {
            set.addBaseMip(c.src, c.srcLayout, VK_ACCESS_2_TRANSFER_READ_BIT,
                           VK_PIPELINE_STAGE_2_BLIT_BIT);
            set.addBaseMip(c.dst, c.dstLayout, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_BLIT_BIT);
        },
        [&](const ResolveTextures& c) {
            set.add(c.src, c.srcLayout, VK_ACCESS_2_TRANSFER_READ_BIT,
                    VK_PIPELINE_STAGE_2_RESOLVE_BIT);
            set.add(c.dst, c.dstLayout, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                    VK_PIPELINE_STAGE_2_RESOLVE_BIT);
        },
        [&](const CopyBufferToBuffer&) {},
        [&](const CopyTextureToBuffer& c) {
            set.addBaseMip(c.src, c.srcLayout, VK_ACCESS_2_TRANSFER_READ_BIT,
                           VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const CopyBufferToTexture& c) {
            set.addBaseMip(c.dst, c.dstLayout, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const CopyTextureToTexture& c) {
            set.addBaseMip(c.src, c.srcLayout, VK_ACCESS_2_TRANSFER_READ_BIT,
                           VK_PIPELINE_STAGE_2_COPY_BIT);
            set.addBaseMip(c.dst, c.dstLayout, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const GraphicsPass& p) {
            for (const auto& a : p.colors)
                set.add(a.texture, a.layout, ColorAttachmentAccess,
                        VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
            for (const auto& a : p.resolves)
                set.add(a.texture, a.layout, VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
                        VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
            if (p.depth)
                set.add(p.depth->texture, p.depth->layout, DepthAttachmentAccess,
                        DepthTestStages);
            for (const auto& inner : p.commands) {
                if (const auto* bind = std::get_if<BindDescriptorSet>(&inner))
                    addDescriptorTouches(*bind, GraphicsShaderStages, &set, nullptr);
            }
        },
        [&](const ComputePass& p) {
            for (const auto& inner : p.commands) {
                if (const auto* bind = std::get_if<BindDescriptorSet>(&inner))
                    addDescriptorTouches(*bind, ComputeShaderStages, &set, nullptr);
            }
        },
        [&](const WriteTimestamp&) {},
        [&](const ResetQueryPool&) {},
    }, command);
    return set.take();
}

std::vector<BufferTouch> touchedBuffers(const Command& command) {
    BufferTouchSet set;
    std::visit(Overloaded{
        [&](const PipelineBarrier&) {},
        [&](const UpdateBuffer& c) {
            set.add(c.dst.buffer, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                    VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT);
        },
        [&](const ClearTexture&) {},
        [&](const BlitTextures&) {},
        [&](const ResolveTextures&) {},
        [&](const CopyBufferToBuffer& c) {
            set.add(c.src.buffer, VK_ACCESS_2_TRANSFER_READ_BIT, VK_PIPELINE_STAGE_2_COPY_BIT);
            set.add(c.dst.buffer, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const CopyTextureToBuffer& c) {
            set.add(c.dst.buffer, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const CopyBufferToTexture& c) {
            set.add(c.src.buffer, VK_ACCESS_2_TRANSFER_READ_BIT, VK_PIPELINE_STAGE_2_COPY_BIT);
        },
        [&](const CopyTextureToTexture&) {},
        [&](const GraphicsPass& p) {
            for (const auto& inner : p.commands) {
                std::visit(Overloaded{
                    [&](const BindDescriptorSet& bind) {
                        addDescriptorTouches(bind, GraphicsShaderStages, nullptr, &set);
                    },
                    [&](const BindVertexBuffers& bind) {
                        for (const auto& b : bind.buffers)
                            set.add(b.buffer, VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT,
                                    VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT);
                    },
                    [&](const BindIndexBuffer& bind) {
                        set.add(bind.buffer.buffer, VK_ACCESS_2_INDEX_READ_BIT,
                                VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT);
                    },
                    [&](const auto&) {},
                }, inner);
            }
        },
        [&](const ComputePass& p) {
            for (const auto& inner : p.commands) {
                if (const auto* bind = std::get_if<BindDescriptorSet>(&inner))
                    addDescriptorTouches(*bind, ComputeShaderStages, nullptr, &set);
            }
        },
        [&](const WriteTimestamp&) {},
        [&](const ResetQueryPool&) {},
    }, command);
    return set.take();
}

VkPipelineStageFlags2 commandStage(const Command& command) {
    if (const auto* b = std::get_if<PipelineBarrier>(&command))
        return b->srcStage | b->dstStage;
    if (const auto* t = std::get_if<WriteTimestamp>(&command))
        return t->stage;

    VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE;
    for (const auto& t : touchedTextures(command)) stage |= t.stage;
    for (const auto& b : touchedBuffers(command)) stage |= b.stage;

    // Passes run their shaders even when no resource is declared.
    if (std::holds_alternative<GraphicsPass>(command))
        stage |= GraphicsShaderStages | VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
    else if (std::holds_alternative<ComputePass>(command))
        stage |= ComputeShaderStages;
    return stage;
}

std::vector<LayoutChange> layoutChanges(const Command& command) {
    std::vector<LayoutChange> changes;
    if (const auto* b = std::get_if<PipelineBarrier>(&command)) {
        changes.reserve(b->textures.size());
        for (const auto& rec : b->textures)
            changes.push_back({rec.key, rec.dstLayout});
    }
    return changes;
}

bool isBarrier(const Command& command) {
    return std::holds_alternative<PipelineBarrier>(command);
}

const char* commandName(const Command& command) {
    return std::visit(Overloaded{
        [](const PipelineBarrier&) { return "PipelineBarrier"; },
        [](const UpdateBuffer&) { return "UpdateBuffer"; },
        [](const ClearTexture&) { return "ClearTexture"; },
        [](const BlitTextures&) { return "BlitTextures"; },
        [](const ResolveTextures&) { return "ResolveTextures"; },
        [](const CopyBufferToBuffer&) { return "CopyBufferToBuffer"; },
        [](const CopyTextureToBuffer&) { return "CopyTextureToBuffer"; },
        [](const CopyBufferToTexture&) { return "CopyBufferToTexture"; },
        [](const CopyTextureToTexture&) { return "CopyTextureToTexture"; },
        [](const GraphicsPass&) { return "GraphicsPass"; },
        [](const ComputePass&) { return "ComputePass"; },
        [](const WriteTimestamp&) { return "WriteTimestamp"; },
        [](const ResetQueryPool&) { return "ResetQueryPool"; },
    }, command);
}

} // namespace vkenc
