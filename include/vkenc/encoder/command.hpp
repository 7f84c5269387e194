#pragma once

#include <vkenc/resource.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace vkenc {

// One (mip, layer) a command touches, what layout it needs while executing,
// and the access/stage of that touch.
struct TextureTouch {
    SubresourceKey        key;
    VkImageAspectFlags    aspect        = VK_IMAGE_ASPECT_COLOR_BIT;
    VkImageLayout         layout        = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageLayout         restingLayout = VK_IMAGE_LAYOUT_GENERAL;
    VkAccessFlags2        access        = VK_ACCESS_2_NONE;
    VkPipelineStageFlags2 stage         = VK_PIPELINE_STAGE_2_NONE;
};

struct BufferTouch {
    VkBuffer              buffer = VK_NULL_HANDLE;
    VkAccessFlags2        access = VK_ACCESS_2_NONE;
    VkPipelineStageFlags2 stage  = VK_PIPELINE_STAGE_2_NONE;
};

// A layout a barrier declares a subresource to transition into.
struct LayoutChange {
    SubresourceKey key;
    VkImageLayout  layout = VK_IMAGE_LAYOUT_UNDEFINED;
};

// Barrier record for one buffer. Always covers the whole buffer.
// Stages start as VK_PIPELINE_STAGE_2_NONE placeholders; format() fills them.
struct BufferAccess {
    VkBuffer              buffer    = VK_NULL_HANDLE;
    VkAccessFlags2        srcAccess = VK_ACCESS_2_NONE;
    VkAccessFlags2        dstAccess = VK_ACCESS_2_NONE;
    VkPipelineStageFlags2 srcStage  = VK_PIPELINE_STAGE_2_NONE;
    VkPipelineStageFlags2 dstStage  = VK_PIPELINE_STAGE_2_NONE;
};

// Barrier record for one (mip, layer). srcLayout starts as the resting
// layout and srcAccess as empty; dstLayout/dstAccess are known when the
// stub is created.
struct TextureAccess {
    SubresourceKey        key;
    VkImageAspectFlags    aspect        = VK_IMAGE_ASPECT_COLOR_BIT;
    VkImageLayout         restingLayout = VK_IMAGE_LAYOUT_GENERAL;
    VkAccessFlags2        srcAccess     = VK_ACCESS_2_NONE;
    VkAccessFlags2        dstAccess     = VK_ACCESS_2_NONE;
    VkImageLayout         srcLayout     = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageLayout         dstLayout     = VK_IMAGE_LAYOUT_UNDEFINED;
    VkPipelineStageFlags2 srcStage      = VK_PIPELINE_STAGE_2_NONE;
    VkPipelineStageFlags2 dstStage      = VK_PIPELINE_STAGE_2_NONE;
};

struct PipelineBarrier {
    VkPipelineStageFlags2      srcStage = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
    VkPipelineStageFlags2      dstStage = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
    std::vector<BufferAccess>  buffers;
    std::vector<TextureAccess> textures;

    [[nodiscard]] bool empty() const { return buffers.empty() && textures.empty(); }
};

struct UpdateBuffer {
    BufferSlice               dst;
    std::vector<std::uint8_t> data;
};

struct ClearTexture {
    TextureSlice  texture;
    VkImageLayout layout = VK_IMAGE_LAYOUT_GENERAL;
    VkClearValue  value{};
};

struct BlitTextures {
    TextureSlice  src;
    VkImageLayout srcLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    TextureSlice  dst;
    VkImageLayout dstLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
    VkFilter      filter    = VK_FILTER_LINEAR;
};

struct ResolveTextures {
    TextureSlice  src;
    VkImageLayout srcLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    TextureSlice  dst;
    VkImageLayout dstLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
};

struct CopyBufferToBuffer {
    BufferSlice src;
    BufferSlice dst;
};

struct CopyTextureToBuffer {
    TextureSlice  src;
    VkImageLayout srcLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    BufferSlice   dst;
};

struct CopyBufferToTexture {
    BufferSlice   src;
    TextureSlice  dst;
    VkImageLayout dstLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
};

struct CopyTextureToTexture {
    TextureSlice  src;
    VkImageLayout srcLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    TextureSlice  dst;
    VkImageLayout dstLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
};

// Resources a bound descriptor set refers to. Descriptor layouts come from
// outside the encoder, so the caller declares what the set reads or writes.
// stage == NONE means "the stages of the enclosing pass".
struct TextureUse {
    TextureSlice          texture;
    VkImageLayout         layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    VkAccessFlags2        access = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT;
    VkPipelineStageFlags2 stage  = VK_PIPELINE_STAGE_2_NONE;

    // Sampled in SHADER_READ_ONLY_OPTIMAL.
    [[nodiscard]] static TextureUse sampled(const TextureSlice& texture,
                                            VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE);
    // Storage image in GENERAL. writes=false declares a read-only binding.
    [[nodiscard]] static TextureUse storage(const TextureSlice& texture, bool writes = true,
                                            VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE);
};

struct BufferUse {
    BufferSlice           buffer;
    VkAccessFlags2        access = VK_ACCESS_2_UNIFORM_READ_BIT;
    VkPipelineStageFlags2 stage  = VK_PIPELINE_STAGE_2_NONE;

    [[nodiscard]] static BufferUse uniform(const BufferSlice& buffer,
                                           VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE);
    [[nodiscard]] static BufferUse storage(const BufferSlice& buffer, bool writes = true,
                                           VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE);
};

struct BindDescriptorSet {
    std::uint32_t           index = 0;
    VkDescriptorSet         set   = VK_NULL_HANDLE;
    std::vector<TextureUse> textures;
    std::vector<BufferUse>  buffers;
};

struct PushConstants {
    VkShaderStageFlags        stages = 0;
    std::uint32_t             offset = 0;
    std::vector<std::uint8_t> data;
};

struct BindVertexBuffers {
    std::uint32_t            firstBinding = 0;
    std::vector<BufferSlice> buffers;
};

struct BindIndexBuffer {
    BufferSlice buffer;
    VkIndexType type = VK_INDEX_TYPE_UINT32;
};

struct SetViewport {
    VkViewport viewport{};
};

struct SetScissor {
    VkRect2D scissor{};
};

struct Draw {
    std::uint32_t vertexCount   = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstVertex   = 0;
    std::uint32_t firstInstance = 0;
};

struct DrawIndexed {
    std::uint32_t indexCount    = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstIndex    = 0;
    std::int32_t  vertexOffset  = 0;
    std::uint32_t firstInstance = 0;
};

struct Dispatch {
    std::uint32_t x = 1;
    std::uint32_t y = 1;
    std::uint32_t z = 1;
};

using GraphicsPassCommand = std::variant<BindDescriptorSet, PushConstants, BindVertexBuffers,
                                         BindIndexBuffer, SetViewport, SetScissor, Draw,
                                         DrawIndexed>;

using ComputePassCommand = std::variant<BindDescriptorSet, PushConstants, Dispatch>;

// A dynamic-rendering attachment. The texture slice must carry a view
// covering exactly one mip.
struct Attachment {
    TextureSlice        texture;
    VkImageLayout       layout  = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    VkAttachmentLoadOp  loadOp  = VK_ATTACHMENT_LOAD_OP_LOAD;
    VkAttachmentStoreOp storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    VkClearValue        clear{};

    [[nodiscard]] static Attachment color(const TextureSlice& texture,
                                          VkAttachmentLoadOp loadOp = VK_ATTACHMENT_LOAD_OP_LOAD,
                                          VkClearColorValue clearColor = {});
    [[nodiscard]] static Attachment depth(const TextureSlice& texture,
                                          VkAttachmentLoadOp loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR,
                                          float clearDepth = 1.0f);
};

// resolves is empty or parallel to colors (resolves[i] receives colors[i]).
struct GraphicsPass {
    std::vector<Attachment>          colors;
    std::vector<Attachment>          resolves;
    std::optional<Attachment>        depth;
    VkPipeline                       pipeline = VK_NULL_HANDLE; // null for clear-only passes
    VkPipelineLayout                 layout   = VK_NULL_HANDLE;
    std::vector<GraphicsPassCommand> commands;

    // Smallest extent shared by all attachments.
    [[nodiscard]] VkExtent2D renderArea() const;
};

struct ComputePass {
    VkPipeline                      pipeline = VK_NULL_HANDLE;
    VkPipelineLayout                layout   = VK_NULL_HANDLE;
    std::vector<ComputePassCommand> commands;
};

struct WriteTimestamp {
    VkQueryPool           pool  = VK_NULL_HANDLE;
    std::uint32_t         query = 0;
    VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT;
};

struct ResetQueryPool {
    VkQueryPool   pool  = VK_NULL_HANDLE;
    std::uint32_t first = 0;
    std::uint32_t count = 0;
};

using Command = std::variant<PipelineBarrier, UpdateBuffer, ClearTexture, BlitTextures,
                             ResolveTextures, CopyBufferToBuffer, CopyTextureToBuffer,
                             CopyBufferToTexture, CopyTextureToTexture, GraphicsPass, ComputePass,
                             WriteTimestamp, ResetQueryPool>;

// Footprint queries. Pure: they describe a command, never mutate it.
//
// Touches of the same subresource within one command are merged when they
// agree on the layout. Disagreeing touches are all reported so validation
// can name the conflict.
[[nodiscard]] std::vector<TextureTouch> touchedTextures(const Command& command);
[[nodiscard]] std::vector<BufferTouch>  touchedBuffers(const Command& command);

// Stages at which the command executes.
[[nodiscard]] VkPipelineStageFlags2 commandStage(const Command& command);

// Layouts a barrier transitions subresources into. Empty for other commands.
[[nodiscard]] std::vector<LayoutChange> layoutChanges(const Command& command);

[[nodiscard]] bool isBarrier(const Command& command);
[[nodiscard]] const char* commandName(const Command& command);

// Stages shader-visible resources of a pass are accessed at by default.
inline constexpr VkPipelineStageFlags2 GraphicsShaderStages =
    VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT | VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
inline constexpr VkPipelineStageFlags2 ComputeShaderStages =
    VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;

} // namespace vkenc
