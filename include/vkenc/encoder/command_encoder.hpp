#pragma once

#include <vkenc/capabilities.hpp>
#include <vkenc/encoder/command.hpp>
#include <vkenc/encoder/recorder.hpp>
#include <vkenc/encoder/scheduler.hpp>
#include <vkenc/error.hpp>
#include <vkenc/result.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <utility>
#include <vector>

namespace vkenc {

class Device;
class CommandEncoder;

// Builds one GraphicsPass. The pass is appended to the encoder on end(),
// or when the pass encoder goes out of scope. A pass encoder destroyed by
// an exception is discarded: nothing it recorded reaches the encoder.
//
// Thread safety: thread-confined.
class GraphicsPassEncoder {
public:
    ~GraphicsPassEncoder();
    GraphicsPassEncoder(GraphicsPassEncoder&&) noexcept;
    GraphicsPassEncoder& operator=(GraphicsPassEncoder&&) = delete;
    GraphicsPassEncoder(const GraphicsPassEncoder&) = delete;
    GraphicsPassEncoder& operator=(const GraphicsPassEncoder&) = delete;

    // One pipeline per pass. Not needed for clear-only passes.
    GraphicsPassEncoder& bindPipeline(VkPipeline pipeline, VkPipelineLayout layout);

    // textures/buffers declare what the set refers to, so their accesses
    // are scheduled with the pass.
    GraphicsPassEncoder& bindDescriptorSet(std::uint32_t index, VkDescriptorSet set,
                                           std::vector<TextureUse> textures = {},
                                           std::vector<BufferUse> buffers = {});
    GraphicsPassEncoder& pushConstants(VkShaderStageFlags stages, std::uint32_t offset,
                                       const void* data, std::uint32_t size);
    GraphicsPassEncoder& bindVertexBuffers(std::uint32_t firstBinding,
                                           std::vector<BufferSlice> buffers);
    GraphicsPassEncoder& bindIndexBuffer(const BufferSlice& buffer,
                                         VkIndexType type = VK_INDEX_TYPE_UINT32);

    // The render area covers the smallest attachment by default.
    GraphicsPassEncoder& setViewport(const VkViewport& viewport);
    GraphicsPassEncoder& setScissor(const VkRect2D& scissor);

    GraphicsPassEncoder& draw(std::uint32_t vertexCount, std::uint32_t instanceCount = 1,
                              std::uint32_t firstVertex = 0, std::uint32_t firstInstance = 0);
    GraphicsPassEncoder& drawIndexed(std::uint32_t indexCount, std::uint32_t instanceCount = 1,
                                     std::uint32_t firstIndex = 0, std::int32_t vertexOffset = 0,
                                     std::uint32_t firstInstance = 0);

    void end();

    [[nodiscard]] bool ended() const { return encoder_ == nullptr; }

private:
    friend class CommandEncoder;
    GraphicsPassEncoder(CommandEncoder& encoder, GraphicsPass pass);

    void requireOpen(const char* op) const;
    void declareLayout(const TextureSlice& texture, VkImageLayout layout, const char* op);

    CommandEncoder* encoder_  = nullptr;
    int             uncaught_ = 0;
    GraphicsPass    pass_;
    std::vector<std::pair<SubresourceKey, VkImageLayout>> layouts_;
};

// Builds one ComputePass. Same lifetime rules as GraphicsPassEncoder.
//
// Thread safety: thread-confined.
class ComputePassEncoder {
public:
    ~ComputePassEncoder();
    ComputePassEncoder(ComputePassEncoder&&) noexcept;
    ComputePassEncoder& operator=(ComputePassEncoder&&) = delete;
    ComputePassEncoder(const ComputePassEncoder&) = delete;
    ComputePassEncoder& operator=(const ComputePassEncoder&) = delete;

    ComputePassEncoder& bindDescriptorSet(std::uint32_t index, VkDescriptorSet set,
                                          std::vector<TextureUse> textures = {},
                                          std::vector<BufferUse> buffers = {});
    ComputePassEncoder& pushConstants(std::uint32_t offset, const void* data, std::uint32_t size);
    ComputePassEncoder& dispatch(std::uint32_t x, std::uint32_t y = 1, std::uint32_t z = 1);

    void end();

    [[nodiscard]] bool ended() const { return encoder_ == nullptr; }

private:
    friend class CommandEncoder;
    ComputePassEncoder(CommandEncoder& encoder, ComputePass pass);

    void requireOpen(const char* op) const;

    CommandEncoder* encoder_  = nullptr;
    int             uncaught_ = 0;
    ComputePass     pass_;
    std::vector<std::pair<SubresourceKey, VkImageLayout>> layouts_;
};

// Records a linear list of commands over borrowed textures and buffers and
// places the pipeline barriers between them.
//
// Each append inserts a barrier stub in front of the command when one of
// its subresources needs a new layout or its access conflicts with the
// access since the last barrier. format() fills the stubs' stages and
// accesses from the neighbouring commands and appends one barrier returning
// every texture to its resting layout.
//
// Usage errors (missing usage flags, capability mismatches, bad sizes) are
// reported through throwError at the call site. Device errors come back as
// Result.
//
// Resources are borrowed: every texture and buffer must outlive the
// submission that uses it.
//
// Thread safety: thread-confined.
class CommandEncoder {
public:
    explicit CommandEncoder(QueueCapabilities capabilities = QueueCapabilities::all());
    explicit CommandEncoder(const Device& device);

    // Pass encoders point back at the encoder.
    CommandEncoder(const CommandEncoder&) = delete;
    CommandEncoder& operator=(const CommandEncoder&) = delete;
    CommandEncoder(CommandEncoder&&) = delete;
    CommandEncoder& operator=(CommandEncoder&&) = delete;

    // Payload must be a multiple of 4 bytes and at most 65536 bytes.
    void updateBuffer(const BufferSlice& dst, const void* data, std::size_t bytes);

    void clearTexture(const TextureSlice& texture, const VkClearColorValue& color,
                      VkImageLayout layout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
    void clearDepthStencil(const TextureSlice& texture, float depth, std::uint32_t stencil = 0,
                           VkImageLayout layout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

    // Base mip of each slice, every layer. The whole mip extent is blitted.
    void blitTextures(const TextureSlice& src, const TextureSlice& dst,
                      VkFilter filter = VK_FILTER_LINEAR);
    void resolveTexture(const TextureSlice& src, const TextureSlice& dst);

    void copyBufferToBuffer(const BufferSlice& src, const BufferSlice& dst);
    void copyTextureToBuffer(const TextureSlice& src, const BufferSlice& dst);
    void copyBufferToTexture(const BufferSlice& src, const TextureSlice& dst);
    void copyTextureToTexture(const TextureSlice& src, const TextureSlice& dst);

    // resolves is empty or parallel to colors.
    [[nodiscard]] GraphicsPassEncoder graphicsPass(std::vector<Attachment> colors,
                                                   std::optional<Attachment> depth = std::nullopt,
                                                   std::vector<Attachment> resolves = {});
    [[nodiscard]] ComputePassEncoder computePass(VkPipeline pipeline, VkPipelineLayout layout);

    void writeTimestamp(VkQueryPool pool, std::uint32_t query,
                        VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);
    void resetQueryPool(VkQueryPool pool, std::uint32_t first, std::uint32_t count);

    // Explicit barrier moving every subresource of the slice into `layout`.
    // Later commands see the texture in that layout.
    void transitionTexture(const TextureSlice& texture, VkImageLayout layout);

    // Any command, with stub insertion. The command's slices are range
    // checked but usage flags are not.
    void pushCommand(Command command);

    // Resolve barrier stages and accesses and append the restore barrier.
    // Idempotent until the next append.
    [[nodiscard]] Result<void> format();

    // Format if needed, then begin, replay and end `cmd`.
    [[nodiscard]] Result<void> record(VkCommandBuffer cmd);

    // record() then vkQueueSubmit2 on the device queue.
    [[nodiscard]] Result<void> submit(const Device& device, VkCommandBuffer cmd,
                                      const SubmitSync& sync = {});

    // Drop every command and the tracked layouts. Textures are assumed back
    // in their resting layouts.
    void reset();

    [[nodiscard]] const std::vector<Command>& commands()     const { return list_.commands(); }
    [[nodiscard]] std::size_t                 size()         const { return list_.size(); }
    [[nodiscard]] bool                        formatted()    const { return list_.formatted(); }
    [[nodiscard]] QueueCapabilities           capabilities() const { return caps_; }

    // Layout the texture will be in after the commands appended so far.
    [[nodiscard]] VkImageLayout currentLayout(const TextureSlice& texture,
                                              std::uint32_t mip, std::uint32_t layer) const;

    // Print the command list with barrier records, to stderr by default.
    void dumpLog(std::FILE* out = stderr) const;

private:
    friend class GraphicsPassEncoder;
    friend class ComputePassEncoder;

    void append(Command command);
    void requireCapability(bool has, const char* op, const char* what) const;

    QueueCapabilities caps_;
    StubPlanner       planner_;
    CommandList       list_;
    std::uint32_t     openPasses_ = 0;
};

} // namespace vkenc
