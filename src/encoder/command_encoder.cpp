#include <vkenc/device.hpp>
#include <vkenc/encoder/command_encoder.hpp>

#include "names.hpp"

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <utility>

namespace vkenc {

namespace {

constexpr std::size_t MaxUpdateBytes = 65536;

void require(bool condition, const char* op, const std::string& message) {
    if (!condition) throwError(Error{op, 0, message});
}

std::string extentString(VkExtent3D e) {
    return std::to_string(e.width) + "x" + std::to_string(e.height) + "x" +
           std::to_string(e.depth);
}

void checkTexture(const TextureSlice& t, const char* op, const char* role) {
    require(t.image != VK_NULL_HANDLE, op, std::string(role) + " texture has no image");
    require(isRestingLayoutValid(t.restingLayout), op,
            std::string(role) + " texture rests in " + detail::layoutName(t.restingLayout) +
            "; UNDEFINED and PREINITIALIZED cannot be resting layouts");
    require(t.rangeValid(), op,
            std::string(role) + " range (mips " + std::to_string(t.range.baseMipLevel) + "+" +
            std::to_string(t.range.levelCount) + ", layers " +
            std::to_string(t.range.baseArrayLayer) + "+" + std::to_string(t.range.layerCount) +
            ") is outside the image (" + std::to_string(t.mipLevels) + " mips, " +
            std::to_string(t.arrayLayers) + " layers)");
}

void checkTextureUsage(const TextureSlice& t, VkImageUsageFlags bit, const char* flagName,
                       const char* op, const char* role) {
    require((t.usage & bit) != 0, op,
            std::string(role) + " texture lacks VK_IMAGE_USAGE_" + flagName + "_BIT");
}

void checkBuffer(const BufferSlice& b, const char* op, const char* role) {
    require(b.buffer != VK_NULL_HANDLE, op, std::string(role) + " buffer is null");
    require(b.size > 0, op, std::string(role) + " buffer slice is empty");
}

void checkBufferUsage(const BufferSlice& b, VkBufferUsageFlags bit, const char* flagName,
                      const char* op, const char* role) {
    require((b.usage & bit) != 0, op,
            std::string(role) + " buffer lacks VK_BUFFER_USAGE_" + flagName + "_BIT");
}

// Bytes needed to hold the base mip of every layer of the slice, tightly
// packed. 0 when the texel size is not known.
VkDeviceSize tightBytes(const TextureSlice& t) {
    std::uint32_t texel = bytesPerTexel(t.format);
    if (texel == 0) return 0;
    VkExtent3D e = t.mipExtent(t.range.baseMipLevel);
    return static_cast<VkDeviceSize>(e.width) * e.height * e.depth * texel * t.range.layerCount;
}

void checkCopyAspect(const TextureSlice& t, const char* op, const char* role) {
    require(t.aspect != (VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT), op,
            std::string(role) + " texture has depth and stencil aspects; "
            "copy one aspect at a time");
}

void checkDescriptorUses(const std::vector<TextureUse>& textures,
                         const std::vector<BufferUse>& buffers, const char* op) {
    constexpr VkAccessFlags2 storageBits =
        VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;

    for (const auto& use : textures) {
        checkTexture(use.texture, op, "descriptor");
        require(use.access != VK_ACCESS_2_NONE, op, "descriptor texture declares no access");
        if (use.access & VK_ACCESS_2_SHADER_SAMPLED_READ_BIT)
            checkTextureUsage(use.texture, VK_IMAGE_USAGE_SAMPLED_BIT, "SAMPLED", op, "sampled");
        if (use.access & storageBits)
            checkTextureUsage(use.texture, VK_IMAGE_USAGE_STORAGE_BIT, "STORAGE", op, "storage");
        if (use.access & storageBits)
            require(use.layout == VK_IMAGE_LAYOUT_GENERAL, op,
                    "storage images must be bound in GENERAL, not " +
                    std::string(detail::layoutName(use.layout)));
    }
    for (const auto& use : buffers) {
        checkBuffer(use.buffer, op, "descriptor");
        require(use.access != VK_ACCESS_2_NONE, op, "descriptor buffer declares no access");
        if (use.access & VK_ACCESS_2_UNIFORM_READ_BIT)
            checkBufferUsage(use.buffer, VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, "UNIFORM_BUFFER",
                             op, "uniform");
        if (use.access & storageBits)
            checkBufferUsage(use.buffer, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "STORAGE_BUFFER",
                             op, "storage");
    }
}

// Records the layout every subresource of `texture` is used in by one pass.
// A second use in another layout is a usage error.
void declarePassLayout(std::vector<std::pair<SubresourceKey, VkImageLayout>>& layouts,
                       const TextureSlice& texture, VkImageLayout layout, const char* op) {
    texture.range.forEach([&](std::uint32_t mip, std::uint32_t layer) {
        SubresourceKey key = texture.key(mip, layer);
        for (const auto& [k, l] : layouts) {
            if (k == key) {
                require(l == layout, op,
                        "pass uses " + detail::describe(key) + " in two layouts (" +
                        detail::layoutName(l) + " and " + detail::layoutName(layout) + ")");
                return;
            }
        }
        layouts.emplace_back(key, layout);
    });
}

void checkAttachment(const Attachment& a, bool depth, const char* op, const char* role) {
    checkTexture(a.texture, op, role);
    require(a.texture.view != VK_NULL_HANDLE, op,
            std::string(role) + " attachment has no image view; create a TextureView");
    require(a.texture.range.levelCount == 1, op,
            std::string(role) + " attachment must cover exactly one mip");
    if (depth) {
        require(a.texture.isDepth(), op, "depth attachment has a color format");
        checkTextureUsage(a.texture, VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                          "DEPTH_STENCIL_ATTACHMENT", op, role);
    } else {
        require(!a.texture.isDepth(), op,
                std::string(role) + " attachment has a depth format");
        checkTextureUsage(a.texture, VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT, "COLOR_ATTACHMENT",
                          op, role);
    }
}

bool sameExtent(VkExtent3D a, VkExtent3D b) {
    return a.width == b.width && a.height == b.height && a.depth == b.depth;
}

} // namespace

// GraphicsPassEncoder

GraphicsPassEncoder::GraphicsPassEncoder(CommandEncoder& encoder, GraphicsPass pass)
    : encoder_(&encoder), uncaught_(std::uncaught_exceptions()), pass_(std::move(pass)) {
    constexpr const char* op = "begin graphics pass";
    for (const auto& a : pass_.colors) declarePassLayout(layouts_, a.texture, a.layout, op);
    for (const auto& a : pass_.resolves) declarePassLayout(layouts_, a.texture, a.layout, op);
    if (pass_.depth) declarePassLayout(layouts_, pass_.depth->texture, pass_.depth->layout, op);
    ++encoder_->openPasses_;
}

GraphicsPassEncoder::GraphicsPassEncoder(GraphicsPassEncoder&& o) noexcept
    : encoder_(o.encoder_), uncaught_(o.uncaught_), pass_(std::move(o.pass_)),
      layouts_(std::move(o.layouts_)) {
    o.encoder_ = nullptr;
}

GraphicsPassEncoder::~GraphicsPassEncoder() {
    if (encoder_ == nullptr) return;
    --encoder_->openPasses_;
    if (std::uncaught_exceptions() > uncaught_) {
        // Unwinding from a failed recording call; the pass is incomplete.
        std::fprintf(stderr, "[vkenc] graphics pass abandoned by an exception; discarded\n");
        encoder_ = nullptr;
        return;
    }
#ifndef NDEBUG
    std::fprintf(stderr, "[vkenc] graphics pass destroyed without end(); ended implicitly\n");
#endif
    encoder_->append(std::move(pass_));
    encoder_ = nullptr;
}

void GraphicsPassEncoder::requireOpen(const char* op) const {
    require(encoder_ != nullptr, op, "graphics pass already ended");
}

void GraphicsPassEncoder::declareLayout(const TextureSlice& texture, VkImageLayout layout,
                                        const char* op) {
    declarePassLayout(layouts_, texture, layout, op);
}

GraphicsPassEncoder& GraphicsPassEncoder::bindPipeline(VkPipeline pipeline,
                                                       VkPipelineLayout layout) {
    constexpr const char* op = "bind graphics pipeline";
    requireOpen(op);
    require(pipeline != VK_NULL_HANDLE, op, "pipeline is null");
    require(pass_.pipeline == VK_NULL_HANDLE, op, "a pass binds one pipeline");
    pass_.pipeline = pipeline;
    pass_.layout   = layout;
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::bindDescriptorSet(std::uint32_t index,
                                                            VkDescriptorSet set,
                                                            std::vector<TextureUse> textures,
                                                            std::vector<BufferUse> buffers) {
    constexpr const char* op = "bind descriptor set";
    requireOpen(op);
    require(pass_.layout != VK_NULL_HANDLE, op, "bind a pipeline first");
    checkDescriptorUses(textures, buffers, op);
    for (const auto& use : textures) declareLayout(use.texture, use.layout, op);

    pass_.commands.push_back(BindDescriptorSet{index, set, std::move(textures), std::move(buffers)});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::pushConstants(VkShaderStageFlags stages,
                                                        std::uint32_t offset, const void* data,
                                                        std::uint32_t size) {
    constexpr const char* op = "push constants";
    requireOpen(op);
    require(pass_.layout != VK_NULL_HANDLE, op, "bind a pipeline first");
    require(data != nullptr && size > 0, op, "no push constant data");

    PushConstants pc;
    pc.stages = stages;
    pc.offset = offset;
    pc.data.resize(size);
    std::memcpy(pc.data.data(), data, size);
    pass_.commands.push_back(std::move(pc));
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::bindVertexBuffers(std::uint32_t firstBinding,
                                                            std::vector<BufferSlice> buffers) {
    constexpr const char* op = "bind vertex buffers";
    requireOpen(op);
    require(!buffers.empty(), op, "no vertex buffers");
    for (const auto& b : buffers) {
        checkBuffer(b, op, "vertex");
        checkBufferUsage(b, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, "VERTEX_BUFFER", op, "vertex");
    }
    pass_.commands.push_back(BindVertexBuffers{firstBinding, std::move(buffers)});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::bindIndexBuffer(const BufferSlice& buffer,
                                                          VkIndexType type) {
    constexpr const char* op = "bind index buffer";
    requireOpen(op);
    checkBuffer(buffer, op, "index");
    checkBufferUsage(buffer, VK_BUFFER_USAGE_INDEX_BUFFER_BIT, "INDEX_BUFFER", op, "index");
    pass_.commands.push_back(BindIndexBuffer{buffer, type});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::setViewport(const VkViewport& viewport) {
    requireOpen("set viewport");
    pass_.commands.push_back(SetViewport{viewport});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::setScissor(const VkRect2D& scissor) {
    requireOpen("set scissor");
    pass_.commands.push_back(SetScissor{scissor});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::draw(std::uint32_t vertexCount,
                                               std::uint32_t instanceCount,
                                               std::uint32_t firstVertex,
                                               std::uint32_t firstInstance) {
    constexpr const char* op = "draw";
    requireOpen(op);
    require(pass_.pipeline != VK_NULL_HANDLE, op, "no pipeline bound");
    pass_.commands.push_back(Draw{vertexCount, instanceCount, firstVertex, firstInstance});
    return *this;
}

GraphicsPassEncoder& GraphicsPassEncoder::drawIndexed(std::uint32_t indexCount,
                                                      std::uint32_t instanceCount,
                                                      std::uint32_t firstIndex,
                                                      std::int32_t vertexOffset,
                                                      std::uint32_t firstInstance) {
    constexpr const char* op = "draw indexed";
    requireOpen(op);
    require(pass_.pipeline != VK_NULL_HANDLE, op, "no pipeline bound");

    bool hasIndexBuffer = false;
    for (const auto& c : pass_.commands)
        hasIndexBuffer = hasIndexBuffer || std::holds_alternative<BindIndexBuffer>(c);
    require(hasIndexBuffer, op, "no index buffer bound");

    pass_.commands.push_back(
        DrawIndexed{indexCount, instanceCount, firstIndex, vertexOffset, firstInstance});
    return *this;
}

void GraphicsPassEncoder::end() {
    requireOpen("end graphics pass");
    CommandEncoder* encoder = encoder_;
    encoder_ = nullptr;
    --encoder->openPasses_;
    encoder->append(std::move(pass_));
}

// ComputePassEncoder

ComputePassEncoder::ComputePassEncoder(CommandEncoder& encoder, ComputePass pass)
    : encoder_(&encoder), uncaught_(std::uncaught_exceptions()), pass_(std::move(pass)) {
    ++encoder_->openPasses_;
}

ComputePassEncoder::ComputePassEncoder(ComputePassEncoder&& o) noexcept
    : encoder_(o.encoder_), uncaught_(o.uncaught_), pass_(std::move(o.pass_)),
      layouts_(std::move(o.layouts_)) {
    o.encoder_ = nullptr;
}

ComputePassEncoder::~ComputePassEncoder() {
    if (encoder_ == nullptr) return;
    --encoder_->openPasses_;
    if (std::uncaught_exceptions() > uncaught_) {
        std::fprintf(stderr, "[vkenc] compute pass abandoned by an exception; discarded\n");
        encoder_ = nullptr;
        return;
    }
#ifndef NDEBUG
    std::fprintf(stderr, "[vkenc] compute pass destroyed without end(); ended implicitly\n");
#endif
    encoder_->append(std::move(pass_));
    encoder_ = nullptr;
}

void ComputePassEncoder::requireOpen(const char* op) const {
    require(encoder_ != nullptr, op, "compute pass already ended");
}

ComputePassEncoder& ComputePassEncoder::bindDescriptorSet(std::uint32_t index,
                                                          VkDescriptorSet set,
                                                          std::vector<TextureUse> textures,
                                                          std::vector<BufferUse> buffers) {
    constexpr const char* op = "bind descriptor set";
    requireOpen(op);
    checkDescriptorUses(textures, buffers, op);
    for (const auto& use : textures) declarePassLayout(layouts_, use.texture, use.layout, op);

    pass_.commands.push_back(BindDescriptorSet{index, set, std::move(textures), std::move(buffers)});
    return *this;
}

ComputePassEncoder& ComputePassEncoder::pushConstants(std::uint32_t offset, const void* data,
                                                      std::uint32_t size) {
    constexpr const char* op = "push constants";
    requireOpen(op);
    require(data != nullptr && size > 0, op, "no push constant data");

    PushConstants pc;
    pc.stages = VK_SHADER_STAGE_COMPUTE_BIT;
    pc.offset = offset;
    pc.data.resize(size);
    std::memcpy(pc.data.data(), data, size);
    pass_.commands.push_back(std::move(pc));
    return *this;
}

ComputePassEncoder& ComputePassEncoder::dispatch(std::uint32_t x, std::uint32_t y,
                                                 std::uint32_t z) {
    constexpr const char* op = "dispatch";
    requireOpen(op);
    require(x > 0 && y > 0 && z > 0, op, "group count must be > 0 in every dimension");
    pass_.commands.push_back(Dispatch{x, y, z});
    return *this;
}

void ComputePassEncoder::end() {
    requireOpen("end compute pass");
    CommandEncoder* encoder = encoder_;
    encoder_ = nullptr;
    --encoder->openPasses_;
    encoder->append(std::move(pass_));
}

// CommandEncoder

CommandEncoder::CommandEncoder(QueueCapabilities capabilities)
    : caps_(capabilities) {}

CommandEncoder::CommandEncoder(const Device& device)
    : caps_(device.capabilities()) {}

void CommandEncoder::requireCapability(bool has, const char* op, const char* what) const {
    require(has, op, std::string("the target queue has no ") + what + " capability");
}

void CommandEncoder::append(Command command) {
    PipelineBarrier stub = planner_.plan(command);
    if (!stub.empty()) list_.append(std::move(stub));
    list_.append(std::move(command));
}

void CommandEncoder::updateBuffer(const BufferSlice& dst, const void* data, std::size_t bytes) {
    constexpr const char* op = "update buffer";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.transfer, op, "transfer");
    checkBuffer(dst, op, "destination");
    checkBufferUsage(dst, VK_BUFFER_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(data != nullptr && bytes > 0, op, "no data");
    require(bytes % 4 == 0, op, "payload of " + std::to_string(bytes) +
                                " bytes is not a multiple of 4");
    require(bytes <= MaxUpdateBytes, op, "payload of " + std::to_string(bytes) +
                                         " bytes exceeds 65536; use a staging copy");
    require(dst.offset % 4 == 0, op, "destination offset is not a multiple of 4");
    require(bytes <= dst.size, op, "payload of " + std::to_string(bytes) +
                                   " bytes exceeds the destination slice (" +
                                   std::to_string(dst.size) + " bytes)");

    UpdateBuffer cmd;
    cmd.dst      = dst;
    cmd.dst.size = bytes;
    cmd.data.resize(bytes);
    std::memcpy(cmd.data.data(), data, bytes);
    append(std::move(cmd));
}

void CommandEncoder::clearTexture(const TextureSlice& texture, const VkClearColorValue& color,
                                  VkImageLayout layout) {
    constexpr const char* op = "clear texture";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.graphics || caps_.compute, op, "graphics or compute");
    checkTexture(texture, op, "cleared");
    require(!texture.isDepth(), op, "texture has a depth format; use clearDepthStencil()");
    checkTextureUsage(texture, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "cleared");
    require(layout == VK_IMAGE_LAYOUT_GENERAL || layout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            op, "clears need GENERAL or TRANSFER_DST_OPTIMAL");

    ClearTexture cmd;
    cmd.texture     = texture;
    cmd.layout      = layout;
    cmd.value.color = color;
    append(std::move(cmd));
}

void CommandEncoder::clearDepthStencil(const TextureSlice& texture, float depth,
                                       std::uint32_t stencil, VkImageLayout layout) {
    constexpr const char* op = "clear depth/stencil";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.graphics, op, "graphics");
    checkTexture(texture, op, "cleared");
    require(texture.isDepth(), op, "texture has a color format; use clearTexture()");
    checkTextureUsage(texture, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "cleared");
    require(layout == VK_IMAGE_LAYOUT_GENERAL || layout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            op, "clears need GENERAL or TRANSFER_DST_OPTIMAL");

    ClearTexture cmd;
    cmd.texture            = texture;
    cmd.layout             = layout;
    cmd.value.depthStencil = {depth, stencil};
    append(std::move(cmd));
}

void CommandEncoder::blitTextures(const TextureSlice& src, const TextureSlice& dst,
                                  VkFilter filter) {
    constexpr const char* op = "blit textures";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.graphics, op, "graphics");
    checkTexture(src, op, "source");
    checkTexture(dst, op, "destination");
    checkTextureUsage(src, VK_IMAGE_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkTextureUsage(dst, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(src.range.layerCount == dst.range.layerCount, op,
            "source and destination layer counts differ (" +
            std::to_string(src.range.layerCount) + " vs " +
            std::to_string(dst.range.layerCount) + ")");
    require(src.samples == VK_SAMPLE_COUNT_1_BIT && dst.samples == VK_SAMPLE_COUNT_1_BIT, op,
            "blits need single-sampled textures; use resolveTexture()");
    require(!src.isDepth() || filter == VK_FILTER_NEAREST, op,
            "depth blits must use VK_FILTER_NEAREST");

    BlitTextures cmd;
    cmd.src    = src;
    cmd.dst    = dst;
    cmd.filter = filter;
    append(std::move(cmd));
}

void CommandEncoder::resolveTexture(const TextureSlice& src, const TextureSlice& dst) {
    constexpr const char* op = "resolve texture";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.graphics, op, "graphics");
    checkTexture(src, op, "source");
    checkTexture(dst, op, "destination");
    checkTextureUsage(src, VK_IMAGE_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkTextureUsage(dst, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(src.samples != VK_SAMPLE_COUNT_1_BIT, op, "source is not multisampled");
    require(dst.samples == VK_SAMPLE_COUNT_1_BIT, op, "destination is multisampled");
    require(src.range.levelCount == dst.range.levelCount &&
            src.range.layerCount == dst.range.layerCount, op,
            "source and destination ranges differ in size");
    VkExtent3D se = src.mipExtent(src.range.baseMipLevel);
    VkExtent3D de = dst.mipExtent(dst.range.baseMipLevel);
    require(sameExtent(se, de), op, "extent mismatch (" + extentString(se) + " vs " +
                                    extentString(de) + ")");

    ResolveTextures cmd;
    cmd.src = src;
    cmd.dst = dst;
    append(std::move(cmd));
}

void CommandEncoder::copyBufferToBuffer(const BufferSlice& src, const BufferSlice& dst) {
    constexpr const char* op = "copy buffer to buffer";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.transfer, op, "transfer");
    checkBuffer(src, op, "source");
    checkBuffer(dst, op, "destination");
    checkBufferUsage(src, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkBufferUsage(dst, VK_BUFFER_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(src.size <= dst.size, op, "source slice (" + std::to_string(src.size) +
                                      " bytes) is larger than destination slice (" +
                                      std::to_string(dst.size) + " bytes)");
    require(src.buffer != dst.buffer ||
            src.offset + src.size <= dst.offset || dst.offset + src.size <= src.offset,
            op, "source and destination ranges overlap");

    append(CopyBufferToBuffer{src, dst});
}

void CommandEncoder::copyTextureToBuffer(const TextureSlice& src, const BufferSlice& dst) {
    constexpr const char* op = "copy texture to buffer";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.transfer, op, "transfer");
    checkTexture(src, op, "source");
    checkBuffer(dst, op, "destination");
    checkCopyAspect(src, op, "source");
    checkTextureUsage(src, VK_IMAGE_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkBufferUsage(dst, VK_BUFFER_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(src.samples == VK_SAMPLE_COUNT_1_BIT, op, "source is multisampled");
    VkDeviceSize needed = tightBytes(src);
    require(needed == 0 || needed <= dst.size, op,
            "destination slice holds " + std::to_string(dst.size) + " bytes, the copy needs " +
            std::to_string(needed));

    CopyTextureToBuffer cmd;
    cmd.src = src;
    cmd.dst = dst;
    append(std::move(cmd));
}

void CommandEncoder::copyBufferToTexture(const BufferSlice& src, const TextureSlice& dst) {
    constexpr const char* op = "copy buffer to texture";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.transfer, op, "transfer");
    checkBuffer(src, op, "source");
    checkTexture(dst, op, "destination");
    checkCopyAspect(dst, op, "destination");
    checkBufferUsage(src, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkTextureUsage(dst, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(dst.samples == VK_SAMPLE_COUNT_1_BIT, op, "destination is multisampled");
    VkDeviceSize needed = tightBytes(dst);
    require(needed == 0 || needed <= src.size, op,
            "source slice holds " + std::to_string(src.size) + " bytes, the copy needs " +
            std::to_string(needed));

    CopyBufferToTexture cmd;
    cmd.src = src;
    cmd.dst = dst;
    append(std::move(cmd));
}

void CommandEncoder::copyTextureToTexture(const TextureSlice& src, const TextureSlice& dst) {
    constexpr const char* op = "copy texture to texture";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.transfer, op, "transfer");
    checkTexture(src, op, "source");
    checkTexture(dst, op, "destination");
    checkTextureUsage(src, VK_IMAGE_USAGE_TRANSFER_SRC_BIT, "TRANSFER_SRC", op, "source");
    checkTextureUsage(dst, VK_IMAGE_USAGE_TRANSFER_DST_BIT, "TRANSFER_DST", op, "destination");
    require(src.samples == dst.samples, op, "sample counts differ");
    require(src.range.layerCount == dst.range.layerCount, op, "layer counts differ");
    VkExtent3D se = src.mipExtent(src.range.baseMipLevel);
    VkExtent3D de = dst.mipExtent(dst.range.baseMipLevel);
    require(sameExtent(se, de), op, "extent mismatch (" + extentString(se) + " vs " +
                                    extentString(de) + ")");
    require(src.image != dst.image || !src.range.overlaps(dst.range), op,
            "source and destination subresources overlap");

    CopyTextureToTexture cmd;
    cmd.src = src;
    cmd.dst = dst;
    append(std::move(cmd));
}

GraphicsPassEncoder CommandEncoder::graphicsPass(std::vector<Attachment> colors,
                                                 std::optional<Attachment> depth,
                                                 std::vector<Attachment> resolves) {
    constexpr const char* op = "begin graphics pass";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.graphics, op, "graphics");
    require(!colors.empty() || depth.has_value(), op, "pass has no attachments");
    require(resolves.empty() || resolves.size() == colors.size(), op,
            "resolves must be empty or one per color attachment");

    for (const auto& a : colors) checkAttachment(a, false, op, "color");
    if (depth) checkAttachment(*depth, true, op, "depth");
    for (std::size_t i = 0; i < resolves.size(); ++i) {
        checkAttachment(resolves[i], false, op, "resolve");
        require(colors[i].texture.samples != VK_SAMPLE_COUNT_1_BIT, op,
                "color attachment " + std::to_string(i) + " is not multisampled");
        require(resolves[i].texture.samples == VK_SAMPLE_COUNT_1_BIT, op,
                "resolve target " + std::to_string(i) + " is multisampled");
        VkExtent3D ce = colors[i].texture.mipExtent(colors[i].texture.range.baseMipLevel);
        VkExtent3D re = resolves[i].texture.mipExtent(resolves[i].texture.range.baseMipLevel);
        require(sameExtent(ce, re), op, "resolve target " + std::to_string(i) +
                                        " extent mismatch (" + extentString(ce) + " vs " +
                                        extentString(re) + ")");
    }

    // One texture cannot back two attachments.
    std::vector<const TextureSlice*> all;
    for (const auto& a : colors) all.push_back(&a.texture);
    for (const auto& a : resolves) all.push_back(&a.texture);
    if (depth) all.push_back(&depth->texture);
    for (std::size_t a = 0; a < all.size(); ++a) {
        for (std::size_t b = a + 1; b < all.size(); ++b) {
            require(all[a]->image != all[b]->image || !all[a]->range.overlaps(all[b]->range), op,
                    "the same texture is used as more than one attachment");
        }
    }

    GraphicsPass pass;
    pass.colors   = std::move(colors);
    pass.resolves = std::move(resolves);
    pass.depth    = std::move(depth);
    return GraphicsPassEncoder(*this, std::move(pass));
}

ComputePassEncoder CommandEncoder::computePass(VkPipeline pipeline, VkPipelineLayout layout) {
    constexpr const char* op = "begin compute pass";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    requireCapability(caps_.compute, op, "compute");
    require(pipeline != VK_NULL_HANDLE, op, "pipeline is null");

    ComputePass pass;
    pass.pipeline = pipeline;
    pass.layout   = layout;
    return ComputePassEncoder(*this, std::move(pass));
}

void CommandEncoder::writeTimestamp(VkQueryPool pool, std::uint32_t query,
                                    VkPipelineStageFlags2 stage) {
    constexpr const char* op = "write timestamp";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    require(pool != VK_NULL_HANDLE, op, "query pool is null");
    require(stage != VK_PIPELINE_STAGE_2_NONE, op, "stage is NONE");
    append(WriteTimestamp{pool, query, stage});
}

void CommandEncoder::resetQueryPool(VkQueryPool pool, std::uint32_t first, std::uint32_t count) {
    constexpr const char* op = "reset query pool";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    require(pool != VK_NULL_HANDLE, op, "query pool is null");
    require(count > 0, op, "query count must be > 0");
    append(ResetQueryPool{pool, first, count});
}

void CommandEncoder::transitionTexture(const TextureSlice& texture, VkImageLayout layout) {
    constexpr const char* op = "transition texture";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    checkTexture(texture, op, "transitioned");
    require(layout != VK_IMAGE_LAYOUT_UNDEFINED && layout != VK_IMAGE_LAYOUT_PREINITIALIZED, op,
            "cannot transition into " + std::string(detail::layoutName(layout)));

    PipelineBarrier barrier;
    texture.range.forEach([&](std::uint32_t mip, std::uint32_t layer) {
        TextureAccess rec;
        rec.key           = texture.key(mip, layer);
        rec.aspect        = texture.aspect;
        rec.restingLayout = texture.restingLayout;
        rec.srcLayout     = planner_.currentLayout(rec.key, texture.restingLayout);
        rec.dstLayout     = layout;
        barrier.textures.push_back(rec);
    });
    append(std::move(barrier));
}

void CommandEncoder::pushCommand(Command command) {
    constexpr const char* op = "push command";
    require(openPasses_ == 0, op, "a pass encoder is still open; call end() first");
    for (const auto& t : touchedTextures(command)) {
        require(isRestingLayoutValid(t.restingLayout), op,
                detail::describe(t.key) + " has an invalid resting layout");
        require(t.layout != VK_IMAGE_LAYOUT_UNDEFINED, op,
                detail::describe(t.key) + " is used in UNDEFINED");
    }
    if (const auto* barrier = std::get_if<PipelineBarrier>(&command)) {
        for (const auto& rec : barrier->textures) {
            require(isRestingLayoutValid(rec.restingLayout), op,
                    detail::describe(rec.key) + " has an invalid resting layout");
            require(rec.dstLayout != VK_IMAGE_LAYOUT_UNDEFINED &&
                    rec.dstLayout != VK_IMAGE_LAYOUT_PREINITIALIZED, op,
                    "barrier moves " + detail::describe(rec.key) + " into " +
                    detail::layoutName(rec.dstLayout));
        }
    }
    if (const auto* pass = std::get_if<GraphicsPass>(&command)) {
        requireCapability(caps_.graphics, op, "graphics");
        require(!pass->colors.empty() || pass->depth.has_value(), op, "pass has no attachments");
    } else if (std::holds_alternative<ComputePass>(command)) {
        requireCapability(caps_.compute, op, "compute");
    }
    append(std::move(command));
}

Result<void> CommandEncoder::format() {
    require(openPasses_ == 0, "format command list",
            "a pass encoder is still open; call end() first");
    return list_.format();
}

Result<void> CommandEncoder::record(VkCommandBuffer cmd) {
    auto formatted = format();
    if (!formatted.ok()) return formatted;
    return recordCommands(cmd, list_.commands());
}

Result<void> CommandEncoder::submit(const Device& device, VkCommandBuffer cmd,
                                    const SubmitSync& sync) {
    auto recorded = record(cmd);
    if (!recorded.ok()) return recorded;
    return submitCommandBuffer(device, cmd, sync);
}

void CommandEncoder::reset() {
    require(openPasses_ == 0, "reset encoder", "a pass encoder is still open; call end() first");
    list_.clear();
    planner_.reset();
}

VkImageLayout CommandEncoder::currentLayout(const TextureSlice& texture, std::uint32_t mip,
                                            std::uint32_t layer) const {
    return planner_.currentLayout(texture.key(mip, layer), texture.restingLayout);
}

} // namespace vkenc
