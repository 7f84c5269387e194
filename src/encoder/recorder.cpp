#include <vkenc/device.hpp>
#include <vkenc/encoder/recorder.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace vkenc {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

VkOffset3D extentToOffset(VkExtent3D e) {
    return {static_cast<std::int32_t>(e.width), static_cast<std::int32_t>(e.height),
            static_cast<std::int32_t>(e.depth)};
}

void recordBarrier(VkCommandBuffer cmd, const PipelineBarrier& b) {
    if (b.empty()) return;

    std::vector<VkImageMemoryBarrier2> images;
    images.reserve(b.textures.size());
    for (const auto& rec : b.textures) {
        VkImageMemoryBarrier2 barrier{};
        barrier.sType               = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        barrier.srcStageMask        = rec.srcStage;
        barrier.srcAccessMask       = rec.srcAccess;
        barrier.dstStageMask        = rec.dstStage;
        barrier.dstAccessMask       = rec.dstAccess;
        barrier.oldLayout           = rec.srcLayout;
        barrier.newLayout           = rec.dstLayout;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image               = rec.key.image;
        barrier.subresourceRange    = {rec.aspect, rec.key.mip, 1, rec.key.layer, 1};
        images.push_back(barrier);
    }

    std::vector<VkBufferMemoryBarrier2> buffers;
    buffers.reserve(b.buffers.size());
    for (const auto& rec : b.buffers) {
        VkBufferMemoryBarrier2 barrier{};
        barrier.sType               = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
        barrier.srcStageMask        = rec.srcStage;
        barrier.srcAccessMask       = rec.srcAccess;
        barrier.dstStageMask        = rec.dstStage;
        barrier.dstAccessMask       = rec.dstAccess;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.buffer              = rec.buffer;
        barrier.offset              = 0;
        barrier.size                = VK_WHOLE_SIZE;
        buffers.push_back(barrier);
    }

    VkDependencyInfo dep{};
    dep.sType                    = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dep.imageMemoryBarrierCount  = static_cast<std::uint32_t>(images.size());
    dep.pImageMemoryBarriers     = images.data();
    dep.bufferMemoryBarrierCount = static_cast<std::uint32_t>(buffers.size());
    dep.pBufferMemoryBarriers    = buffers.data();

    vkCmdPipelineBarrier2(cmd, &dep);
}

void recordClear(VkCommandBuffer cmd, const ClearTexture& c) {
    VkImageSubresourceRange range = c.texture.vkRange();
    if (c.texture.isDepth()) {
        vkCmdClearDepthStencilImage(cmd, c.texture.image, c.layout, &c.value.depthStencil,
                                    1, &range);
    } else {
        vkCmdClearColorImage(cmd, c.texture.image, c.layout, &c.value.color, 1, &range);
    }
}

void recordBlit(VkCommandBuffer cmd, const BlitTextures& c) {
    VkImageBlit2 region{};
    region.sType          = VK_STRUCTURE_TYPE_IMAGE_BLIT_2;
    region.srcSubresource = c.src.vkLayers();
    region.srcOffsets[1]  = extentToOffset(c.src.mipExtent(c.src.range.baseMipLevel));
    region.dstSubresource = c.dst.vkLayers();
    region.dstOffsets[1]  = extentToOffset(c.dst.mipExtent(c.dst.range.baseMipLevel));

    VkBlitImageInfo2 info{};
    info.sType          = VK_STRUCTURE_TYPE_BLIT_IMAGE_INFO_2;
    info.srcImage       = c.src.image;
    info.srcImageLayout = c.srcLayout;
    info.dstImage       = c.dst.image;
    info.dstImageLayout = c.dstLayout;
    info.regionCount    = 1;
    info.pRegions       = &region;
    info.filter         = c.filter;

    vkCmdBlitImage2(cmd, &info);
}

void recordResolve(VkCommandBuffer cmd, const ResolveTextures& c) {
    std::vector<VkImageResolve2> regions;
    for (std::uint32_t i = 0; i < c.src.range.levelCount; ++i) {
        std::uint32_t srcMip = c.src.range.baseMipLevel + i;
        std::uint32_t dstMip = c.dst.range.baseMipLevel + i;

        VkImageResolve2 region{};
        region.sType                    = VK_STRUCTURE_TYPE_IMAGE_RESOLVE_2;
        region.srcSubresource           = c.src.vkLayers();
        region.srcSubresource.mipLevel  = srcMip;
        region.dstSubresource           = c.dst.vkLayers();
        region.dstSubresource.mipLevel  = dstMip;
        region.extent                   = c.src.mipExtent(srcMip);
        regions.push_back(region);
    }

    VkResolveImageInfo2 info{};
    info.sType          = VK_STRUCTURE_TYPE_RESOLVE_IMAGE_INFO_2;
    info.srcImage       = c.src.image;
    info.srcImageLayout = c.srcLayout;
    info.dstImage       = c.dst.image;
    info.dstImageLayout = c.dstLayout;
    info.regionCount    = static_cast<std::uint32_t>(regions.size());
    info.pRegions       = regions.data();

    vkCmdResolveImage2(cmd, &info);
}

void recordCopy(VkCommandBuffer cmd, const CopyBufferToBuffer& c) {
    VkBufferCopy2 region{};
    region.sType     = VK_STRUCTURE_TYPE_BUFFER_COPY_2;
    region.srcOffset = c.src.offset;
    region.dstOffset = c.dst.offset;
    region.size      = c.src.size;

    VkCopyBufferInfo2 info{};
    info.sType       = VK_STRUCTURE_TYPE_COPY_BUFFER_INFO_2;
    info.srcBuffer   = c.src.buffer;
    info.dstBuffer   = c.dst.buffer;
    info.regionCount = 1;
    info.pRegions    = &region;

    vkCmdCopyBuffer2(cmd, &info);
}

VkBufferImageCopy2 bufferImageRegion(const BufferSlice& buffer, const TextureSlice& texture) {
    VkBufferImageCopy2 region{};
    region.sType             = VK_STRUCTURE_TYPE_BUFFER_IMAGE_COPY_2;
    region.bufferOffset      = buffer.offset;
    region.bufferRowLength   = 0; // tightly packed
    region.bufferImageHeight = 0;
    region.imageSubresource  = texture.vkLayers();
    region.imageOffset       = {0, 0, 0};
    region.imageExtent       = texture.mipExtent(texture.range.baseMipLevel);
    return region;
}

void recordCopy(VkCommandBuffer cmd, const CopyTextureToBuffer& c) {
    VkBufferImageCopy2 region = bufferImageRegion(c.dst, c.src);

    VkCopyImageToBufferInfo2 info{};
    info.sType          = VK_STRUCTURE_TYPE_COPY_IMAGE_TO_BUFFER_INFO_2;
    info.srcImage       = c.src.image;
    info.srcImageLayout = c.srcLayout;
    info.dstBuffer      = c.dst.buffer;
    info.regionCount    = 1;
    info.pRegions       = &region;

    vkCmdCopyImageToBuffer2(cmd, &info);
}

void recordCopy(VkCommandBuffer cmd, const CopyBufferToTexture& c) {
    VkBufferImageCopy2 region = bufferImageRegion(c.src, c.dst);

    VkCopyBufferToImageInfo2 info{};
    info.sType          = VK_STRUCTURE_TYPE_COPY_BUFFER_TO_IMAGE_INFO_2;
    info.srcBuffer      = c.src.buffer;
    info.dstImage       = c.dst.image;
    info.dstImageLayout = c.dstLayout;
    info.regionCount    = 1;
    info.pRegions       = &region;

    vkCmdCopyBufferToImage2(cmd, &info);
}

void recordCopy(VkCommandBuffer cmd, const CopyTextureToTexture& c) {
    VkImageCopy2 region{};
    region.sType          = VK_STRUCTURE_TYPE_IMAGE_COPY_2;
    region.srcSubresource = c.src.vkLayers();
    region.dstSubresource = c.dst.vkLayers();
    region.extent         = c.src.mipExtent(c.src.range.baseMipLevel);

    VkCopyImageInfo2 info{};
    info.sType          = VK_STRUCTURE_TYPE_COPY_IMAGE_INFO_2;
    info.srcImage       = c.src.image;
    info.srcImageLayout = c.srcLayout;
    info.dstImage       = c.dst.image;
    info.dstImageLayout = c.dstLayout;
    info.regionCount    = 1;
    info.pRegions       = &region;

    vkCmdCopyImage2(cmd, &info);
}

VkRenderingAttachmentInfo attachmentInfo(const Attachment& a) {
    VkRenderingAttachmentInfo info{};
    info.sType       = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    info.imageView   = a.texture.view;
    info.imageLayout = a.layout;
    info.loadOp      = a.loadOp;
    info.storeOp     = a.storeOp;
    info.clearValue  = a.clear;
    return info;
}

void recordPassCommand(VkCommandBuffer cmd, VkPipelineBindPoint bindPoint,
                       VkPipelineLayout layout, const BindDescriptorSet& c) {
    vkCmdBindDescriptorSets(cmd, bindPoint, layout, c.index, 1, &c.set, 0, nullptr);
}

void recordPassCommand(VkCommandBuffer cmd, VkPipelineLayout layout, const PushConstants& c) {
    vkCmdPushConstants(cmd, layout, c.stages, c.offset,
                       static_cast<std::uint32_t>(c.data.size()), c.data.data());
}

void recordGraphicsPass(VkCommandBuffer cmd, const GraphicsPass& p) {
    std::vector<VkRenderingAttachmentInfo> colors;
    colors.reserve(p.colors.size());
    for (std::size_t i = 0; i < p.colors.size(); ++i) {
        VkRenderingAttachmentInfo info = attachmentInfo(p.colors[i]);
        if (i < p.resolves.size()) {
            info.resolveMode        = VK_RESOLVE_MODE_AVERAGE_BIT;
            info.resolveImageView   = p.resolves[i].texture.view;
            info.resolveImageLayout = p.resolves[i].layout;
        }
        colors.push_back(info);
    }

    VkRenderingAttachmentInfo depthInfo{};
    if (p.depth) depthInfo = attachmentInfo(*p.depth);

    std::uint32_t layerCount = UINT32_MAX;
    for (const auto& a : p.colors) layerCount = std::min(layerCount, a.texture.range.layerCount);
    if (p.depth) layerCount = std::min(layerCount, p.depth->texture.range.layerCount);

    VkExtent2D area = p.renderArea();

    VkRenderingInfo rendering{};
    rendering.sType                = VK_STRUCTURE_TYPE_RENDERING_INFO;
    rendering.renderArea           = {{0, 0}, area};
    rendering.layerCount           = layerCount;
    rendering.colorAttachmentCount = static_cast<std::uint32_t>(colors.size());
    rendering.pColorAttachments    = colors.data();
    if (p.depth) {
        rendering.pDepthAttachment = &depthInfo;
        if (p.depth->texture.aspect & VK_IMAGE_ASPECT_STENCIL_BIT)
            rendering.pStencilAttachment = &depthInfo;
    }

    vkCmdBeginRendering(cmd, &rendering);

    if (p.pipeline != VK_NULL_HANDLE) {
        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, p.pipeline);

        // Defaults cover the render area; inner commands may override them.
        VkViewport viewport{};
        viewport.width    = static_cast<float>(area.width);
        viewport.height   = static_cast<float>(area.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;
        vkCmdSetViewport(cmd, 0, 1, &viewport);

        VkRect2D scissor{{0, 0}, area};
        vkCmdSetScissor(cmd, 0, 1, &scissor);
    }

    for (const auto& inner : p.commands) {
        std::visit(Overloaded{
            [&](const BindDescriptorSet& c) {
                recordPassCommand(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, p.layout, c);
            },
            [&](const PushConstants& c) { recordPassCommand(cmd, p.layout, c); },
            [&](const BindVertexBuffers& c) {
                std::vector<VkBuffer>     handles;
                std::vector<VkDeviceSize> offsets;
                for (const auto& b : c.buffers) {
                    handles.push_back(b.buffer);
                    offsets.push_back(b.offset);
                }
                vkCmdBindVertexBuffers(cmd, c.firstBinding,
                                       static_cast<std::uint32_t>(handles.size()),
                                       handles.data(), offsets.data());
            },
            [&](const BindIndexBuffer& c) {
                vkCmdBindIndexBuffer(cmd, c.buffer.buffer, c.buffer.offset, c.type);
            },
            [&](const SetViewport& c) { vkCmdSetViewport(cmd, 0, 1, &c.viewport); },
            [&](const SetScissor& c) { vkCmdSetScissor(cmd, 0, 1, &c.scissor); },
            [&](const Draw& c) {
                vkCmdDraw(cmd, c.vertexCount, c.instanceCount, c.firstVertex, c.firstInstance);
            },
            [&](const DrawIndexed& c) {
                vkCmdDrawIndexed(cmd, c.indexCount, c.instanceCount, c.firstIndex,
                                 c.vertexOffset, c.firstInstance);
            },
        }, inner);
    }

    vkCmdEndRendering(cmd);
}

void recordComputePass(VkCommandBuffer cmd, const ComputePass& p) {
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, p.pipeline);

    for (const auto& inner : p.commands) {
        std::visit(Overloaded{
            [&](const BindDescriptorSet& c) {
                recordPassCommand(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, p.layout, c);
            },
            [&](const PushConstants& c) { recordPassCommand(cmd, p.layout, c); },
            [&](const Dispatch& c) { vkCmdDispatch(cmd, c.x, c.y, c.z); },
        }, inner);
    }
}

} // namespace

void replayCommands(VkCommandBuffer cmd, const std::vector<Command>& commands) {
    for (const auto& command : commands) {
        std::visit(Overloaded{
            [&](const PipelineBarrier& c) { recordBarrier(cmd, c); },
            [&](const UpdateBuffer& c) {
                vkCmdUpdateBuffer(cmd, c.dst.buffer, c.dst.offset,
                                  static_cast<VkDeviceSize>(c.data.size()), c.data.data());
            },
            [&](const ClearTexture& c) { recordClear(cmd, c); },
            [&](const BlitTextures& c) { recordBlit(cmd, c); },
            [&](const ResolveTextures& c) { recordResolve(cmd, c); },
            [&](const CopyBufferToBuffer& c) { recordCopy(cmd, c); },
            [&](const CopyTextureToBuffer& c) { recordCopy(cmd, c); },
            [&](const CopyBufferToTexture& c) { recordCopy(cmd, c); },
            [&](const CopyTextureToTexture& c) { recordCopy(cmd, c); },
            [&](const GraphicsPass& c) { recordGraphicsPass(cmd, c); },
            [&](const ComputePass& c) { recordComputePass(cmd, c); },
            [&](const WriteTimestamp& c) { vkCmdWriteTimestamp2(cmd, c.stage, c.pool, c.query); },
            [&](const ResetQueryPool& c) { vkCmdResetQueryPool(cmd, c.pool, c.first, c.count); },
        }, command);
    }
}

Result<void> recordCommands(VkCommandBuffer cmd, const std::vector<Command>& commands) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    VkResult vr = vkBeginCommandBuffer(cmd, &beginInfo);
    if (vr != VK_SUCCESS) {
        return Error{"record command list", static_cast<std::int32_t>(vr),
                     "vkBeginCommandBuffer failed"};
    }

    replayCommands(cmd, commands);

    vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) {
        return Error{"record command list", static_cast<std::int32_t>(vr),
                     "vkEndCommandBuffer failed"};
    }
    return {};
}

Result<void> submitCommandBuffer(const Device& device, VkCommandBuffer cmd,
                                 const SubmitSync& sync) {
    std::vector<VkSemaphoreSubmitInfo> waits;
    waits.reserve(sync.waits.size());
    for (const auto& w : sync.waits) {
        VkSemaphoreSubmitInfo info{};
        info.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
        info.semaphore = w.semaphore;
        info.value     = w.value;
        info.stageMask = w.stage;
        waits.push_back(info);
    }

    std::vector<VkSemaphoreSubmitInfo> signals;
    signals.reserve(sync.signals.size());
    for (const auto& s : sync.signals) {
        VkSemaphoreSubmitInfo info{};
        info.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
        info.semaphore = s.semaphore;
        info.value     = s.value;
        info.stageMask = s.stage;
        signals.push_back(info);
    }

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = cmd;

    VkSubmitInfo2 submit{};
    submit.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submit.waitSemaphoreInfoCount   = static_cast<std::uint32_t>(waits.size());
    submit.pWaitSemaphoreInfos      = waits.data();
    submit.commandBufferInfoCount   = 1;
    submit.pCommandBufferInfos      = &cmdInfo;
    submit.signalSemaphoreInfoCount = static_cast<std::uint32_t>(signals.size());
    submit.pSignalSemaphoreInfos    = signals.data();

    VkResult vr = vkQueueSubmit2(device.queue(), 1, &submit, sync.fence);
    if (vr != VK_SUCCESS) {
        return Error{"submit command list", static_cast<std::int32_t>(vr),
                     "vkQueueSubmit2 failed"};
    }
    return {};
}

} // namespace vkenc
