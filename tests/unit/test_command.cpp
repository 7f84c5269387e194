#include <vkenc/encoder/command.hpp>

#include "fakes.hpp"

#include <cassert>
#include <cstdio>
#include <cstring>

namespace {

const vkenc::TextureTouch* findTouch(const std::vector<vkenc::TextureTouch>& touches,
                                     const vkenc::SubresourceKey& key) {
    for (const auto& t : touches)
        if (t.key == key) return &t;
    return nullptr;
}

} // namespace

int main() {
    // Clear touches every (mip, layer) of the slice
    {
        auto cube = fakes::cubemap(0x100, 3);
        vkenc::ClearTexture clear;
        clear.texture = cube;
        clear.layout  = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;

        auto touches = vkenc::touchedTextures(clear);
        assert(touches.size() == 18);
        for (const auto& t : touches) {
            assert(t.layout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
            assert(t.access == VK_ACCESS_2_TRANSFER_WRITE_BIT);
            assert(t.stage == VK_PIPELINE_STAGE_2_CLEAR_BIT);
            assert(t.restingLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        }
        assert(vkenc::touchedBuffers(clear).empty());
        assert(vkenc::commandStage(clear) == VK_PIPELINE_STAGE_2_CLEAR_BIT);
        std::printf("  clear footprint: ok\n");
    }

    // Copies and blits address only the base mip
    {
        auto src = fakes::texture(0x200, VK_IMAGE_LAYOUT_GENERAL, fakes::AllColorUsage, 4, 2);
        auto dst = fakes::buffer(0x300);
        vkenc::CopyTextureToBuffer copy;
        copy.src = src.mip(1);
        copy.dst = dst;

        auto touches = vkenc::touchedTextures(copy);
        assert(touches.size() == 2);
        for (const auto& t : touches) {
            assert(t.key.mip == 1);
            assert(t.layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
            assert(t.access == VK_ACCESS_2_TRANSFER_READ_BIT);
            assert(t.stage == VK_PIPELINE_STAGE_2_COPY_BIT);
        }

        auto buffers = vkenc::touchedBuffers(copy);
        assert(buffers.size() == 1);
        assert(buffers[0].buffer == dst.buffer);
        assert(buffers[0].access == VK_ACCESS_2_TRANSFER_WRITE_BIT);

        vkenc::BlitTextures blit;
        blit.src = src.mip(0);
        blit.dst = src.mip(1);
        auto blitTouches = vkenc::touchedTextures(blit);
        assert(blitTouches.size() == 4);
        auto* srcTouch = findTouch(blitTouches, src.key(0, 1));
        auto* dstTouch = findTouch(blitTouches, src.key(1, 1));
        assert(srcTouch && srcTouch->layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        assert(dstTouch && dstTouch->layout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        assert(dstTouch->stage == VK_PIPELINE_STAGE_2_BLIT_BIT);
        std::printf("  copy/blit footprint: ok\n");
    }

    // Buffer copy and update
    {
        auto a = fakes::buffer(0x400);
        auto b = fakes::buffer(0x500);
        vkenc::CopyBufferToBuffer copy{a, b};
        auto touches = vkenc::touchedBuffers(copy);
        assert(touches.size() == 2);
        assert(touches[0].buffer == a.buffer && touches[0].access == VK_ACCESS_2_TRANSFER_READ_BIT);
        assert(touches[1].buffer == b.buffer && touches[1].access == VK_ACCESS_2_TRANSFER_WRITE_BIT);

        vkenc::UpdateBuffer update;
        update.dst  = b;
        update.data = {1, 2, 3, 4};
        auto ut = vkenc::touchedBuffers(update);
        assert(ut.size() == 1);
        assert(ut[0].stage == VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT);
        std::printf("  buffer footprint: ok\n");
    }

    // Graphics pass: attachments, descriptor textures, vertex and index buffers
    {
        auto color   = fakes::colorTexture(0x600);
        auto depth   = fakes::depthTexture(0x700);
        auto sampled = fakes::colorTexture(0x800, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        auto vbo     = fakes::buffer(0x900);
        auto ibo     = fakes::buffer(0xa00);

        vkenc::GraphicsPass pass;
        pass.colors.push_back(vkenc::Attachment::color(color, VK_ATTACHMENT_LOAD_OP_CLEAR));
        pass.depth = vkenc::Attachment::depth(depth);
        pass.commands.push_back(vkenc::BindDescriptorSet{
            0, VK_NULL_HANDLE, {vkenc::TextureUse::sampled(sampled)}, {}});
        pass.commands.push_back(vkenc::BindVertexBuffers{0, {vbo}});
        pass.commands.push_back(vkenc::BindIndexBuffer{ibo, VK_INDEX_TYPE_UINT16});
        pass.commands.push_back(vkenc::DrawIndexed{3});

        auto touches = vkenc::touchedTextures(pass);
        assert(touches.size() == 3);

        auto* c = findTouch(touches, color.key(0, 0));
        assert(c && c->layout == VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        assert(c->stage == VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
        assert(c->access & VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT);

        auto* d = findTouch(touches, depth.key(0, 0));
        assert(d && d->layout == VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL);
        assert(d->stage & VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT);
        assert(d->aspect == VK_IMAGE_ASPECT_DEPTH_BIT);

        auto* s = findTouch(touches, sampled.key(0, 0));
        assert(s && s->layout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        assert(s->access == VK_ACCESS_2_SHADER_SAMPLED_READ_BIT);
        assert(s->stage == vkenc::GraphicsShaderStages);

        auto buffers = vkenc::touchedBuffers(pass);
        assert(buffers.size() == 2);
        assert(buffers[0].access == VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT);
        assert(buffers[1].access == VK_ACCESS_2_INDEX_READ_BIT);

        VkPipelineStageFlags2 stage = vkenc::commandStage(pass);
        assert(stage & VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
        assert(stage & VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT);
        assert(stage & VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT);

        VkExtent2D area = pass.renderArea();
        assert(area.width == 64 && area.height == 64);
        std::printf("  graphics pass footprint: ok\n");
    }

    // Same subresource twice in one command: merged when layouts agree,
    // reported separately when they do not
    {
        auto storage = fakes::colorTexture(0xb00);
        vkenc::ComputePass pass;
        pass.commands.push_back(vkenc::BindDescriptorSet{
            0, VK_NULL_HANDLE, {vkenc::TextureUse::storage(storage, false)}, {}});
        pass.commands.push_back(vkenc::BindDescriptorSet{
            1, VK_NULL_HANDLE, {vkenc::TextureUse::storage(storage, true)}, {}});
        auto merged = vkenc::touchedTextures(pass);
        assert(merged.size() == 1);
        assert(merged[0].access & VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT);
        assert(merged[0].stage == vkenc::ComputeShaderStages);

        pass.commands.push_back(vkenc::BindDescriptorSet{
            2, VK_NULL_HANDLE, {vkenc::TextureUse::sampled(storage)}, {}});
        auto conflicting = vkenc::touchedTextures(pass);
        assert(conflicting.size() == 2);
        assert(conflicting[0].layout != conflicting[1].layout);
        std::printf("  touch merging: ok\n");
    }

    // Declared stage overrides the pass default
    {
        auto tex = fakes::colorTexture(0xc00, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        vkenc::GraphicsPass pass;
        pass.colors.push_back(vkenc::Attachment::color(fakes::colorTexture(0xd00)));
        pass.commands.push_back(vkenc::BindDescriptorSet{
            0, VK_NULL_HANDLE,
            {vkenc::TextureUse::sampled(tex, VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT)}, {}});
        auto touches = vkenc::touchedTextures(pass);
        auto* t = findTouch(touches, tex.key(0, 0));
        assert(t && t->stage == VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT);
        std::printf("  declared stage: ok\n");
    }

    // Barrier layout changes, names, timestamps
    {
        auto tex = fakes::colorTexture(0xe00);
        vkenc::PipelineBarrier barrier;
        vkenc::TextureAccess rec;
        rec.key       = tex.key(0, 0);
        rec.dstLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        barrier.textures.push_back(rec);

        vkenc::Command cmd = barrier;
        assert(vkenc::isBarrier(cmd));
        auto changes = vkenc::layoutChanges(cmd);
        assert(changes.size() == 1);
        assert(changes[0].key == tex.key(0, 0));
        assert(changes[0].layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        assert(vkenc::touchedTextures(cmd).empty());
        assert(std::strcmp(vkenc::commandName(cmd), "PipelineBarrier") == 0);

        vkenc::Command ts = vkenc::WriteTimestamp{VK_NULL_HANDLE, 0,
                                                  VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT};
        assert(!vkenc::isBarrier(ts));
        assert(vkenc::layoutChanges(ts).empty());
        assert(vkenc::commandStage(ts) == VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT);
        assert(std::strcmp(vkenc::commandName(ts), "WriteTimestamp") == 0);

        vkenc::Command reset = vkenc::ResetQueryPool{VK_NULL_HANDLE, 0, 2};
        assert(vkenc::commandStage(reset) == VK_PIPELINE_STAGE_2_NONE);
        std::printf("  barrier and query commands: ok\n");
    }

    return 0;
}
