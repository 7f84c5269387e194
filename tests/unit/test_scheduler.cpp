#include <vkenc/encoder/scheduler.hpp>

#include "fakes.hpp"

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

namespace {

vkenc::PipelineBarrier textureStub(const vkenc::TextureSlice& t, std::uint32_t mip,
                                   std::uint32_t layer, VkImageLayout dstLayout,
                                   VkAccessFlags2 dstAccess = VK_ACCESS_2_NONE) {
    vkenc::TextureAccess rec;
    rec.key           = t.key(mip, layer);
    rec.aspect        = t.aspect;
    rec.restingLayout = t.restingLayout;
    rec.srcLayout     = t.restingLayout;
    rec.dstLayout     = dstLayout;
    rec.dstAccess     = dstAccess;

    vkenc::PipelineBarrier b;
    b.textures.push_back(rec);
    return b;
}

vkenc::PipelineBarrier bufferStub(const vkenc::BufferSlice& b, VkAccessFlags2 dstAccess) {
    vkenc::BufferAccess rec;
    rec.buffer    = b.buffer;
    rec.dstAccess = dstAccess;

    vkenc::PipelineBarrier barrier;
    barrier.buffers.push_back(rec);
    return barrier;
}

vkenc::ClearTexture clear(const vkenc::TextureSlice& t, VkImageLayout layout) {
    vkenc::ClearTexture c;
    c.texture = t;
    c.layout  = layout;
    return c;
}

vkenc::CopyTextureToBuffer readback(const vkenc::TextureSlice& t, const vkenc::BufferSlice& b) {
    vkenc::CopyTextureToBuffer c;
    c.src = t;
    c.dst = b;
    return c;
}

const vkenc::PipelineBarrier& barrierAt(const std::vector<vkenc::Command>& cmds, std::size_t i) {
    const auto* b = std::get_if<vkenc::PipelineBarrier>(&cmds[i]);
    assert(b != nullptr);
    return *b;
}

bool sameRecords(const vkenc::PipelineBarrier& a, const vkenc::PipelineBarrier& b) {
    if (a.srcStage != b.srcStage || a.dstStage != b.dstStage) return false;
    if (a.textures.size() != b.textures.size() || a.buffers.size() != b.buffers.size())
        return false;
    for (std::size_t i = 0; i < a.textures.size(); ++i) {
        const auto& x = a.textures[i];
        const auto& y = b.textures[i];
        if (!(x.key == y.key) || x.srcAccess != y.srcAccess || x.dstAccess != y.dstAccess ||
            x.srcLayout != y.srcLayout || x.dstLayout != y.dstLayout ||
            x.srcStage != y.srcStage || x.dstStage != y.dstStage)
            return false;
    }
    for (std::size_t i = 0; i < a.buffers.size(); ++i) {
        const auto& x = a.buffers[i];
        const auto& y = b.buffers[i];
        if (x.buffer != y.buffer || x.srcAccess != y.srcAccess || x.dstAccess != y.dstAccess ||
            x.srcStage != y.srcStage || x.dstStage != y.dstStage)
            return false;
    }
    return true;
}

} // namespace

int main() {
    auto tex  = fakes::colorTexture(0x1000);               // rests in GENERAL
    auto buf  = fakes::buffer(0x2000);
    auto buf2 = fakes::buffer(0x3000);

    // Forward pass: sources come from the nearest earlier touch
    {
        std::vector<vkenc::Command> cmds;
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                   VK_ACCESS_2_TRANSFER_WRITE_BIT));
        cmds.push_back(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                                   VK_ACCESS_2_TRANSFER_READ_BIT));
        cmds.push_back(readback(tex, buf));

        auto finalState = vkenc::resolveBarrierSources(cmds);

        const auto& first = barrierAt(cmds, 0).textures[0];
        assert(first.srcStage == VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);
        assert(first.srcAccess == VK_ACCESS_2_NONE);
        assert(first.srcLayout == VK_IMAGE_LAYOUT_GENERAL);
        assert(barrierAt(cmds, 0).srcStage == VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);

        const auto& second = barrierAt(cmds, 2).textures[0];
        assert(second.srcStage == VK_PIPELINE_STAGE_2_CLEAR_BIT);
        assert(second.srcAccess == VK_ACCESS_2_TRANSFER_WRITE_BIT);
        assert(second.srcLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        assert(barrierAt(cmds, 2).srcStage == VK_PIPELINE_STAGE_2_CLEAR_BIT);

        auto it = finalState.textures.find(tex.key(0, 0));
        assert(it != finalState.textures.end());
        assert(it->second.layout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        assert(it->second.restingLayout == VK_IMAGE_LAYOUT_GENERAL);
        assert(!it->second.fromBarrier);
        std::printf("  forward pass: ok\n");
    }

    // Backward pass: destinations come from the nearest later touch
    {
        std::vector<vkenc::Command> cmds;
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                   VK_ACCESS_2_TRANSFER_WRITE_BIT));
        cmds.push_back(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                                   VK_ACCESS_2_TRANSFER_READ_BIT));
        cmds.push_back(readback(tex, buf));
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL));

        (void)vkenc::resolveBarrierSources(cmds);
        vkenc::resolveBarrierDestinations(cmds);

        const auto& first = barrierAt(cmds, 0).textures[0];
        assert(first.dstStage == VK_PIPELINE_STAGE_2_CLEAR_BIT);
        assert(first.dstAccess == VK_ACCESS_2_TRANSFER_WRITE_BIT);
        assert(first.dstLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

        const auto& second = barrierAt(cmds, 2).textures[0];
        assert(second.dstStage == VK_PIPELINE_STAGE_2_COPY_BIT);
        assert(second.dstAccess == VK_ACCESS_2_TRANSFER_READ_BIT);
        assert(barrierAt(cmds, 2).dstStage == VK_PIPELINE_STAGE_2_COPY_BIT);

        // Nothing after the last barrier: BOTTOM_OF_PIPE, dstLayout kept.
        const auto& last = barrierAt(cmds, 4).textures[0];
        assert(last.dstStage == VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);
        assert(last.dstAccess == VK_ACCESS_2_NONE);
        assert(last.dstLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        assert(last.srcStage == VK_PIPELINE_STAGE_2_COPY_BIT);
        assert(last.srcLayout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        std::printf("  backward pass: ok\n");
    }

    // Readers with no barrier between them all feed the next barrier
    {
        auto sampled = fakes::colorTexture(0x4000, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        auto target  = fakes::colorTexture(0x5000, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);

        vkenc::ComputePass compute;
        compute.commands.push_back(vkenc::BindDescriptorSet{
            0, VK_NULL_HANDLE, {vkenc::TextureUse::sampled(sampled)}, {}});

        vkenc::GraphicsPass graphics;
        graphics.colors.push_back(vkenc::Attachment::color(target));
        graphics.commands.push_back(vkenc::BindDescriptorSet{
            0, VK_NULL_HANDLE, {vkenc::TextureUse::sampled(sampled)}, {}});

        std::vector<vkenc::Command> cmds;
        cmds.push_back(compute);
        cmds.push_back(graphics);
        cmds.push_back(textureStub(sampled, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                   VK_ACCESS_2_TRANSFER_WRITE_BIT));
        cmds.push_back(clear(sampled, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));

        (void)vkenc::resolveBarrierSources(cmds);
        const auto& rec = barrierAt(cmds, 2).textures[0];
        assert(rec.srcAccess == VK_ACCESS_2_SHADER_SAMPLED_READ_BIT);
        assert(rec.srcStage & VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT);
        assert(rec.srcStage & VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT);
        assert(rec.srcLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        std::printf("  reader fan-in: ok\n");
    }

    // Back-to-back barriers resolve against each other with ALL_COMMANDS
    {
        std::vector<vkenc::Command> cmds;
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        cmds.push_back(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_GENERAL));
        cmds.push_back(clear(tex, VK_IMAGE_LAYOUT_GENERAL));

        (void)vkenc::resolveBarrierSources(cmds);
        vkenc::resolveBarrierDestinations(cmds);

        const auto& first  = barrierAt(cmds, 0).textures[0];
        const auto& second = barrierAt(cmds, 1).textures[0];
        assert(first.dstStage == VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
        assert(first.dstAccess == VK_ACCESS_2_NONE);
        assert(first.dstLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        assert(second.srcStage == VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
        assert(second.srcAccess == VK_ACCESS_2_NONE);
        assert(second.srcLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        assert(second.dstStage == VK_PIPELINE_STAGE_2_CLEAR_BIT);
        std::printf("  back-to-back barriers: ok\n");
    }

    // Buffer records
    {
        std::vector<vkenc::Command> cmds;
        vkenc::UpdateBuffer update;
        update.dst  = buf;
        update.data = {0, 0, 0, 0};
        cmds.push_back(update);
        cmds.push_back(bufferStub(buf, VK_ACCESS_2_TRANSFER_READ_BIT));
        cmds.push_back(vkenc::CopyBufferToBuffer{buf, buf2});

        (void)vkenc::resolveBarrierSources(cmds);
        vkenc::resolveBarrierDestinations(cmds);

        const auto& rec = barrierAt(cmds, 1).buffers[0];
        assert(rec.srcAccess == VK_ACCESS_2_TRANSFER_WRITE_BIT);
        assert(rec.srcStage == VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT);
        assert(rec.dstAccess == VK_ACCESS_2_TRANSFER_READ_BIT);
        assert(rec.dstStage == VK_PIPELINE_STAGE_2_COPY_BIT);
        std::printf("  buffer records: ok\n");
    }

    // Restore barrier: only subresources away from their resting layout, sorted
    {
        auto cube = fakes::cubemap(0x6000);
        vkenc::TouchTables state;
        for (std::uint32_t layer = 6; layer-- > 0;) {
            vkenc::LastTouch t;
            t.access        = VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;
            t.stage         = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
            t.layout        = layer % 2 == 0 ? VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL
                                             : VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
            t.restingLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
            state.textures[cube.key(0, layer)] = t;
        }

        auto restore = vkenc::buildRestoreBarrier(state);
        assert(restore.has_value());
        assert(restore->textures.size() == 3);
        for (std::size_t i = 0; i < restore->textures.size(); ++i) {
            const auto& rec = restore->textures[i];
            assert(rec.key.layer == i * 2);
            assert(rec.srcLayout == VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
            assert(rec.dstLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
            assert(rec.srcStage == VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
            assert(rec.dstStage == VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);
        }
        assert(restore->srcStage == VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
        assert(restore->dstStage == VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);

        vkenc::TouchTables resting;
        vkenc::LastTouch t;
        t.layout        = VK_IMAGE_LAYOUT_GENERAL;
        t.restingLayout = VK_IMAGE_LAYOUT_GENERAL;
        resting.textures[tex.key(0, 0)] = t;
        assert(!vkenc::buildRestoreBarrier(resting).has_value());
        std::printf("  restore barrier: ok\n");
    }

    // Validation: layout needed without a barrier
    {
        vkenc::CommandList list;
        list.append(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        auto r = list.format();
        assert(!r.ok());
        assert(r.error().operation == "format command list");
        assert(r.error().message.find("TRANSFER_DST_OPTIMAL") != std::string::npos);
        assert(r.error().message.find("GENERAL") != std::string::npos);
        assert(!list.formatted());
        assert(list.size() == 1);
        std::printf("  validation layout conflict: ok\n");
    }

    // Validation: write after write without a barrier
    {
        vkenc::CommandList list;
        list.append(clear(tex, VK_IMAGE_LAYOUT_GENERAL));
        list.append(clear(tex, VK_IMAGE_LAYOUT_GENERAL));
        auto r = list.format();
        assert(!r.ok());
        assert(r.error().message.find("no barrier in between") != std::string::npos);
        assert(r.error().message.find("command 1") != std::string::npos);
        assert(!list.formatted());

        vkenc::CommandList buffers;
        buffers.append(vkenc::CopyBufferToBuffer{buf2, buf});
        buffers.append(vkenc::CopyBufferToBuffer{buf, buf2});
        auto rb = buffers.format();
        assert(!rb.ok());
        assert(rb.error().message.find("buffer") != std::string::npos);
        std::printf("  validation write hazard: ok\n");
    }

    // Validation: one command, one subresource, two layouts
    {
        vkenc::CopyTextureToTexture self;
        self.src = tex;
        self.dst = tex;
        vkenc::CommandList list;
        list.append(self);
        auto r = list.format();
        assert(!r.ok());
        assert(r.error().message.find("two layouts") != std::string::npos);
        std::printf("  validation two layouts: ok\n");
    }

    // Validation: a barrier cannot move a subresource into UNDEFINED
    {
        vkenc::CommandList list;
        list.append(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_UNDEFINED));
        list.append(clear(tex, VK_IMAGE_LAYOUT_GENERAL));
        auto r = list.format();
        assert(!r.ok());
        assert(r.error().operation == "format command list");
        assert(r.error().message.find("into UNDEFINED") != std::string::npos);
        assert(!list.formatted());
        std::printf("  validation undefined target: ok\n");
    }

    // Stub planner: layout changes and hazards produce records
    {
        vkenc::StubPlanner planner;

        auto s1 = planner.plan(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        assert(s1.textures.size() == 1);
        assert(s1.textures[0].dstLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        assert(s1.textures[0].dstAccess == VK_ACCESS_2_TRANSFER_WRITE_BIT);
        assert(s1.srcStage == VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);
        assert(s1.dstStage == VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);

        // Same layout, write after write.
        auto s2 = planner.plan(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        assert(s2.textures.size() == 1);
        assert(s2.textures[0].dstLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

        auto s3 = planner.plan(readback(tex, buf));
        assert(s3.textures.size() == 1);
        assert(s3.textures[0].dstLayout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        assert(s3.buffers.empty());

        // Read after read, fresh buffer: nothing to do.
        auto s4 = planner.plan(readback(tex, buf2));
        assert(s4.empty());

        // Second write into buf.
        auto s5 = planner.plan(readback(tex, buf));
        assert(s5.textures.empty());
        assert(s5.buffers.size() == 1);
        assert(s5.buffers[0].dstAccess == VK_ACCESS_2_TRANSFER_WRITE_BIT);

        assert(planner.currentLayout(tex.key(0, 0), tex.restingLayout) ==
               VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);

        // A barrier command moves the running layout and produces no stub.
        auto s6 = planner.plan(textureStub(tex, 0, 0, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL));
        assert(s6.empty());
        assert(planner.currentLayout(tex.key(0, 0), tex.restingLayout) ==
               VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

        planner.reset();
        assert(planner.currentLayout(tex.key(0, 0), tex.restingLayout) == VK_IMAGE_LAYOUT_GENERAL);
        std::printf("  stub planner: ok\n");
    }

    // CommandList: idempotent format, restore barrier dropped on append
    {
        vkenc::StubPlanner planner;
        vkenc::CommandList list;
        auto push = [&](vkenc::Command c) {
            auto stub = planner.plan(c);
            if (!stub.empty()) list.append(std::move(stub));
            list.append(std::move(c));
        };

        push(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        push(readback(tex, buf));
        assert(list.size() == 4);

        auto r = list.format();
        assert(r.ok());
        assert(list.formatted());
        assert(list.hasRestoreBarrier());
        assert(list.size() == 5);

        std::vector<vkenc::Command> snapshot = list.commands();
        auto again = list.format();
        assert(again.ok());
        assert(list.size() == snapshot.size());
        for (std::size_t i = 0; i < snapshot.size(); ++i) {
            if (auto* b = std::get_if<vkenc::PipelineBarrier>(&snapshot[i]))
                assert(sameRecords(*b, barrierAt(list.commands(), i)));
        }

        const auto& restore = barrierAt(list.commands(), 4).textures[0];
        assert(restore.srcLayout == VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        assert(restore.dstLayout == VK_IMAGE_LAYOUT_GENERAL);
        assert(restore.srcStage == VK_PIPELINE_STAGE_2_COPY_BIT);
        assert(restore.dstStage == VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);

        push(clear(tex, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL));
        assert(!list.formatted());
        assert(!list.hasRestoreBarrier());
        assert(list.size() == 6);

        auto third = list.format();
        assert(third.ok());
        assert(list.size() == 7);
        std::size_t restores = 0;
        for (const auto& c : list.commands()) {
            if (auto* b = std::get_if<vkenc::PipelineBarrier>(&c)) {
                for (const auto& rec : b->textures)
                    if (rec.dstLayout == VK_IMAGE_LAYOUT_GENERAL) ++restores;
            }
        }
        assert(restores == 1);

        list.clear();
        assert(list.empty());
        assert(!list.formatted());
        std::printf("  command list: ok\n");
    }

    return 0;
}
