#include "render_system.hh"
#include "engine.hh"
#include "window.hh"
#include "image.hh"
#include "log.hh"

#include <array>
#include <cmath>
#include <cstring>

namespace rune::renderer {

    //_____________________________________
    void RenderSystem::init() {
        window = expect("render system needs a window system", core->get<Window>());
        const Config& config = core->config;

        try {
            context.init(config, window->handle);
            build_swapchain(context, window->handle, config.vsync, swapchain);

            renderer.init(context, swapchain, config, [this](Swapchain& target) {
                rebuild_swapchain(context, window->handle, core->config.vsync, target);
                renderer.memory().destroy(draw_image);
                build_draw_image(target.extent);
            });
            build_draw_image(swapchain.extent);

            globals_layout = DescriptorLayoutBuilder {}
                .add_binding(0, vk::DescriptorType::eUniformBuffer)
                .build(context, vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment);
            renderer.deletion_queue().push(globals_layout);

            overlay.init(context, renderer, swapchain, window->handle);
        } catch( ... ) {
            release();
            throw;
        }
    }

    //_____________________________________
    void RenderSystem::build_draw_image(vk::Extent2D extent) {
        draw_image = renderer.memory().create_image(
            vk::Extent3D { extent.width, extent.height, 1 },
            vk::Format::eR16G16B16A16Sfloat,
            vk::ImageUsageFlagBits::eStorage | vk::ImageUsageFlagBits::eColorAttachment,
            vk::ImageAspectFlagBits::eColor
        );
    }

    //_____________________________________
    void RenderSystem::tick() {
        if( window->resized ) {
            swapchain.request_resize = true;
            window->resized = false;
        }
        renderer.draw([this](FrameContext& ctx) { record(ctx); });
    }

    //_____________________________________
    void RenderSystem::record(FrameContext& ctx) {
        f32 time = (f32)window->time();

        FrameGlobals globals {
            .clear_color = glm::vec4 { .1f, .1f * std::abs(std::sin(time)), .2f, 1.f },
            .time        = glm::vec4 { time, (f32)ctx.frame_number, 0.f, 0.f },
        };
        AllocationUnit globals_buffer = renderer.memory().allocate_buffer(
            sizeof(FrameGlobals),
            vk::BufferUsageFlagBits::eUniformBuffer,
            vma::MemoryUsage::eCpuToGpu
        );
        ctx.frame.deletion_queue.push(globals_buffer);
        std::memcpy(expect("globals buffer is not mapped", globals_buffer.info.pMappedData), &globals, sizeof(FrameGlobals));

        vk::DescriptorSet globals_set = ctx.frame.descriptors.allocate(globals_layout);
        DescriptorWriter {}
            .write_buffer(0, globals_buffer.buffer().handle, sizeof(FrameGlobals), 0, vk::DescriptorType::eUniformBuffer)
            .update_set(context, globals_set);

        const AllocatedImage& draw = draw_image.image();
        vk::CommandBuffer cmd = ctx.frame.cmd.buffer;

        transition_img(context, cmd, draw.handle, vk::ImageLayout::eUndefined, vk::ImageLayout::eTransferDstOptimal);
        vk::ClearColorValue clear {
            .float32 = std::array<f32, 4> { globals.clear_color.r, globals.clear_color.g, globals.clear_color.b, globals.clear_color.a },
        };
        context.clear_color_image(cmd, draw.handle, vk::ImageLayout::eTransferDstOptimal, clear);
        transition_img(context, cmd, draw.handle, vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eTransferSrcOptimal);

        transition_img(context, cmd, ctx.swap_img, vk::ImageLayout::eUndefined, vk::ImageLayout::eTransferDstOptimal);
        copy_img_to_img(context, cmd, draw.handle, ctx.swap_img, vk::Extent2D { draw.extent.width, draw.extent.height }, ctx.extent);
        transition_img(context, cmd, ctx.swap_img, vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eColorAttachmentOptimal);

        overlay.record(ctx, ctx.frame.cmd.ui);
        transition_img(context, ctx.frame.cmd.ui, ctx.swap_img, vk::ImageLayout::eColorAttachmentOptimal, vk::ImageLayout::ePresentSrcKHR);
    }

    //_____________________________________
    void RenderSystem::terminate() {
        release();
    }

    //_____________________________________
    // Tears down whatever init got around to building.
    void RenderSystem::release() {
        if( context.handle ) {
            RUNE_VK_CHECK(context.wait_idle());
        }
        overlay.terminate();
        if( draw_image.allocation ) {
            renderer.deletion_queue().push(draw_image);
            draw_image = {};
        }
        renderer.terminate();
        destroy_swapchain(context, swapchain);
        context.terminate();
    }

} // rune::renderer
