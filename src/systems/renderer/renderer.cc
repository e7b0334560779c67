#include "renderer.hh"
#include "log.hh"

#include <array>
#include <chrono>

namespace rune::renderer {

    //_____________________________________
    void Renderer::init(Device& device, Swapchain& swapchain, const Config& config, fn<void(Swapchain&)>&& rebuild) {
        expect("frames in flight must be between 1 and MAX_FRAMES_IN_FLIGHT",
            config.frames_in_flight >= 1 && config.frames_in_flight <= MAX_FRAMES_IN_FLIGHT
        );
        _device        = &device;
        _swapchain     = &swapchain;
        _rebuild       = std::move(rebuild);
        _fence_timeout = config.fence_timeout_ns;

        _memory.init(device);
        frames = std::vector<FrameData>(config.frames_in_flight);

        build_command_structures();
        build_sync_structures();
        build_descriptors(config);

        log::info("renderer ready, {} frames in flight", frames.size());
    }

    //_____________________________________
    void Renderer::build_command_structures() {
        vk::CommandPoolCreateInfo cmd_pool_info {
            .flags            = vk::CommandPoolCreateFlagBits::eResetCommandBuffer,
            .queueFamilyIndex = _device->queue_family(),
        };
        for( auto& frame : frames ) {
            RUNE_VK_CHECK(_device->create_command_pool(cmd_pool_info, &frame.cmd.pool));
            vk::CommandBufferAllocateInfo cmd_buffer_info {
                .commandPool        = frame.cmd.pool,
                .level              = vk::CommandBufferLevel::ePrimary,
                .commandBufferCount = 1,
            };
            RUNE_VK_CHECK(_device->allocate_command_buffers(cmd_buffer_info, &frame.cmd.buffer));
            RUNE_VK_CHECK(_device->allocate_command_buffers(cmd_buffer_info, &frame.cmd.ui));
        }
    }

    //_____________________________________
    void Renderer::build_sync_structures() {
        vk::FenceCreateInfo     fence_info     { .flags = vk::FenceCreateFlagBits::eSignaled, };
        vk::SemaphoreCreateInfo semaphore_info { .flags = vk::SemaphoreCreateFlags(), };

        for( auto& frame : frames ) {
            RUNE_VK_CHECK(_device->create_fence(fence_info, &frame.fence));
            RUNE_VK_CHECK(_device->create_semaphore(semaphore_info, &frame.swap_semaphore  ));
            RUNE_VK_CHECK(_device->create_semaphore(semaphore_info, &frame.render_semaphore));
        }
    }

    //_____________________________________
    void Renderer::build_descriptors(const Config& config) {
        std::array<PoolSizeRatio, 2> sizes {{
            { vk::DescriptorType::eStorageImage,  1 },
            { vk::DescriptorType::eUniformBuffer, 1 },
        }};
        _descriptors.init(*_device, config.global_descriptor_sets, sizes);

        std::array<PoolSizeRatio, 4> frame_sizes {{
            { vk::DescriptorType::eStorageImage,         3 },
            { vk::DescriptorType::eStorageBuffer,        3 },
            { vk::DescriptorType::eUniformBuffer,        3 },
            { vk::DescriptorType::eCombinedImageSampler, 4 },
        }};
        for( auto& frame : frames ) {
            frame.descriptors.init(*_device, config.frame_descriptor_sets, frame_sizes);
        }
    }

    //_____________________________________
    void Renderer::rebuild_swapchain() {
        RUNE_VK_CHECK(_device->wait_idle());
        _rebuild(*_swapchain);
        _swapchain->request_resize = false;
        _stats.swapchain_rebuilds++;
        log::debug("swapchain rebuilt at {}x{}", _swapchain->extent.width, _swapchain->extent.height);
    }

    //_____________________________________
    FrameResult Renderer::draw(const fn<void(FrameContext&)>& record) {
        auto start = std::chrono::steady_clock::now();

        if( _swapchain->request_resize ) { rebuild_swapchain(); }

        u32 slot = (u32)(current_frame % frames.size());
        FrameData& frame = frames[slot];

        vk::Result waited = _device->wait_for_fence(frame.fence, _fence_timeout);
        if( waited == vk::Result::eTimeout ) {
            throw Error(ErrorKind::eTimeout, fmt::format(
                "frame {} (slot {}) still on the GPU after {} ns", current_frame, slot, _fence_timeout
            ));
        }
        RUNE_VK_CHECK(waited);
        frame.state = FrameState::eIdle;

        frame.deletion_queue.flush(*_device, _memory);
        frame.descriptors.reset_descriptors();

        frame.state = FrameState::eAcquiring;
        u32 img_index = 0;
        vk::Result acquired = _device->acquire_next_image(_swapchain->handle, _fence_timeout, frame.swap_semaphore, &img_index);
        if( acquired == vk::Result::eErrorOutOfDateKHR ) {
            _swapchain->request_resize = true;
            frame.state = FrameState::eIdle;
            return FrameResult::eSkipped;
        }
        if( acquired == vk::Result::eSuboptimalKHR ) {
            _swapchain->request_resize = true;
        } else {
            RUNE_VK_CHECK(acquired);
        }

        frame.state = FrameState::eRecording;
        RUNE_VK_CHECK(_device->reset(frame.cmd.buffer));
        RUNE_VK_CHECK(_device->reset(frame.cmd.ui));
        RUNE_VK_CHECK(_device->begin(frame.cmd.buffer, vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        RUNE_VK_CHECK(_device->begin(frame.cmd.ui,     vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        {
            FrameContext ctx {
                .frame        = frame,
                .slot         = slot,
                .frame_number = current_frame,
                .img_index    = img_index,
                .swap_img     = _swapchain->images.at(img_index),
                .swap_view    = _swapchain->img_views.at(img_index),
                .extent       = _swapchain->extent,
            };
            record(ctx);
        }
        RUNE_VK_CHECK(_device->end(frame.cmd.buffer));
        RUNE_VK_CHECK(_device->end(frame.cmd.ui));

        std::array<vk::CommandBufferSubmitInfo, 2> cmd_infos {{
            { .commandBuffer = frame.cmd.buffer, .deviceMask = 0, },
            { .commandBuffer = frame.cmd.ui,     .deviceMask = 0, },
        }};

        vk::SemaphoreSubmitInfo wait_info {
            .semaphore   = frame.swap_semaphore,
            .value       = 1,
            .stageMask   = vk::PipelineStageFlagBits2::eColorAttachmentOutput | vk::PipelineStageFlagBits2::eAllTransfer,
            .deviceIndex = 0,
        };

        vk::SemaphoreSubmitInfo signal_info {
            .semaphore   = frame.render_semaphore,
            .value       = 1,
            .stageMask   = vk::PipelineStageFlagBits2::eAllGraphics,
            .deviceIndex = 0,
        };

        vk::SubmitInfo2 submit {
            .waitSemaphoreInfoCount   = 1,
            .pWaitSemaphoreInfos      = &wait_info,
            .commandBufferInfoCount   = (u32)cmd_infos.size(),
            .pCommandBufferInfos      = cmd_infos.data(),
            .signalSemaphoreInfoCount = 1,
            .pSignalSemaphoreInfos    = &signal_info,
        };
        // Reset only once nothing can throw before the submit that signals it again.
        RUNE_VK_CHECK(_device->reset_fence(frame.fence));
        RUNE_VK_CHECK(_device->submit(submit, frame.fence));
        frame.state = FrameState::eSubmitted;

        vk::PresentInfoKHR present_info {
            .waitSemaphoreCount = 1,
            .pWaitSemaphores    = &frame.render_semaphore,
            .swapchainCount     = 1,
            .pSwapchains        = &_swapchain->handle,
            .pImageIndices      = &img_index,
        };
        vk::Result presented = _device->present(present_info);
        if( presented == vk::Result::eErrorOutOfDateKHR || presented == vk::Result::eSuboptimalKHR ) {
            _swapchain->request_resize = true;
        } else {
            RUNE_VK_CHECK(presented);
        }

        current_frame++;
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        _stats.frame_number = current_frame;
        _stats.frametime    = elapsed.count() / 1000.f;
        return FrameResult::ePresented;
    }

    //_____________________________________
    void Renderer::terminate() {
        if( _device == nullptr ) { return; }

        for( auto& frame : frames ) {
            if( frame.state == FrameState::eSubmitted ) {
                RUNE_VK_CHECK(_device->wait_for_fence(frame.fence, UINT64_MAX));
                frame.state = FrameState::eIdle;
            }
        }
        RUNE_VK_CHECK(_device->wait_idle());

        for( auto& frame : frames ) {
            frame.deletion_queue.flush(*_device, _memory);
            frame.descriptors.destroy_pools();
            _device->destroy(frame.cmd.pool);
            _device->destroy(frame.fence);
            _device->destroy(frame.swap_semaphore);
            _device->destroy(frame.render_semaphore);
        }
        frames.clear();

        _deletion_queue.flush(*_device, _memory);
        _descriptors.destroy_pools();
        _memory.destroy();
        _device = nullptr;
        log::info("renderer shut down after {} frames", current_frame);
    }

} // rune::renderer
