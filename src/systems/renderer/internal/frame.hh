#pragma once
#include "vulkan.hh"
#include "descriptors.hh"
#include "deletion_queue.hh"

namespace rune::renderer {

    enum class FrameState {
        eIdle,
        eAcquiring,
        eRecording,
        eSubmitted,
    };

    //_____________________________________
    // One slot of the frame ring. Everything in here is reused every
    // frames_in_flight frames, once the slot's fence has signaled.
    struct FrameData {
        struct { vk::CommandPool   pool;
                 vk::CommandBuffer buffer;
                 vk::CommandBuffer ui;
        } cmd;
        vk::Fence           fence;
        vk::Semaphore       render_semaphore;
        vk::Semaphore       swap_semaphore;
        DescriptorAllocator descriptors;
        DeletionQueue       deletion_queue;
        FrameState          state = FrameState::eIdle;
    };

} // rune::renderer
