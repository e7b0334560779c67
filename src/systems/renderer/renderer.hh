#pragma once
#include "vulkan.hh"
#include "config.hh"
#include "memory.hh"
#include "descriptors.hh"
#include "deletion_queue.hh"
#include "frame.hh"
#include "swapchain.hh"

#include <vector>

namespace rune::renderer {

    //_____________________________________
    // What a recording callback gets for the frame being built.
    struct FrameContext {
        FrameData&    frame;
        u32           slot;
        u64           frame_number;
        u32           img_index;
        vk::Image     swap_img;
        vk::ImageView swap_view;
        vk::Extent2D  extent;
    };

    enum class FrameResult {
        ePresented,
        eSkipped,
    };

    struct FrameStats {
        u64 frame_number       = 0;
        f32 frametime          = 0.f;
        u32 swapchain_rebuilds = 0;
    };

    //_____________________________________
    // Drives the frame ring: wait, reclaim, acquire, record, submit, present.
    class Renderer {
        public:
            void init(Device& device, Swapchain& swapchain, const Config& config, fn<void(Swapchain&)>&& rebuild);

            FrameResult draw(const fn<void(FrameContext&)>& record);

            void terminate();

            Device&              device()         { return *_device;        }
            MemoryAllocator&     memory()         { return _memory;         }
            DescriptorAllocator& descriptors()    { return _descriptors;    }
            DeletionQueue&       deletion_queue() { return _deletion_queue; }

            FrameData&        frame(u32 slot)        { return frames.at(slot); }
            u32               frames_in_flight() const { return (u32)frames.size(); }
            u64               frame_number()     const { return current_frame; }
            const FrameStats& stats()            const { return _stats; }

        private:
            void build_command_structures();
            void build_sync_structures();
            void build_descriptors(const Config& config);
            void rebuild_swapchain();

            Device*               _device    = nullptr;
            Swapchain*            _swapchain = nullptr;
            fn<void(Swapchain&)>  _rebuild;
            u64                   _fence_timeout = UINT64_MAX;

            MemoryAllocator       _memory;
            DescriptorAllocator   _descriptors;
            DeletionQueue         _deletion_queue;

            std::vector<FrameData> frames;
            u64                    current_frame = 0;
            FrameStats             _stats;
    };

} // rune::renderer
