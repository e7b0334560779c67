#pragma once
#include "memory.hh"

#include <deque>
#include <variant>

namespace rune::renderer {

    //_____________________________________
    // Objects owned by the device alone.
    using DeviceObject = std::variant<
        vk::ImageView,
        vk::DescriptorPool,
        vk::DescriptorSetLayout,
        vk::CommandPool,
        vk::Fence,
        vk::Semaphore
    >;

    struct DeviceDeletion {
        DeviceObject object;
    };

    struct BufferDeletion {
        vk::Buffer      buffer;
        vma::Allocation allocation;
    };

    struct ImageDeletion {
        vk::Image       img;
        vk::ImageView   view;
        vma::Allocation allocation;
    };

    // needs device / needs allocator / needs both
    using DeletionTask = std::variant<DeviceDeletion, BufferDeletion, ImageDeletion>;

    //_____________________________________
    // Destruction deferred until the GPU is known to be done with the
    // resources. Tasks run in the order they were pushed.
    class DeletionQueue {
        public:
            void push(DeletionTask&& task);
            void push(const AllocationUnit& unit);
            void push(DeviceObject object) { push(DeviceDeletion { object }); }

            void flush(Device& device, MemoryAllocator& allocator);

            bool empty() const { return tasks.empty(); }
            size_t size() const { return tasks.size(); }

        private:
            std::deque<DeletionTask> tasks;
    };

} // rune::renderer
