#include "deletion_queue.hh"

namespace rune::renderer {

    namespace {
        bool is_null(vma::Allocation allocation) {
            return static_cast<VmaAllocation>(allocation) == nullptr;
        }
    }

    //_____________________________________
    void DeletionQueue::push(DeletionTask&& task) {
        std::visit(overloaded {
            [](const DeviceDeletion&) {},
            [](const BufferDeletion& deletion) {
                expect("buffer deletion queued without its allocation", !is_null(deletion.allocation));
            },
            [](const ImageDeletion& deletion) {
                expect("image deletion queued without its allocation", !is_null(deletion.allocation));
            },
        }, task);
        tasks.push_back(std::move(task));
    }

    void DeletionQueue::push(const AllocationUnit& unit) {
        std::visit(overloaded {
            [&](const AllocatedBuffer& buffer) {
                push(BufferDeletion { .buffer = buffer.handle, .allocation = unit.allocation });
            },
            [&](const AllocatedImage& img) {
                push(ImageDeletion { .img = img.handle, .view = img.view, .allocation = unit.allocation });
            },
        }, unit.unit);
    }

    //_____________________________________
    void DeletionQueue::flush(Device& device, MemoryAllocator& allocator) {
        while( !tasks.empty() ) {
            DeletionTask task = std::move(tasks.front());
            tasks.pop_front();
            std::visit(overloaded {
                [&](const DeviceDeletion& deletion) {
                    std::visit([&](auto handle) { device.destroy(handle); }, deletion.object);
                },
                [&](const BufferDeletion& deletion) {
                    allocator.free_buffer(deletion.buffer, deletion.allocation);
                },
                [&](const ImageDeletion& deletion) {
                    if( deletion.view ) { device.destroy(deletion.view); }
                    allocator.free_image(deletion.img, vk::ImageView {}, deletion.allocation);
                },
            }, task);
        }
    }

} // rune::renderer
