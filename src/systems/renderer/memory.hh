#pragma once

#include "device.hh"

#include <cstddef>
#include <span>
#include <variant>

namespace rune::renderer {

    //_____________________________________
    struct AllocatedBuffer {
        vk::Buffer           handle;
        vk::DeviceAddress    address;
        vk::DeviceSize       size;
        vk::BufferUsageFlags usage;
    };

    struct AllocatedImage {
        vk::Image            handle;
        vk::ImageView        view;
        vk::Extent3D         extent;
        vk::Format           format;
        vk::ImageAspectFlags aspect;
        u32                  mip_levels;
    };

    //_____________________________________
    // A buffer or image together with the allocation backing it. The two
    // handles are only ever freed together.
    struct AllocationUnit {
        std::variant<AllocatedBuffer, AllocatedImage> unit;
        vma::Allocation     allocation;
        vma::AllocationInfo info;

        bool is_buffer() const { return std::holds_alternative<AllocatedBuffer>(unit); }

        const AllocatedBuffer& buffer() const;
        const AllocatedImage&  image()  const;
    };

    //_____________________________________
    class MemoryAllocator {
        public:
            void init(Device& device);
            void destroy();

            AllocationUnit allocate_buffer(
                vk::DeviceSize          size,
                vk::BufferUsageFlags    usage,
                vma::MemoryUsage        memory_usage,
                vk::MemoryPropertyFlags property_flags = {}
            );

            AllocationUnit create_image(
                vk::Extent3D         extent,
                vk::Format           format,
                vk::ImageUsageFlags  usage,
                vk::ImageAspectFlags aspect,
                bool                 mipmapped = false
            );

            // Staged copy of `bytes` into an existing buffer or image. Blocks
            // until the copy has finished on the GPU. Images end up shader
            // readable with every mip level below the first blitted down from it.
            void upload(const AllocationUnit& dst, std::span<const std::byte> bytes);

            AllocationUnit create_buffer_with_data(
                std::span<const std::byte> bytes,
                vk::BufferUsageFlags       usage,
                vma::MemoryUsage           memory_usage   = vma::MemoryUsage::eGpuOnly,
                vk::MemoryPropertyFlags    property_flags = vk::MemoryPropertyFlagBits::eDeviceLocal
            );

            AllocationUnit create_image_with_data(
                std::span<const std::byte> bytes,
                vk::Extent3D               extent,
                vk::Format                 format,
                vk::ImageUsageFlags        usage,
                vk::ImageAspectFlags       aspect,
                bool                       mipmapped = false
            );

            void* map(const AllocationUnit& unit);
            void  unmap(const AllocationUnit& unit);

            vk::DeviceAddress device_address(const AllocationUnit& unit) const;

            // Immediate destruction. Only for units no submitted frame can
            // still reference; everything else goes through a DeletionQueue.
            void destroy(const AllocationUnit& unit);

            void free_buffer(vk::Buffer buffer, vma::Allocation allocation);
            void free_image(vk::Image img, vk::ImageView view, vma::Allocation allocation);

            void immediate_submit(fn<void(vk::CommandBuffer cmd)>&& record);

            Device& device() const { return *_device; }
            u64 live_allocations() const { return _live_allocations; }

        private:
            AllocationUnit allocate_staging(std::span<const std::byte> bytes);

            Device* _device = nullptr;
            u64     _live_allocations = 0;

            struct { vk::Fence         fence;
                     vk::CommandBuffer cmd;
                     vk::CommandPool   pool;
            } immediate;
    };

} // rune::renderer
