#include "memory.hh"
#include "image.hh"
#include "log.hh"

#include <cstring>

namespace rune::renderer {

    namespace {
        bool is_null(vma::Allocation allocation) {
            return static_cast<VmaAllocation>(allocation) == nullptr;
        }
    }

    //_____________________________________
    const AllocatedBuffer& AllocationUnit::buffer() const {
        if( auto* buffer = std::get_if<AllocatedBuffer>(&unit) ) { return *buffer; }
        throw Error(ErrorKind::eInvariantViolation, "allocation unit holds an image, not a buffer");
    }

    const AllocatedImage& AllocationUnit::image() const {
        if( auto* img = std::get_if<AllocatedImage>(&unit) ) { return *img; }
        throw Error(ErrorKind::eInvariantViolation, "allocation unit holds a buffer, not an image");
    }

    //_____________________________________
    void MemoryAllocator::init(Device& device) {
        _device = &device;

        vk::CommandPoolCreateInfo pool_info {
            .flags            = vk::CommandPoolCreateFlagBits::eResetCommandBuffer,
            .queueFamilyIndex = device.queue_family(),
        };
        RUNE_VK_CHECK(device.create_command_pool(pool_info, &immediate.pool));

        vk::CommandBufferAllocateInfo cmd_info {
            .commandPool        = immediate.pool,
            .level              = vk::CommandBufferLevel::ePrimary,
            .commandBufferCount = 1,
        };
        RUNE_VK_CHECK(device.allocate_command_buffers(cmd_info, &immediate.cmd));

        vk::FenceCreateInfo fence_info { .flags = vk::FenceCreateFlagBits::eSignaled, };
        RUNE_VK_CHECK(device.create_fence(fence_info, &immediate.fence));
    }

    //_____________________________________
    void MemoryAllocator::destroy() {
        if( _device == nullptr ) { return; }
        _device->destroy(immediate.pool);
        _device->destroy(immediate.fence);
        immediate = {};
        if( _live_allocations != 0 ) {
            log::warn("memory allocator shut down with {} live allocations", _live_allocations);
        }
        _device = nullptr;
    }

    //_____________________________________
    AllocationUnit MemoryAllocator::allocate_buffer(
        vk::DeviceSize          size,
        vk::BufferUsageFlags    usage,
        vma::MemoryUsage        memory_usage,
        vk::MemoryPropertyFlags property_flags
    ) {
        vk::BufferCreateInfo buffer_info {
            .size        = size,
            .usage       = usage,
            .sharingMode = vk::SharingMode::eExclusive,
        };
        vma::AllocationCreateInfo alloc_info {
            .flags         = vma::AllocationCreateFlagBits::eMapped,
            .usage         = memory_usage,
            .requiredFlags = property_flags,
        };

        AllocationUnit out {};
        AllocatedBuffer buffer {
            .size  = size,
            .usage = usage,
        };
        vk::Result result = _device->create_buffer(buffer_info, alloc_info, &buffer.handle, &out.allocation, &out.info);
        if( result != vk::Result::eSuccess ) {
            throw Error(error_kind(result), fmt::format(
                "buffer allocation of {} bytes ({}) failed :: {}",
                size, vk::to_string(usage), vk::to_string(result)
            ));
        }
        if( usage & vk::BufferUsageFlagBits::eShaderDeviceAddress ) {
            buffer.address = _device->buffer_address(buffer.handle);
        }
        out.unit = buffer;
        _live_allocations++;
        return out;
    }

    //_____________________________________
    AllocationUnit MemoryAllocator::create_image(
        vk::Extent3D         extent,
        vk::Format           format,
        vk::ImageUsageFlags  usage,
        vk::ImageAspectFlags aspect,
        bool                 mipmapped
    ) {
        u32 mips = mipmapped ? mip_count(extent) : 1;
        vk::ImageCreateInfo img_info {
            .imageType     = vk::ImageType::e2D,
            .format        = format,
            .extent        = extent,
            .mipLevels     = mips,
            .arrayLayers   = 1,
            .samples       = vk::SampleCountFlagBits::e1,
            .tiling        = vk::ImageTiling::eOptimal,
            .usage         = usage | vk::ImageUsageFlagBits::eTransferSrc | vk::ImageUsageFlagBits::eTransferDst,
            .sharingMode   = vk::SharingMode::eExclusive,
            .initialLayout = vk::ImageLayout::eUndefined,
        };
        vma::AllocationCreateInfo alloc_info {
            .usage         = vma::MemoryUsage::eGpuOnly,
            .requiredFlags = vk::MemoryPropertyFlagBits::eDeviceLocal,
        };

        AllocationUnit out {};
        AllocatedImage img {
            .extent     = extent,
            .format     = format,
            .aspect     = aspect,
            .mip_levels = mips,
        };
        vk::Result result = _device->create_image(img_info, alloc_info, &img.handle, &out.allocation, &out.info);
        if( result != vk::Result::eSuccess ) {
            throw Error(error_kind(result), fmt::format(
                "image allocation {}x{}x{} {} failed :: {}",
                extent.width, extent.height, extent.depth, vk::to_string(format), vk::to_string(result)
            ));
        }

        vk::ImageViewCreateInfo view_info {
            .image      = img.handle,
            .viewType   = vk::ImageViewType::e2D,
            .format     = format,
            .subresourceRange {
                .aspectMask     = aspect,
                .baseMipLevel   = 0,
                .levelCount     = mips,
                .baseArrayLayer = 0,
                .layerCount     = 1,
            },
        };
        result = _device->create_image_view(view_info, &img.view);
        if( result != vk::Result::eSuccess ) {
            _device->destroy_image(img.handle, out.allocation);
            throw Error(error_kind(result), fmt::format(
                "view creation for {} image failed :: {}", vk::to_string(format), vk::to_string(result)
            ));
        }
        out.unit = img;
        _live_allocations++;
        return out;
    }

    //_____________________________________
    AllocationUnit MemoryAllocator::allocate_staging(std::span<const std::byte> bytes) {
        AllocationUnit staging = allocate_buffer(
            bytes.size(),
            vk::BufferUsageFlagBits::eTransferSrc,
            vma::MemoryUsage::eCpuOnly,
            vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
        );
        void* data = map(staging);
        std::memcpy(data, bytes.data(), bytes.size());
        unmap(staging);
        return staging;
    }

    //_____________________________________
    void MemoryAllocator::upload(const AllocationUnit& dst, std::span<const std::byte> bytes) {
        expect("upload of an empty payload", !bytes.empty());
        if( dst.is_buffer() ) {
            const AllocatedBuffer& buffer = dst.buffer();
            if( bytes.size() > buffer.size ) {
                throw Error(ErrorKind::eInvariantViolation, fmt::format(
                    "upload of {} bytes into a {} byte buffer", bytes.size(), buffer.size
                ));
            }
        } else {
            const AllocatedImage& img = dst.image();
            u32 texel = texel_size(img.format);
            if( texel == 0 ) {
                throw Error(ErrorKind::eInvariantViolation, fmt::format(
                    "no upload path for {} images", vk::to_string(img.format)
                ));
            }
            if( img.mip_levels > 1 && img.aspect != vk::ImageAspectFlags(vk::ImageAspectFlagBits::eColor) ) {
                throw Error(ErrorKind::eInvariantViolation, fmt::format(
                    "no mip generation for {} images with aspect {}", vk::to_string(img.format), vk::to_string(img.aspect)
                ));
            }
            u64 needed = (u64)img.extent.width * img.extent.height * img.extent.depth * texel;
            if( bytes.size() < needed ) {
                throw Error(ErrorKind::eInvariantViolation, fmt::format(
                    "image payload of {} bytes, {}x{}x{} {} needs {}",
                    bytes.size(), img.extent.width, img.extent.height, img.extent.depth, vk::to_string(img.format), needed
                ));
            }
        }

        AllocationUnit staging = allocate_staging(bytes);
        try {
            immediate_submit([&](vk::CommandBuffer cmd) {
                std::visit(overloaded {
                    [&](const AllocatedBuffer& buffer) {
                        vk::BufferCopy copy {
                            .srcOffset = 0,
                            .dstOffset = 0,
                            .size      = bytes.size(),
                        };
                        _device->copy_buffer(cmd, staging.buffer().handle, buffer.handle, copy);
                    },
                    [&](const AllocatedImage& img) {
                        transition_img(*_device, cmd, img.handle, vk::ImageLayout::eUndefined, vk::ImageLayout::eTransferDstOptimal, img.aspect);
                        vk::BufferImageCopy copy {
                            .bufferOffset      = 0,
                            .bufferRowLength   = 0,
                            .bufferImageHeight = 0,
                            .imageSubresource {
                                .aspectMask     = img.aspect,
                                .mipLevel       = 0,
                                .baseArrayLayer = 0,
                                .layerCount     = 1,
                            },
                            .imageExtent       = img.extent,
                        };
                        _device->copy_buffer_to_image(cmd, staging.buffer().handle, img.handle, copy);
                        if( img.mip_levels > 1 ) {
                            generate_mipmaps(*_device, cmd, img.handle, vk::Extent2D { img.extent.width, img.extent.height }, img.mip_levels);
                        } else {
                            transition_img(*_device, cmd, img.handle, vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eShaderReadOnlyOptimal, img.aspect);
                        }
                    },
                }, dst.unit);
            });
        } catch( ... ) {
            destroy(staging);
            throw;
        }
        destroy(staging);
    }

    //_____________________________________
    AllocationUnit MemoryAllocator::create_buffer_with_data(
        std::span<const std::byte> bytes,
        vk::BufferUsageFlags       usage,
        vma::MemoryUsage           memory_usage,
        vk::MemoryPropertyFlags    property_flags
    ) {
        AllocationUnit buffer = allocate_buffer(bytes.size(), usage | vk::BufferUsageFlagBits::eTransferDst, memory_usage, property_flags);
        try {
            upload(buffer, bytes);
        } catch( ... ) {
            destroy(buffer);
            throw;
        }
        return buffer;
    }

    //_____________________________________
    AllocationUnit MemoryAllocator::create_image_with_data(
        std::span<const std::byte> bytes,
        vk::Extent3D               extent,
        vk::Format                 format,
        vk::ImageUsageFlags        usage,
        vk::ImageAspectFlags       aspect,
        bool                       mipmapped
    ) {
        AllocationUnit img = create_image(extent, format, usage, aspect, mipmapped);
        try {
            upload(img, bytes);
        } catch( ... ) {
            destroy(img);
            throw;
        }
        return img;
    }

    //_____________________________________
    void* MemoryAllocator::map(const AllocationUnit& unit) {
        void* data = nullptr;
        vk::Result result = _device->map_memory(unit.allocation, &data);
        if( result != vk::Result::eSuccess ) {
            throw Error(error_kind(result), fmt::format("mapping {} memory failed :: {}",
                unit.is_buffer() ? "buffer" : "image", vk::to_string(result)));
        }
        return data;
    }

    void MemoryAllocator::unmap(const AllocationUnit& unit) {
        _device->unmap_memory(unit.allocation);
    }

    //_____________________________________
    vk::DeviceAddress MemoryAllocator::device_address(const AllocationUnit& unit) const {
        const AllocatedBuffer& buffer = unit.buffer();
        if( !(buffer.usage & vk::BufferUsageFlagBits::eShaderDeviceAddress) ) {
            throw Error(ErrorKind::eInvariantViolation, fmt::format(
                "device address of a buffer created without eShaderDeviceAddress ({})", vk::to_string(buffer.usage)
            ));
        }
        return buffer.address;
    }

    //_____________________________________
    void MemoryAllocator::destroy(const AllocationUnit& unit) {
        std::visit(overloaded {
            [&](const AllocatedBuffer& buffer) { free_buffer(buffer.handle, unit.allocation); },
            [&](const AllocatedImage& img)     { free_image(img.handle, img.view, unit.allocation); },
        }, unit.unit);
    }

    void MemoryAllocator::free_buffer(vk::Buffer buffer, vma::Allocation allocation) {
        expect("buffer freed without its allocation", !is_null(allocation));
        _device->destroy_buffer(buffer, allocation);
        _live_allocations--;
    }

    void MemoryAllocator::free_image(vk::Image img, vk::ImageView view, vma::Allocation allocation) {
        expect("image freed without its allocation", !is_null(allocation));
        if( view ) { _device->destroy(view); }
        _device->destroy_image(img, allocation);
        _live_allocations--;
    }

    //_____________________________________
    void MemoryAllocator::immediate_submit(fn<void(vk::CommandBuffer cmd)>&& record) {
        RUNE_VK_CHECK(_device->reset_fence(immediate.fence));
        RUNE_VK_CHECK(_device->reset(immediate.cmd));
        RUNE_VK_CHECK(_device->begin(immediate.cmd, vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        {
            record(immediate.cmd);
        }
        RUNE_VK_CHECK(_device->end(immediate.cmd));
        vk::CommandBufferSubmitInfo cmd_info {
            .commandBuffer = immediate.cmd,
            .deviceMask    = 0,
        };
        vk::SubmitInfo2 submit {
            .commandBufferInfoCount = 1,
            .pCommandBufferInfos    = &cmd_info,
        };
        RUNE_VK_CHECK(_device->submit(submit, immediate.fence));
        RUNE_VK_CHECK(_device->wait_for_fence(immediate.fence, UINT64_MAX));
    }

} // rune::renderer
