#pragma once

#include "vulkan.hh"

#include <span>

namespace rune::renderer {

    //_____________________________________
    // Every native call the renderer core issues. VulkanDevice forwards
    // these to vulkan.hpp and VMA; anything else implementing it stands in
    // for the GPU.
    class Device {
        public:
            virtual ~Device() {};

            virtual u32 queue_family() const = 0;

            // memory
            virtual vk::Result create_buffer(
                const vk::BufferCreateInfo&      buffer_info,
                const vma::AllocationCreateInfo& alloc_info,
                vk::Buffer*                      buffer,
                vma::Allocation*                 allocation,
                vma::AllocationInfo*             info
            ) = 0;
            virtual void destroy_buffer(vk::Buffer buffer, vma::Allocation allocation) = 0;

            virtual vk::Result create_image(
                const vk::ImageCreateInfo&       img_info,
                const vma::AllocationCreateInfo& alloc_info,
                vk::Image*                       img,
                vma::Allocation*                 allocation,
                vma::AllocationInfo*             info
            ) = 0;
            virtual void destroy_image(vk::Image img, vma::Allocation allocation) = 0;

            virtual vk::Result map_memory(vma::Allocation allocation, void** data) = 0;
            virtual void unmap_memory(vma::Allocation allocation) = 0;
            virtual vk::DeviceAddress buffer_address(vk::Buffer buffer) = 0;

            // device objects
            virtual vk::Result create_image_view(const vk::ImageViewCreateInfo& info, vk::ImageView* view) = 0;
            virtual vk::Result create_descriptor_pool(const vk::DescriptorPoolCreateInfo& info, vk::DescriptorPool* pool) = 0;
            virtual vk::Result create_descriptor_set_layout(const vk::DescriptorSetLayoutCreateInfo& info, vk::DescriptorSetLayout* layout) = 0;
            virtual vk::Result allocate_descriptor_sets(const vk::DescriptorSetAllocateInfo& info, vk::DescriptorSet* sets) = 0;
            virtual void reset_descriptor_pool(vk::DescriptorPool pool) = 0;
            virtual void update_descriptor_sets(std::span<const vk::WriteDescriptorSet> writes) = 0;
            virtual vk::Result create_command_pool(const vk::CommandPoolCreateInfo& info, vk::CommandPool* pool) = 0;
            virtual vk::Result allocate_command_buffers(const vk::CommandBufferAllocateInfo& info, vk::CommandBuffer* buffers) = 0;
            virtual vk::Result create_fence(const vk::FenceCreateInfo& info, vk::Fence* fence) = 0;
            virtual vk::Result create_semaphore(const vk::SemaphoreCreateInfo& info, vk::Semaphore* semaphore) = 0;

            virtual void destroy(vk::ImageView view) = 0;
            virtual void destroy(vk::DescriptorPool pool) = 0;
            virtual void destroy(vk::DescriptorSetLayout layout) = 0;
            virtual void destroy(vk::CommandPool pool) = 0;
            virtual void destroy(vk::Fence fence) = 0;
            virtual void destroy(vk::Semaphore semaphore) = 0;

            // sync
            virtual vk::Result wait_for_fence(vk::Fence fence, u64 timeout) = 0;
            virtual vk::Result reset_fence(vk::Fence fence) = 0;
            virtual vk::Result wait_idle() = 0;

            // recording
            virtual vk::Result begin(vk::CommandBuffer cmd, vk::CommandBufferUsageFlags flags) = 0;
            virtual vk::Result end(vk::CommandBuffer cmd) = 0;
            virtual vk::Result reset(vk::CommandBuffer cmd) = 0;
            virtual void copy_buffer(vk::CommandBuffer cmd, vk::Buffer src, vk::Buffer dst, const vk::BufferCopy& region) = 0;
            virtual void copy_buffer_to_image(vk::CommandBuffer cmd, vk::Buffer src, vk::Image dst, const vk::BufferImageCopy& region) = 0;
            virtual void pipeline_barrier(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency) = 0;
            virtual void blit_image(vk::CommandBuffer cmd, const vk::BlitImageInfo2& blit) = 0;
            virtual void clear_color_image(vk::CommandBuffer cmd, vk::Image img, vk::ImageLayout layout, const vk::ClearColorValue& color) = 0;

            // queue
            virtual vk::Result submit(const vk::SubmitInfo2& submit, vk::Fence fence) = 0;
            virtual vk::Result acquire_next_image(vk::SwapchainKHR swapchain, u64 timeout, vk::Semaphore semaphore, u32* index) = 0;
            virtual vk::Result present(const vk::PresentInfoKHR& present) = 0;
    };

} // rune::renderer
