#pragma once
#include "device.hh"
#include "config.hh"

#include <vector>

struct GLFWwindow;

namespace rune::renderer {

    //_____________________________________
    // The GPU context: owns instance, surface, device, queue and the VMA
    // allocator. Everything else holds a reference to it.
    class VulkanDevice : public Device {
        public:
            void init(const Config& config, GLFWwindow* window);
            void terminate();

            u32 queue_family() const override { return graphics_queue.family; }

            vk::Result create_buffer(
                const vk::BufferCreateInfo&      buffer_info,
                const vma::AllocationCreateInfo& alloc_info,
                vk::Buffer*                      buffer,
                vma::Allocation*                 allocation,
                vma::AllocationInfo*             info
            ) override;
            void destroy_buffer(vk::Buffer buffer, vma::Allocation allocation) override;

            vk::Result create_image(
                const vk::ImageCreateInfo&       img_info,
                const vma::AllocationCreateInfo& alloc_info,
                vk::Image*                       img,
                vma::Allocation*                 allocation,
                vma::AllocationInfo*             info
            ) override;
            void destroy_image(vk::Image img, vma::Allocation allocation) override;

            vk::Result map_memory(vma::Allocation allocation, void** data) override;
            void unmap_memory(vma::Allocation allocation) override;
            vk::DeviceAddress buffer_address(vk::Buffer buffer) override;

            vk::Result create_image_view(const vk::ImageViewCreateInfo& info, vk::ImageView* view) override;
            vk::Result create_descriptor_pool(const vk::DescriptorPoolCreateInfo& info, vk::DescriptorPool* pool) override;
            vk::Result create_descriptor_set_layout(const vk::DescriptorSetLayoutCreateInfo& info, vk::DescriptorSetLayout* layout) override;
            vk::Result allocate_descriptor_sets(const vk::DescriptorSetAllocateInfo& info, vk::DescriptorSet* sets) override;
            void reset_descriptor_pool(vk::DescriptorPool pool) override;
            void update_descriptor_sets(std::span<const vk::WriteDescriptorSet> writes) override;
            vk::Result create_command_pool(const vk::CommandPoolCreateInfo& info, vk::CommandPool* pool) override;
            vk::Result allocate_command_buffers(const vk::CommandBufferAllocateInfo& info, vk::CommandBuffer* buffers) override;
            vk::Result create_fence(const vk::FenceCreateInfo& info, vk::Fence* fence) override;
            vk::Result create_semaphore(const vk::SemaphoreCreateInfo& info, vk::Semaphore* semaphore) override;

            void destroy(vk::ImageView view) override;
            void destroy(vk::DescriptorPool pool) override;
            void destroy(vk::DescriptorSetLayout layout) override;
            void destroy(vk::CommandPool pool) override;
            void destroy(vk::Fence fence) override;
            void destroy(vk::Semaphore semaphore) override;

            vk::Result wait_for_fence(vk::Fence fence, u64 timeout) override;
            vk::Result reset_fence(vk::Fence fence) override;
            vk::Result wait_idle() override;

            vk::Result begin(vk::CommandBuffer cmd, vk::CommandBufferUsageFlags flags) override;
            vk::Result end(vk::CommandBuffer cmd) override;
            vk::Result reset(vk::CommandBuffer cmd) override;
            void copy_buffer(vk::CommandBuffer cmd, vk::Buffer src, vk::Buffer dst, const vk::BufferCopy& region) override;
            void copy_buffer_to_image(vk::CommandBuffer cmd, vk::Buffer src, vk::Image dst, const vk::BufferImageCopy& region) override;
            void pipeline_barrier(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency) override;
            void blit_image(vk::CommandBuffer cmd, const vk::BlitImageInfo2& blit) override;
            void clear_color_image(vk::CommandBuffer cmd, vk::Image img, vk::ImageLayout layout, const vk::ClearColorValue& color) override;

            vk::Result submit(const vk::SubmitInfo2& submit, vk::Fence fence) override;
            vk::Result acquire_next_image(vk::SwapchainKHR swapchain, u64 timeout, vk::Semaphore semaphore, u32* index) override;
            vk::Result present(const vk::PresentInfoKHR& present) override;

            vk::Instance               instance;
            vk::DebugUtilsMessengerEXT messenger;
            vk::SurfaceKHR             surface;
            vk::PhysicalDevice         phys_device;
            vk::Device                 handle;

            struct { vk::Queue handle;
                     u32       family = 0;
            } graphics_queue;

            vma::Allocator             allocator;

        private:
            void create_instance(const Config& config);
            void pick_physical_device();
            void create_device();
            void create_allocator();

            std::vector<const char*> layers;
    };

} // rune::renderer
