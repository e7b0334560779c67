#pragma once
#include "device.hh"

#include <cstddef>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rune::test {

    using namespace rune::renderer;

    //_____________________________________
    // Device that keeps every object as an id in a table and logs each call.
    // Buffers and images are backed by byte vectors so uploads and mapped
    // writes can be read back. Misuse that a real driver would not report
    // (freeing a buffer with someone else's allocation, destroying a
    // resource a pending submission still references) lands in `violations`.
    class FakeDevice : public Device {
        public:
            struct BufferRecord {
                vk::DeviceSize         size;
                vk::BufferUsageFlags   usage;
                u64                    allocation;
                bool                   host_visible;
                std::vector<std::byte> bytes;
            };

            struct ImageRecord {
                vk::Extent3D           extent;
                vk::Format             format;
                vk::ImageUsageFlags    usage;
                u64                    allocation;
                std::vector<std::byte> bytes;
            };

            struct PoolRecord {
                u32 max_sets;
                u32 allocated = 0;
                u32 resets    = 0;
            };

            struct FenceRecord {
                bool signaled;
                bool pending = false;
            };

            struct WriteRecord {
                u64                set;
                u32                binding;
                vk::DescriptorType type;
                vk::Buffer         buffer;
                vk::DeviceSize     range;
                vk::ImageView      view;
            };

            struct ImageCopyRecord {
                u64                 image;
                vk::BufferImageCopy region;
            };

            struct BarrierRecord {
                u64                  image;
                vk::ImageLayout      from;
                vk::ImageLayout      to;
                vk::ImageAspectFlags aspect;
                u32                  base_mip;
                u32                  mip_levels;
            };

            struct BlitRecord {
                u64            src;
                u64            dst;
                vk::ImageBlit2 region;
            };

            struct SubmitRecord {
                u32 cmd_count;
                u32 wait_count;
                u32 signal_count;
                u64 fence;
            };

            u32 queue_family() const override { return 0; }

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

            // Objects still alive, device objects and memory together.
            size_t live_objects() const;

            // Index of the first event equal to `event` at or after `from`,
            // events.size() when there is none.
            size_t find_event(const std::string& event, size_t from = 0) const;

            // Knobs. Result queues are consumed front first and fall back to
            // eSuccess once empty.
            std::deque<vk::Result> buffer_results;
            std::deque<vk::Result> view_results;
            std::deque<vk::Result> acquire_results;
            std::deque<vk::Result> present_results;
            std::deque<vk::Result> set_results;
            bool                   hang_fences = false;
            u32                    image_count = 3;

            // Observations.
            std::vector<std::string>     events;
            std::vector<std::string>     violations;
            std::vector<WriteRecord>     writes;
            std::vector<ImageCopyRecord> image_copies;
            std::vector<BarrierRecord>   barriers;
            std::vector<BlitRecord>      blits;
            std::vector<SubmitRecord>    submits;
            u32                          acquires = 0;
            u32                          presents = 0;

            std::map<u64, BufferRecord> buffers;
            std::map<u64, ImageRecord>  images;
            std::map<u64, PoolRecord>   pools;
            std::map<u64, FenceRecord>  fences;
            std::map<u64, u64>          set_pools;
            std::set<u64>               views;
            std::set<u64>               layouts;
            std::set<u64>               cmd_pools;
            std::set<u64>               semaphores;

        private:
            u64 next_id() { return ++last_id; }
            void touch(vk::CommandBuffer cmd, u64 resource);
            void check_not_in_flight(u64 resource, const char* what);

            u64 last_id    = 0;
            u32 next_image = 0;
            std::map<u64, u64>           allocation_owner;
            std::map<u64, std::set<u64>> recording;
            std::map<u64, std::set<u64>> in_flight;
    };

    //_____________________________________
    // Handle <-> id helpers. Non-dispatchable handles are pointers on the
    // 64-bit targets the tests run on.
    template <typename Native, typename Handle>
    Handle make_handle(u64 id) {
        return Handle(reinterpret_cast<Native>(static_cast<uintptr_t>(id)));
    }

    template <typename Native, typename Handle>
    u64 id_of(Handle handle) {
        return static_cast<u64>(reinterpret_cast<uintptr_t>(static_cast<Native>(handle)));
    }

    inline u64 id_of(vk::Buffer handle)              { return id_of<VkBuffer>(handle);              }
    inline u64 id_of(vk::Image handle)               { return id_of<VkImage>(handle);               }
    inline u64 id_of(vk::ImageView handle)           { return id_of<VkImageView>(handle);           }
    inline u64 id_of(vk::DescriptorPool handle)      { return id_of<VkDescriptorPool>(handle);      }
    inline u64 id_of(vk::DescriptorSetLayout handle) { return id_of<VkDescriptorSetLayout>(handle); }
    inline u64 id_of(vk::DescriptorSet handle)       { return id_of<VkDescriptorSet>(handle);       }
    inline u64 id_of(vk::CommandPool handle)         { return id_of<VkCommandPool>(handle);         }
    inline u64 id_of(vk::CommandBuffer handle)       { return id_of<VkCommandBuffer>(handle);       }
    inline u64 id_of(vk::Fence handle)               { return id_of<VkFence>(handle);               }
    inline u64 id_of(vk::Semaphore handle)           { return id_of<VkSemaphore>(handle);           }
    inline u64 id_of(vma::Allocation handle)         { return id_of<VmaAllocation>(handle);         }

} // rune::test
