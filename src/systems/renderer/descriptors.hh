#pragma once
#include "device.hh"

#include <deque>
#include <span>
#include <vector>

namespace rune::renderer {

    //_____________________________________
    struct PoolSizeRatio {
        vk::DescriptorType type;
        f32                ratio;
    };

    //_____________________________________
    // Sets plus the layouts they were allocated against. Valid until the
    // owning pool is reset; layouts created on the caller's behalf belong
    // to the caller.
    struct DescriptorSetDetails {
        std::vector<vk::DescriptorSet>       sets;
        std::vector<vk::DescriptorSetLayout> layouts;
    };

    //_____________________________________
    // Growable set of descriptor pools. Pools with headroom sit in `ready`,
    // pools that failed an allocation sit in `full` until the next reset.
    class DescriptorAllocator {
        public:
            static constexpr u32 MAX_SETS_PER_POOL = 4092;

            void init(Device& device, u32 max_sets, std::span<const PoolSizeRatio> pool_ratios);

            DescriptorSetDetails allocate(std::span<const vk::DescriptorSetLayout> layouts);
            vk::DescriptorSet    allocate(vk::DescriptorSetLayout layout);

            DescriptorSetDetails write_image_descriptors(
                vk::ImageView        img_view,
                vk::Sampler          sampler,
                vk::ImageLayout      layout,
                vk::DescriptorType   type,
                vk::ShaderStageFlags stages
            );

            DescriptorSetDetails write_buffer_descriptors(
                vk::Buffer           buffer,
                vk::DeviceSize       size,
                vk::DeviceSize       offset,
                vk::DescriptorType   type,
                vk::ShaderStageFlags stages
            );

            // Invalidates every set handed out so far.
            void reset_descriptors();
            void destroy_pools();

            u32 pool_count()    const { return (u32)(ready.size() + full.size()); }
            u32 sets_per_pool() const { return _sets_per_pool; }

            std::span<const vk::DescriptorPool> ready_pools() const { return ready; }
            std::span<const vk::DescriptorPool> full_pools()  const { return full;  }

        private:
            vk::DescriptorPool get_pool();
            vk::DescriptorPool create_pool(u32 set_count);

            Device*                         _device = nullptr;
            std::vector<PoolSizeRatio>      ratios;
            std::vector<vk::DescriptorPool> ready;
            std::vector<vk::DescriptorPool> full;
            u32                             _sets_per_pool = 0;
    };

    //_____________________________________
    struct DescriptorWriter {
        std::deque<vk::DescriptorImageInfo>  img_info;
        std::deque<vk::DescriptorBufferInfo> buffer_info;
        std::vector<vk::WriteDescriptorSet>  writes;

        DescriptorWriter& write_img(
            u32                binding,
            vk::ImageView      img_view,
            vk::Sampler        sampler,
            vk::ImageLayout    layout,
            vk::DescriptorType type
        );

        DescriptorWriter& write_buffer(
            u32                binding,
            vk::Buffer         buffer,
            vk::DeviceSize     size,
            vk::DeviceSize     offset,
            vk::DescriptorType type
        );

        DescriptorWriter& update_set(Device& device, vk::DescriptorSet set);
        DescriptorWriter& clear();
    };

    //_____________________________________
    struct DescriptorLayoutBuilder {
        std::vector<vk::DescriptorSetLayoutBinding> bindings;

        DescriptorLayoutBuilder& add_binding(u32 binding, vk::DescriptorType type, u32 count = 1);
        DescriptorLayoutBuilder& clear();

        // Hands the bindings to the device and empties the builder.
        vk::DescriptorSetLayout build(
            Device&                            device,
            vk::ShaderStageFlags               shader_stages,
            vk::DescriptorSetLayoutCreateFlags flags = {}
        );
    };

} // rune::renderer
