#include "descriptors.hh"
#include "log.hh"

#include <algorithm>

namespace rune::renderer {

    namespace {
        bool is_exhausted(vk::Result result) {
            return result == vk::Result::eErrorOutOfPoolMemory || result == vk::Result::eErrorFragmentedPool;
        }

        // 1.5x, but always at least one more set than before.
        u32 grow(u32 sets) {
            return std::min(std::max(sets + 1, (u32)(sets * 1.5f)), DescriptorAllocator::MAX_SETS_PER_POOL);
        }
    }

    //_____________________________________
    void DescriptorAllocator::init(Device& device, u32 max_sets, std::span<const PoolSizeRatio> pool_ratios) {
        expect("descriptor allocator needs at least one set per pool", max_sets > 0);
        _device = &device;
        ratios.assign(pool_ratios.begin(), pool_ratios.end());
        ready.push_back(create_pool(max_sets));
        _sets_per_pool = grow(max_sets);
    }

    //_____________________________________
    DescriptorSetDetails DescriptorAllocator::allocate(std::span<const vk::DescriptorSetLayout> layouts) {
        expect("descriptor allocation without layouts", !layouts.empty());

        DescriptorSetDetails details {
            .sets    = std::vector<vk::DescriptorSet>(layouts.size()),
            .layouts = std::vector<vk::DescriptorSetLayout>(layouts.begin(), layouts.end()),
        };

        vk::DescriptorPool pool = get_pool();
        vk::DescriptorSetAllocateInfo allocate_info {
            .descriptorPool     = pool,
            .descriptorSetCount = (u32)layouts.size(),
            .pSetLayouts        = layouts.data(),
        };
        vk::Result result = _device->allocate_descriptor_sets(allocate_info, details.sets.data());
        if( is_exhausted(result) ) {
            full.push_back(pool);
            pool = get_pool();
            allocate_info.descriptorPool = pool;
            result = _device->allocate_descriptor_sets(allocate_info, details.sets.data());
        }
        if( result != vk::Result::eSuccess ) {
            if( is_exhausted(result) ) { full.push_back(pool);  }
            else                       { ready.push_back(pool); }
            throw Error(error_kind(result), fmt::format(
                "allocating {} descriptor sets failed across {} pools :: {}",
                layouts.size(), pool_count(), vk::to_string(result)
            ));
        }
        ready.push_back(pool);
        return details;
    }

    vk::DescriptorSet DescriptorAllocator::allocate(vk::DescriptorSetLayout layout) {
        return allocate(std::span<const vk::DescriptorSetLayout>(&layout, 1)).sets.front();
    }

    //_____________________________________
    DescriptorSetDetails DescriptorAllocator::write_image_descriptors(
        vk::ImageView        img_view,
        vk::Sampler          sampler,
        vk::ImageLayout      layout,
        vk::DescriptorType   type,
        vk::ShaderStageFlags stages
    ) {
        vk::DescriptorSetLayout set_layout = DescriptorLayoutBuilder {}
            .add_binding(0, type)
            .build(*_device, stages);

        DescriptorSetDetails details;
        try {
            details = allocate(std::span<const vk::DescriptorSetLayout>(&set_layout, 1));
        } catch( ... ) {
            _device->destroy(set_layout);
            throw;
        }
        DescriptorWriter {}
            .write_img(0, img_view, sampler, layout, type)
            .update_set(*_device, details.sets.front());
        return details;
    }

    //_____________________________________
    DescriptorSetDetails DescriptorAllocator::write_buffer_descriptors(
        vk::Buffer           buffer,
        vk::DeviceSize       size,
        vk::DeviceSize       offset,
        vk::DescriptorType   type,
        vk::ShaderStageFlags stages
    ) {
        vk::DescriptorSetLayout set_layout = DescriptorLayoutBuilder {}
            .add_binding(0, type)
            .build(*_device, stages);

        DescriptorSetDetails details;
        try {
            details = allocate(std::span<const vk::DescriptorSetLayout>(&set_layout, 1));
        } catch( ... ) {
            _device->destroy(set_layout);
            throw;
        }
        DescriptorWriter {}
            .write_buffer(0, buffer, size, offset, type)
            .update_set(*_device, details.sets.front());
        return details;
    }

    //_____________________________________
    void DescriptorAllocator::reset_descriptors() {
        for( auto pool : ready ) {
            _device->reset_descriptor_pool(pool);
        }
        for( auto pool : full ) {
            _device->reset_descriptor_pool(pool);
            ready.push_back(pool);
        }
        full.clear();
    }

    //_____________________________________
    void DescriptorAllocator::destroy_pools() {
        for( auto pool : ready ) {
            _device->destroy(pool);
        }
        ready.clear();
        for( auto pool : full ) {
            _device->destroy(pool);
        }
        full.clear();
    }

    //_____________________________________
    vk::DescriptorPool DescriptorAllocator::get_pool() {
        if( !ready.empty() ) {
            vk::DescriptorPool pool = ready.back();
            ready.pop_back();
            return pool;
        }
        vk::DescriptorPool pool = create_pool(_sets_per_pool);
        log::debug("descriptor pool grown to {} sets ({} pools)", _sets_per_pool, pool_count() + 1);
        _sets_per_pool = grow(_sets_per_pool);
        return pool;
    }

    //_____________________________________
    vk::DescriptorPool DescriptorAllocator::create_pool(u32 set_count) {
        std::vector<vk::DescriptorPoolSize> pool_sizes;
        for( auto [type, ratio] : ratios ) {
            pool_sizes.push_back(
                vk::DescriptorPoolSize {
                    .type            = type,
                    .descriptorCount = std::max(1u, (u32)(ratio * set_count)),
                }
            );
        }
        vk::DescriptorPoolCreateInfo pool_info {
            .flags         = vk::DescriptorPoolCreateFlags(),
            .maxSets       = set_count,
            .poolSizeCount = (u32)pool_sizes.size(),
            .pPoolSizes    = pool_sizes.data(),
        };
        vk::DescriptorPool pool;
        vk::Result result = _device->create_descriptor_pool(pool_info, &pool);
        if( result != vk::Result::eSuccess ) {
            throw Error(error_kind(result), fmt::format(
                "descriptor pool of {} sets failed :: {}", set_count, vk::to_string(result)
            ));
        }
        return pool;
    }

    //_____________________________________
    DescriptorWriter& DescriptorWriter::write_img(
        u32                binding,
        vk::ImageView      img_view,
        vk::Sampler        sampler,
        vk::ImageLayout    layout,
        vk::DescriptorType type
    ) {
        vk::DescriptorImageInfo& info = img_info.emplace_back(
            vk::DescriptorImageInfo {
                .sampler     = sampler,
                .imageView   = img_view,
                .imageLayout = layout,
            }
        );
        writes.push_back(
            vk::WriteDescriptorSet {
                .dstSet          = VK_NULL_HANDLE,
                .dstBinding      = binding,
                .descriptorCount = 1,
                .descriptorType  = type,
                .pImageInfo      = &info,
            }
        );
        return *this;
    }

    DescriptorWriter& DescriptorWriter::write_buffer(
        u32                binding,
        vk::Buffer         buffer,
        vk::DeviceSize     size,
        vk::DeviceSize     offset,
        vk::DescriptorType type
    ) {
        vk::DescriptorBufferInfo& info = buffer_info.emplace_back(
            vk::DescriptorBufferInfo {
                .buffer = buffer,
                .offset = offset,
                .range  = size,
            }
        );
        writes.push_back(
            vk::WriteDescriptorSet {
                .dstSet          = VK_NULL_HANDLE,
                .dstBinding      = binding,
                .descriptorCount = 1,
                .descriptorType  = type,
                .pBufferInfo     = &info,
            }
        );
        return *this;
    }

    DescriptorWriter& DescriptorWriter::update_set(Device& device, vk::DescriptorSet set) {
        for( vk::WriteDescriptorSet& write : writes ) {
            write.dstSet = set;
        }
        device.update_descriptor_sets(writes);
        return *this;
    }

    DescriptorWriter& DescriptorWriter::clear() {
        img_info.clear();
        buffer_info.clear();
        writes.clear();
        return *this;
    }

    //_____________________________________
    DescriptorLayoutBuilder& DescriptorLayoutBuilder::add_binding(u32 binding, vk::DescriptorType type, u32 count) {
        bindings.push_back(
            vk::DescriptorSetLayoutBinding {
                .binding         = binding,
                .descriptorType  = type,
                .descriptorCount = count,
            }
        );
        return *this;
    }

    DescriptorLayoutBuilder& DescriptorLayoutBuilder::clear() { bindings.clear(); return *this; }

    vk::DescriptorSetLayout DescriptorLayoutBuilder::build(
        Device&                            device,
        vk::ShaderStageFlags               shader_stages,
        vk::DescriptorSetLayoutCreateFlags flags
    ) {
        for( auto& bind : bindings ) {
            bind.stageFlags |= shader_stages;
        }
        vk::DescriptorSetLayoutCreateInfo info {
            .flags        = flags,
            .bindingCount = (u32)bindings.size(),
            .pBindings    = bindings.data(),
        };
        vk::DescriptorSetLayout layout;
        RUNE_VK_CHECK(device.create_descriptor_set_layout(info, &layout));
        bindings.clear();
        return layout;
    }

} // rune::renderer
