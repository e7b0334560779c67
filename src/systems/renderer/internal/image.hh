#pragma once
#include "device.hh"

namespace rune::renderer {

    void transition_img(
        Device&              device,
        vk::CommandBuffer    cmd,
        vk::Image            img,
        vk::ImageLayout      from,
        vk::ImageLayout      to,
        vk::ImageAspectFlags aspect,
        u32                  base_mip   = 0,
        u32                  mip_levels = vk::RemainingMipLevels
    );

    // Aspect picked from the target layout: depth for DepthAttachmentOptimal,
    // color otherwise.
    void transition_img(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         img,
        vk::ImageLayout   from,
        vk::ImageLayout   to
    );

    void copy_img_to_img(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         src,
        vk::Image         dst,
        vk::Extent2D      src_extent,
        vk::Extent2D      dst_extent
    );

    void generate_mipmaps(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         img,
        vk::Extent2D      extent,
        u32               mip_levels
    );

    u32 mip_count(vk::Extent3D extent);

    // Bytes per texel, 0 for formats the uploader does not handle.
    u32 texel_size(vk::Format format);

} // rune::renderer
