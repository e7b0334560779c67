#include "image.hh"

#include <algorithm>
#include <cmath>

namespace rune::renderer {

    //_____________________________________
    void transition_img(
        Device&              device,
        vk::CommandBuffer    cmd,
        vk::Image            img,
        vk::ImageLayout      from,
        vk::ImageLayout      to,
        vk::ImageAspectFlags aspect,
        u32                  base_mip,
        u32                  mip_levels
    ) {
        vk::ImageMemoryBarrier2 img_barrier {
            .srcStageMask     = vk::PipelineStageFlagBits2::eAllCommands,
            .srcAccessMask    = vk::AccessFlagBits2::eMemoryWrite,
            .dstStageMask     = vk::PipelineStageFlagBits2::eAllCommands,
            .dstAccessMask    = vk::AccessFlagBits2::eMemoryWrite | vk::AccessFlagBits2::eMemoryRead,
            .oldLayout        = from,
            .newLayout        = to,
            .image            = img,
            .subresourceRange = vk::ImageSubresourceRange {
                .aspectMask         = aspect,
                .baseMipLevel       = base_mip,
                .levelCount         = mip_levels,
                .baseArrayLayer     = 0,
                .layerCount         = vk::RemainingArrayLayers,
            },
        };

        device.pipeline_barrier(cmd,
            vk::DependencyInfo {
                .imageMemoryBarrierCount = 1,
                .pImageMemoryBarriers    = &img_barrier,
            }
        );
    }

    void transition_img(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         img,
        vk::ImageLayout   from,
        vk::ImageLayout   to
    ) {
        transition_img(device, cmd, img, from, to,
            (to == vk::ImageLayout::eDepthAttachmentOptimal)
                ? vk::ImageAspectFlagBits::eDepth
                : vk::ImageAspectFlagBits::eColor
        );
    }

    //_____________________________________
    void copy_img_to_img(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         src,
        vk::Image         dst,
        vk::Extent2D      src_extent,
        vk::Extent2D      dst_extent
    ) {
        vk::ImageBlit2 blit_region {
            .srcSubresource = vk::ImageSubresourceLayers {
                .aspectMask     = vk::ImageAspectFlagBits::eColor,
                .mipLevel       = 0,
                .baseArrayLayer = 0,
                .layerCount     = 1,
            },
            .srcOffsets = {{
                vk::Offset3D { 0, 0, 0 },
                vk::Offset3D { (i32)src_extent.width, (i32)src_extent.height, 1 },
            }},
            .dstSubresource = vk::ImageSubresourceLayers {
                .aspectMask     = vk::ImageAspectFlagBits::eColor,
                .mipLevel       = 0,
                .baseArrayLayer = 0,
                .layerCount     = 1,
            },
            .dstOffsets = {{
                vk::Offset3D { 0, 0, 0 },
                vk::Offset3D { (i32)dst_extent.width, (i32)dst_extent.height, 1 },
            }},
        };

        device.blit_image(cmd,
            vk::BlitImageInfo2 {
                .srcImage       = src,
                .srcImageLayout = vk::ImageLayout::eTransferSrcOptimal,
                .dstImage       = dst,
                .dstImageLayout = vk::ImageLayout::eTransferDstOptimal,
                .regionCount    = 1,
                .pRegions       = &blit_region,
                .filter         = vk::Filter::eLinear,
            }
        );
    }

    //_____________________________________
    // Expects every level in TransferDst with level 0 filled. Each level is
    // blitted from the one above it, then the whole chain ends ShaderReadOnly.
    void generate_mipmaps(
        Device&           device,
        vk::CommandBuffer cmd,
        vk::Image         img,
        vk::Extent2D      extent,
        u32               mip_levels
    ) {
        i32 mip_w = (i32)extent.width;
        i32 mip_h = (i32)extent.height;
        for( u32 i = 1; i < mip_levels; i++ ) {
            transition_img(device, cmd, img,
                vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eTransferSrcOptimal,
                vk::ImageAspectFlagBits::eColor, i - 1, 1
            );

            i32 next_w = mip_w > 1 ? mip_w / 2 : 1;
            i32 next_h = mip_h > 1 ? mip_h / 2 : 1;
            vk::ImageBlit2 blit_region {
                .srcSubresource = vk::ImageSubresourceLayers {
                    .aspectMask     = vk::ImageAspectFlagBits::eColor,
                    .mipLevel       = i - 1,
                    .baseArrayLayer = 0,
                    .layerCount     = 1,
                },
                .srcOffsets = {{
                    vk::Offset3D { 0, 0, 0 },
                    vk::Offset3D { mip_w, mip_h, 1 },
                }},
                .dstSubresource = vk::ImageSubresourceLayers {
                    .aspectMask     = vk::ImageAspectFlagBits::eColor,
                    .mipLevel       = i,
                    .baseArrayLayer = 0,
                    .layerCount     = 1,
                },
                .dstOffsets = {{
                    vk::Offset3D { 0, 0, 0 },
                    vk::Offset3D { next_w, next_h, 1 },
                }},
            };
            device.blit_image(cmd,
                vk::BlitImageInfo2 {
                    .srcImage       = img,
                    .srcImageLayout = vk::ImageLayout::eTransferSrcOptimal,
                    .dstImage       = img,
                    .dstImageLayout = vk::ImageLayout::eTransferDstOptimal,
                    .regionCount    = 1,
                    .pRegions       = &blit_region,
                    .filter         = vk::Filter::eLinear,
                }
            );

            transition_img(device, cmd, img,
                vk::ImageLayout::eTransferSrcOptimal, vk::ImageLayout::eShaderReadOnlyOptimal,
                vk::ImageAspectFlagBits::eColor, i - 1, 1
            );
            mip_w = next_w;
            mip_h = next_h;
        }
        transition_img(device, cmd, img,
            vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eShaderReadOnlyOptimal,
            vk::ImageAspectFlagBits::eColor, mip_levels - 1, 1
        );
    }

    //_____________________________________
    u32 mip_count(vk::Extent3D extent) {
        return (u32)std::floor(std::log2(std::max(extent.width, extent.height))) + 1;
    }

    //_____________________________________
    u32 texel_size(vk::Format format) {
        switch( format ) {
            case vk::Format::eR8Unorm:
                return 1;
            case vk::Format::eR8G8B8A8Unorm:
            case vk::Format::eR8G8B8A8Srgb:
            case vk::Format::eB8G8R8A8Unorm:
            case vk::Format::eB8G8R8A8Srgb:
            case vk::Format::eR32Sfloat:
            case vk::Format::eD32Sfloat:
                return 4;
            case vk::Format::eR16G16B16A16Sfloat:
                return 8;
            case vk::Format::eR32G32B32A32Sfloat:
                return 16;
            default:
                return 0;
        }
    }

} // rune::renderer
