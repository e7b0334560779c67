#include "swapchain.hh"
#include "vulkan_device.hh"
#include "log.hh"

#include <algorithm>

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

namespace rune::renderer {

    namespace {
        vk::SurfaceFormatKHR choose_format(const std::vector<vk::SurfaceFormatKHR>& formats) {
            for( auto format : formats ) {
                if( format.format == vk::Format::eB8G8R8A8Unorm && format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear ) {
                    return format;
                }
            }
            return formats.front();
        }

        vk::PresentModeKHR choose_present_mode(const std::vector<vk::PresentModeKHR>& modes, bool vsync) {
            if( !vsync && std::find(modes.begin(), modes.end(), vk::PresentModeKHR::eMailbox) != modes.end() ) {
                return vk::PresentModeKHR::eMailbox;
            }
            return vk::PresentModeKHR::eFifo;
        }

        vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities, GLFWwindow* window) {
            if( capabilities.currentExtent.width != UINT32_MAX ) {
                return capabilities.currentExtent;
            }
            int w, h;
            glfwGetFramebufferSize(window, &w, &h);
            return vk::Extent2D {
                .width  = std::clamp((u32)w, capabilities.minImageExtent.width,  capabilities.maxImageExtent.width),
                .height = std::clamp((u32)h, capabilities.minImageExtent.height, capabilities.maxImageExtent.height),
            };
        }
    }

    //_____________________________________
    void build_swapchain(VulkanDevice& context, GLFWwindow* window, bool vsync, Swapchain& swapchain) {
        int w = 0, h = 0;
        glfwGetFramebufferSize(window, &w, &h);
        while( w == 0 || h == 0 ) {
            glfwWaitEvents();
            glfwGetFramebufferSize(window, &w, &h);
        }

        auto capabilities = expect("surface capabilities", context.phys_device.getSurfaceCapabilitiesKHR(context.surface));
        auto formats      = expect("surface formats",      context.phys_device.getSurfaceFormatsKHR(context.surface));
        auto modes        = expect("present modes",        context.phys_device.getSurfacePresentModesKHR(context.surface));
        expect("surface reports no formats", !formats.empty());

        vk::SurfaceFormatKHR format = choose_format(formats);
        u32 img_count = capabilities.minImageCount + 1;
        if( capabilities.maxImageCount > 0 ) {
            img_count = std::min(img_count, capabilities.maxImageCount);
        }

        swapchain.img_format = format.format;
        swapchain.extent     = choose_extent(capabilities, window);
        swapchain.handle = expect("swapchain creation", context.handle.createSwapchainKHR(
            vk::SwapchainCreateInfoKHR {
                .surface          = context.surface,
                .minImageCount    = img_count,
                .imageFormat      = format.format,
                .imageColorSpace  = format.colorSpace,
                .imageExtent      = swapchain.extent,
                .imageArrayLayers = 1,
                .imageUsage       = vk::ImageUsageFlagBits::eTransferDst | vk::ImageUsageFlagBits::eColorAttachment,
                .imageSharingMode = vk::SharingMode::eExclusive,
                .preTransform     = capabilities.currentTransform,
                .compositeAlpha   = vk::CompositeAlphaFlagBitsKHR::eOpaque,
                .presentMode      = choose_present_mode(modes, vsync),
                .clipped          = true,
            },
            nullptr
        ));

        swapchain.images = expect("swapchain images", context.handle.getSwapchainImagesKHR(swapchain.handle));
        for( auto image : swapchain.images ) {
            vk::ImageView view;
            RUNE_VK_CHECK(context.create_image_view(
                vk::ImageViewCreateInfo {
                    .image      = image,
                    .viewType   = vk::ImageViewType::e2D,
                    .format     = swapchain.img_format,
                    .subresourceRange {
                        .aspectMask     = vk::ImageAspectFlagBits::eColor,
                        .baseMipLevel   = 0,
                        .levelCount     = 1,
                        .baseArrayLayer = 0,
                        .layerCount     = 1,
                    },
                },
                &view
            ));
            swapchain.img_views.push_back(view);
        }
        swapchain.request_resize = false;
        log::debug("swapchain {}x{}, {} images, {}", swapchain.extent.width, swapchain.extent.height,
            swapchain.images.size(), vk::to_string(swapchain.img_format));
    }

    //_____________________________________
    void rebuild_swapchain(VulkanDevice& context, GLFWwindow* window, bool vsync, Swapchain& swapchain) {
        destroy_swapchain(context, swapchain);
        build_swapchain(context, window, vsync, swapchain);
    }

    //_____________________________________
    void destroy_swapchain(VulkanDevice& context, Swapchain& swapchain) {
        if( !context.handle ) { return; }
        for( auto view : swapchain.img_views ) {
            context.destroy(view);
        }
        swapchain.img_views.clear();
        swapchain.images.clear();
        context.handle.destroySwapchainKHR(swapchain.handle);
        swapchain.handle = nullptr;
    }

} // rune::renderer
