#pragma once
#include "vulkan.hh"

#include <vector>

struct GLFWwindow;

namespace rune::renderer {

    class VulkanDevice;

    //_____________________________________
    struct Swapchain {
        vk::SwapchainKHR           handle;
        vk::Format                 img_format;
        std::vector<vk::Image>     images;
        std::vector<vk::ImageView> img_views;
        vk::Extent2D               extent;
        bool                       request_resize = false;
    };

    void build_swapchain(VulkanDevice& context, GLFWwindow* window, bool vsync, Swapchain& swapchain);
    void rebuild_swapchain(VulkanDevice& context, GLFWwindow* window, bool vsync, Swapchain& swapchain);
    void destroy_swapchain(VulkanDevice& context, Swapchain& swapchain);

} // rune::renderer
