#pragma once
#include "vulkan.hh"

struct GLFWwindow;

namespace rune::renderer {

    class VulkanDevice;
    class Renderer;
    struct Swapchain;
    struct FrameContext;

    //_____________________________________
    // ImGui stats window drawn on top of the swapchain image.
    class Overlay {
        public:
            void init(VulkanDevice& context, Renderer& renderer, const Swapchain& swapchain, GLFWwindow* window);
            void record(const FrameContext& ctx, vk::CommandBuffer cmd);
            void terminate();

            bool show_stats = true;

        private:
            void build_ui(const FrameContext& ctx);

            VulkanDevice* _context  = nullptr;
            Renderer*     _renderer = nullptr;
            vk::Format    img_format;
            bool          initialized = false;
    };

} // rune::renderer
