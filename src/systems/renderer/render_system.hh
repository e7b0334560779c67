#pragma once
#include "system.hh"
#include "vulkan_device.hh"
#include "renderer.hh"
#include "overlay.hh"

#include <glm/glm.hpp>

namespace rune {

    class Window;

    namespace renderer {

        // Per-frame uniform data, binding 0 of the globals set.
        struct FrameGlobals {
            glm::vec4 clear_color;
            glm::vec4 time;
        };

        //_____________________________________
        // Vulkan backend of the engine. Clears an offscreen draw image, blits
        // it to the swapchain and draws the overlay on top.
        class RenderSystem : public System {
            public:
                virtual void init() override;
                virtual void terminate() override;
                virtual void tick() override;

            private:
                void record(FrameContext& ctx);
                void build_draw_image(vk::Extent2D extent);
                void release();

                Window*        window = nullptr;
                VulkanDevice   context;
                Swapchain      swapchain;
                Renderer       renderer;
                Overlay        overlay;
                AllocationUnit draw_image;
                vk::DescriptorSetLayout globals_layout;
        };
    }
}
