#include "overlay.hh"
#include "renderer.hh"
#include "vulkan_device.hh"

#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_vulkan.h"

#include <iterator>

namespace rune::renderer {

    //_____________________________________
    void Overlay::init(VulkanDevice& context, Renderer& renderer, const Swapchain& swapchain, GLFWwindow* window) {
        _context   = &context;
        _renderer  = &renderer;
        img_format = swapchain.img_format;

        vk::DescriptorPoolSize pool_sizes[] {
            { vk::DescriptorType::eSampler,              100 },
            { vk::DescriptorType::eCombinedImageSampler, 100 },
            { vk::DescriptorType::eSampledImage,         100 },
            { vk::DescriptorType::eUniformBuffer,        100 },
        };
        vk::DescriptorPoolCreateInfo pool_info {
            .flags          = vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet,
            .maxSets        = 100,
            .poolSizeCount  = (u32)std::size(pool_sizes),
            .pPoolSizes     = pool_sizes,
        };
        vk::DescriptorPool imgui_pool;
        RUNE_VK_CHECK(context.create_descriptor_pool(pool_info, &imgui_pool));
        renderer.deletion_queue().push(imgui_pool);

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        if( !ImGui_ImplGlfw_InitForVulkan(window, true) ) {
            ImGui::DestroyContext();
            throw Error(ErrorKind::eApiFailure, "imgui glfw backend initialization failed");
        }

        vk::PipelineRenderingCreateInfo rendering_info {
            .colorAttachmentCount    = 1,
            .pColorAttachmentFormats = &img_format,
        };
        ImGui_ImplVulkan_InitInfo init_info {};
        init_info.Instance            = static_cast<VkInstance>(context.instance);
        init_info.PhysicalDevice      = static_cast<VkPhysicalDevice>(context.phys_device);
        init_info.Device              = static_cast<VkDevice>(context.handle);
        init_info.QueueFamily         = context.graphics_queue.family;
        init_info.Queue               = static_cast<VkQueue>(context.graphics_queue.handle);
        init_info.DescriptorPool      = static_cast<VkDescriptorPool>(imgui_pool);
        init_info.MinImageCount       = (u32)swapchain.images.size();
        init_info.ImageCount          = (u32)swapchain.images.size();
        init_info.MSAASamples         = VK_SAMPLE_COUNT_1_BIT;
        init_info.UseDynamicRendering = true;
        init_info.PipelineRenderingCreateInfo = rendering_info;
        if( !ImGui_ImplVulkan_Init(&init_info) ) {
            ImGui_ImplGlfw_Shutdown();
            ImGui::DestroyContext();
            throw Error(ErrorKind::eApiFailure, "imgui vulkan backend initialization failed");
        }

        ImGuiIO& io = ImGui::GetIO();
        io.IniFilename = nullptr;
        io.LogFilename = nullptr;

        ImGuiStyle& style = ImGui::GetStyle();
        style.WindowRounding    = 8.f;
        style.FrameRounding     = 8.f;
        style.ScrollbarRounding = 4.f;

        style.Colors[ImGuiCol_CheckMark] = ImVec4(0.f, 0.f, 0.f, .4f);
        style.Colors[ImGuiCol_Text]      = ImVec4(.6f, .6f, .6f, 1.f);
        style.Colors[ImGuiCol_WindowBg]  = ImVec4(0.f, 0.f, 0.f, .33f);
        style.Colors[ImGuiCol_Border]    = ImVec4(0.f, 0.f, 0.f, 0.f);

        initialized = true;
    }

    //_____________________________________
    void Overlay::build_ui(const FrameContext& ctx) {
        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        ImGui::Begin("Rune", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoBackground
                                     | ImGuiWindowFlags_NoResize   | ImGuiWindowFlags_NoMove
                                     | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMouseInputs);
        {
            ImGui::TextUnformatted(fmt::format("GPU: {}", _context->phys_device.getProperties().deviceName.data()).c_str());
            ImGui::SetWindowPos(ImVec2(0, ctx.extent.height - ImGui::GetWindowSize().y));
        }
        ImGui::End();

        ImGui::Begin("Toggle Info", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoBackground
                    | ImGuiWindowFlags_NoResize   | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse);
        {
            ImGui::Checkbox("Show Stats", &show_stats);
            ImGui::SetWindowPos(ImVec2(4, 4));
        }
        ImGui::End();

        if( show_stats ) {
            const FrameStats& stats = _renderer->stats();
            ImGui::Begin("Render Info", nullptr, ImGuiWindowFlags_NoTitleBar
                                          | ImGuiWindowFlags_NoResize   | ImGuiWindowFlags_NoMove
                                          | ImGuiWindowFlags_NoCollapse);
            {
                ImGui::TextUnformatted(fmt::format(" frame:       {}", ctx.frame_number).c_str());
                ImGui::TextUnformatted(fmt::format(" frametime:   {:.2f}", stats.frametime).c_str());
                ImGui::TextUnformatted(fmt::format(" in flight:   {}", _renderer->frames_in_flight()).c_str());
                ImGui::TextUnformatted(fmt::format(" slot:        {}", ctx.slot).c_str());
                ImGui::TextUnformatted(fmt::format(" pools:       {}/{}", _renderer->descriptors().pool_count(), ctx.frame.descriptors.pool_count()).c_str());
                ImGui::TextUnformatted(fmt::format(" allocations: {}", _renderer->memory().live_allocations()).c_str());
                ImGui::TextUnformatted(fmt::format(" rebuilds:    {}", stats.swapchain_rebuilds).c_str());

                ImGui::SetWindowSize(ImVec2(160, 150));
                ImGui::SetWindowPos(ImVec2(8, 40));
            }
            ImGui::End();
        }

        ImGui::Render();
    }

    //_____________________________________
    void Overlay::record(const FrameContext& ctx, vk::CommandBuffer cmd) {
        build_ui(ctx);

        vk::RenderingAttachmentInfo attach_info {
            .imageView   = ctx.swap_view,
            .imageLayout = vk::ImageLayout::eColorAttachmentOptimal,
            .loadOp      = vk::AttachmentLoadOp::eLoad,
            .storeOp     = vk::AttachmentStoreOp::eStore,
        };
        vk::RenderingInfo render_info {
            .renderArea           = vk::Rect2D { vk::Offset2D { 0, 0 }, ctx.extent },
            .layerCount           = 1,
            .colorAttachmentCount = 1,
            .pColorAttachments    = &attach_info,
        };
        cmd.beginRendering(&render_info);
        ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cmd);
        cmd.endRendering();
    }

    //_____________________________________
    void Overlay::terminate() {
        if( !initialized ) { return; }
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        initialized = false;
    }

} // rune::renderer
