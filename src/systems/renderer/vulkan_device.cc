#define VMA_IMPLEMENTATION

#include "vulkan_device.hh"
#include "log.hh"

#include <algorithm>
#include <array>
#include <cstring>

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

namespace rune::renderer {

    namespace {
        const std::array<const char*, 4> device_exts {
            VK_KHR_SWAPCHAIN_EXTENSION_NAME,
            VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME,
            VK_KHR_DYNAMIC_RENDERING_EXTENSION_NAME,
            VK_KHR_SYNCHRONIZATION_2_EXTENSION_NAME,
        };

        VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
            VkDebugUtilsMessageSeverityFlagBitsEXT msg_severity,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* p_callback_data,
            void*
        ) {
            if( msg_severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT ) {
                log::error("validation: {}", p_callback_data->pMessage);
            } else if( msg_severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT ) {
                log::warn("validation: {}", p_callback_data->pMessage);
            } else {
                log::debug("validation: {}", p_callback_data->pMessage);
            }
            return VK_FALSE;
        }
    }

    //_____________________________________
    void VulkanDevice::init(const Config& config, GLFWwindow* window) {
        create_instance(config);
        RUNE_VK_CHECK(glfwCreateWindowSurface(static_cast<VkInstance>(instance), window, nullptr, reinterpret_cast<VkSurfaceKHR*>(&surface)));
        pick_physical_device();
        create_device();
        create_allocator();
        log::info("gpu context ready on {}", phys_device.getProperties().deviceName.data());
    }

    //_____________________________________
    void VulkanDevice::create_instance(const Config& config) {
        VULKAN_HPP_DEFAULT_DISPATCHER.init();

        u32 glfw_extension_count = 0;
        const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);
        expect("glfw found no vulkan instance extensions", glfw_extensions);
        std::vector<const char*> extensions(glfw_extensions, glfw_extensions + glfw_extension_count);

        if( config.validation ) {
            layers.push_back("VK_LAYER_KHRONOS_validation");
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }

        vk::ApplicationInfo app_info {
            .pApplicationName   = config.app_name.c_str(),
            .applicationVersion = RUNE_V,
            .pEngineName        = "rune",
            .engineVersion      = RUNE_V,
            .apiVersion         = VK_API_VERSION_1_3,
        };
        instance = expect("instance creation", vk::createInstance(
            vk::InstanceCreateInfo {
                .pApplicationInfo        = &app_info,
                .enabledLayerCount       = (u32)layers.size(),
                .ppEnabledLayerNames     = layers.data(),
                .enabledExtensionCount   = (u32)extensions.size(),
                .ppEnabledExtensionNames = extensions.data(),
        }   ));
        VULKAN_HPP_DEFAULT_DISPATCHER.init(instance);

        if( config.validation ) {
            messenger = expect("debug messenger creation", instance.createDebugUtilsMessengerEXT(
                vk::DebugUtilsMessengerCreateInfoEXT {
                    .messageSeverity = vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose
                                     | vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning
                                     | vk::DebugUtilsMessageSeverityFlagBitsEXT::eError,
                    .messageType     = vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral
                                     | vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation
                                     | vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance,
                    .pfnUserCallback = &debug_callback,
                },
                nullptr
            ));
        }
    }

    //_____________________________________
    // First device that can draw and present with every required extension,
    // discrete GPUs ahead of the rest.
    void VulkanDevice::pick_physical_device() {
        auto candidates = expect("physical device enumeration", instance.enumeratePhysicalDevices());
        std::stable_partition(candidates.begin(), candidates.end(), [](vk::PhysicalDevice candidate) {
            return candidate.getProperties().deviceType == vk::PhysicalDeviceType::eDiscreteGpu;
        });

        for( auto candidate : candidates ) {
            auto properties = candidate.getProperties();
            if( properties.apiVersion < VK_API_VERSION_1_3 ) {
                log::debug("skipping {}: vulkan 1.3 unsupported", properties.deviceName.data());
                continue;
            }

            auto available = expect("device extension enumeration", candidate.enumerateDeviceExtensionProperties());
            bool has_exts = std::all_of(device_exts.begin(), device_exts.end(), [&](const char* name) {
                return std::any_of(available.begin(), available.end(), [&](const vk::ExtensionProperties& ext) {
                    return std::strcmp(ext.extensionName.data(), name) == 0;
                });
            });
            if( !has_exts ) {
                log::debug("skipping {}: missing device extensions", properties.deviceName.data());
                continue;
            }

            for( u32 i = 0; auto family : candidate.getQueueFamilyProperties() ) {
                if( (family.queueFlags & vk::QueueFlagBits::eGraphics)
                    && expect("surface support query", candidate.getSurfaceSupportKHR(i, surface)) ) {
                    phys_device           = candidate;
                    graphics_queue.family = i;
                    return;
                }
                i++;
            }
            log::debug("skipping {}: no queue can draw and present", properties.deviceName.data());
        }
        throw Error(ErrorKind::eDeviceUnsuitable, fmt::format(
            "none of {} physical devices can draw and present with vulkan 1.3", candidates.size()
        ));
    }

    //_____________________________________
    void VulkanDevice::create_device() {
        f32 prio = 1.f;
        vk::DeviceQueueCreateInfo queue_info {
            .queueFamilyIndex = graphics_queue.family,
            .queueCount       = 1,
            .pQueuePriorities = &prio,
        };

        vk::PhysicalDeviceDynamicRenderingFeatures dyn_features {
            .dynamicRendering = true,
        };
        vk::PhysicalDeviceSynchronization2Features sync_features {
            .pNext            = &dyn_features,
            .synchronization2 = true,
        };
        vk::PhysicalDeviceBufferDeviceAddressFeatures buffer_device_features {
            .pNext = &sync_features,
        };
        vk::PhysicalDeviceFeatures2 device_features_2 {
            .pNext = &buffer_device_features,
        };
        phys_device.getFeatures2(&device_features_2);
        expect("buffer device address unsupported", (bool)buffer_device_features.bufferDeviceAddress);

        handle = expect("logical device creation", phys_device.createDevice(
            vk::DeviceCreateInfo {
                .pNext                   = &device_features_2,
                .queueCreateInfoCount    = 1,
                .pQueueCreateInfos       = &queue_info,
                .enabledLayerCount       = (u32)layers.size(),
                .ppEnabledLayerNames     = layers.data(),
                .enabledExtensionCount   = (u32)device_exts.size(),
                .ppEnabledExtensionNames = device_exts.data(),
            },
            nullptr
        ));
        VULKAN_HPP_DEFAULT_DISPATCHER.init(handle);

        graphics_queue.handle = handle.getQueue(graphics_queue.family, 0);
    }

    //_____________________________________
    void VulkanDevice::create_allocator() {
        vma::AllocatorCreateInfo alloc_info {
            .flags            = vma::AllocatorCreateFlagBits::eBufferDeviceAddress,
            .physicalDevice   = phys_device,
            .device           = handle,
            .instance         = instance,
            .vulkanApiVersion = VK_API_VERSION_1_3,
        };
        allocator = expect("vma allocator creation", vma::createAllocator(alloc_info));
    }

    //_____________________________________
    void VulkanDevice::terminate() {
        if( allocator ) { allocator.destroy(); }
        if( handle    ) { handle.destroy();    }
        if( instance ) {
            if( surface   ) { instance.destroySurfaceKHR(surface); }
            if( messenger ) { instance.destroyDebugUtilsMessengerEXT(messenger); }
            instance.destroy();
        }
        allocator = nullptr; handle = nullptr; surface = nullptr; messenger = nullptr; instance = nullptr;
    }

    //_____________________________________
    vk::Result VulkanDevice::create_buffer(
        const vk::BufferCreateInfo&      buffer_info,
        const vma::AllocationCreateInfo& alloc_info,
        vk::Buffer*                      buffer,
        vma::Allocation*                 allocation,
        vma::AllocationInfo*             info
    ) {
        return allocator.createBuffer(&buffer_info, &alloc_info, buffer, allocation, info);
    }

    void VulkanDevice::destroy_buffer(vk::Buffer buffer, vma::Allocation allocation) {
        allocator.destroyBuffer(buffer, allocation);
    }

    vk::Result VulkanDevice::create_image(
        const vk::ImageCreateInfo&       img_info,
        const vma::AllocationCreateInfo& alloc_info,
        vk::Image*                       img,
        vma::Allocation*                 allocation,
        vma::AllocationInfo*             info
    ) {
        return allocator.createImage(&img_info, &alloc_info, img, allocation, info);
    }

    void VulkanDevice::destroy_image(vk::Image img, vma::Allocation allocation) {
        allocator.destroyImage(img, allocation);
    }

    vk::Result VulkanDevice::map_memory(vma::Allocation allocation, void** data) {
        return allocator.mapMemory(allocation, data);
    }

    void VulkanDevice::unmap_memory(vma::Allocation allocation) {
        allocator.unmapMemory(allocation);
    }

    vk::DeviceAddress VulkanDevice::buffer_address(vk::Buffer buffer) {
        return handle.getBufferAddress(vk::BufferDeviceAddressInfo { .buffer = buffer, });
    }

    //_____________________________________
    vk::Result VulkanDevice::create_image_view(const vk::ImageViewCreateInfo& info, vk::ImageView* view) {
        return handle.createImageView(&info, nullptr, view);
    }

    vk::Result VulkanDevice::create_descriptor_pool(const vk::DescriptorPoolCreateInfo& info, vk::DescriptorPool* pool) {
        return handle.createDescriptorPool(&info, nullptr, pool);
    }

    vk::Result VulkanDevice::create_descriptor_set_layout(const vk::DescriptorSetLayoutCreateInfo& info, vk::DescriptorSetLayout* layout) {
        return handle.createDescriptorSetLayout(&info, nullptr, layout);
    }

    vk::Result VulkanDevice::allocate_descriptor_sets(const vk::DescriptorSetAllocateInfo& info, vk::DescriptorSet* sets) {
        return handle.allocateDescriptorSets(&info, sets);
    }

    void VulkanDevice::reset_descriptor_pool(vk::DescriptorPool pool) {
        static_cast<void>(handle.resetDescriptorPool(pool));
    }

    void VulkanDevice::update_descriptor_sets(std::span<const vk::WriteDescriptorSet> writes) {
        handle.updateDescriptorSets((u32)writes.size(), writes.data(), 0, nullptr);
    }

    vk::Result VulkanDevice::create_command_pool(const vk::CommandPoolCreateInfo& info, vk::CommandPool* pool) {
        return handle.createCommandPool(&info, nullptr, pool);
    }

    vk::Result VulkanDevice::allocate_command_buffers(const vk::CommandBufferAllocateInfo& info, vk::CommandBuffer* buffers) {
        return handle.allocateCommandBuffers(&info, buffers);
    }

    vk::Result VulkanDevice::create_fence(const vk::FenceCreateInfo& info, vk::Fence* fence) {
        return handle.createFence(&info, nullptr, fence);
    }

    vk::Result VulkanDevice::create_semaphore(const vk::SemaphoreCreateInfo& info, vk::Semaphore* semaphore) {
        return handle.createSemaphore(&info, nullptr, semaphore);
    }

    //_____________________________________
    void VulkanDevice::destroy(vk::ImageView view)             { handle.destroyImageView(view);             }
    void VulkanDevice::destroy(vk::DescriptorPool pool)        { handle.destroyDescriptorPool(pool);        }
    void VulkanDevice::destroy(vk::DescriptorSetLayout layout) { handle.destroyDescriptorSetLayout(layout); }
    void VulkanDevice::destroy(vk::CommandPool pool)           { handle.destroyCommandPool(pool);           }
    void VulkanDevice::destroy(vk::Fence fence)                { handle.destroyFence(fence);                }
    void VulkanDevice::destroy(vk::Semaphore semaphore)        { handle.destroySemaphore(semaphore);        }

    //_____________________________________
    vk::Result VulkanDevice::wait_for_fence(vk::Fence fence, u64 timeout) {
        return handle.waitForFences(1, &fence, true, timeout);
    }

    vk::Result VulkanDevice::reset_fence(vk::Fence fence) {
        return handle.resetFences(1, &fence);
    }

    vk::Result VulkanDevice::wait_idle() {
        return handle.waitIdle();
    }

    //_____________________________________
    vk::Result VulkanDevice::begin(vk::CommandBuffer cmd, vk::CommandBufferUsageFlags flags) {
        vk::CommandBufferBeginInfo begin_info { .flags = flags, };
        return cmd.begin(&begin_info);
    }

    vk::Result VulkanDevice::end(vk::CommandBuffer cmd) {
        return cmd.end();
    }

    vk::Result VulkanDevice::reset(vk::CommandBuffer cmd) {
        return cmd.reset(vk::CommandBufferResetFlags());
    }

    void VulkanDevice::copy_buffer(vk::CommandBuffer cmd, vk::Buffer src, vk::Buffer dst, const vk::BufferCopy& region) {
        cmd.copyBuffer(src, dst, 1, &region);
    }

    void VulkanDevice::copy_buffer_to_image(vk::CommandBuffer cmd, vk::Buffer src, vk::Image dst, const vk::BufferImageCopy& region) {
        cmd.copyBufferToImage(src, dst, vk::ImageLayout::eTransferDstOptimal, 1, &region);
    }

    void VulkanDevice::pipeline_barrier(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency) {
        cmd.pipelineBarrier2(dependency);
    }

    void VulkanDevice::blit_image(vk::CommandBuffer cmd, const vk::BlitImageInfo2& blit) {
        cmd.blitImage2(blit);
    }

    void VulkanDevice::clear_color_image(vk::CommandBuffer cmd, vk::Image img, vk::ImageLayout layout, const vk::ClearColorValue& color) {
        vk::ImageSubresourceRange range {
            .aspectMask     = vk::ImageAspectFlagBits::eColor,
            .baseMipLevel   = 0,
            .levelCount     = vk::RemainingMipLevels,
            .baseArrayLayer = 0,
            .layerCount     = vk::RemainingArrayLayers,
        };
        cmd.clearColorImage(img, layout, &color, 1, &range);
    }

    //_____________________________________
    vk::Result VulkanDevice::submit(const vk::SubmitInfo2& submit, vk::Fence fence) {
        return graphics_queue.handle.submit2(1, &submit, fence);
    }

    vk::Result VulkanDevice::acquire_next_image(vk::SwapchainKHR swapchain, u64 timeout, vk::Semaphore semaphore, u32* index) {
        return handle.acquireNextImageKHR(swapchain, timeout, semaphore, vk::Fence(), index);
    }

    vk::Result VulkanDevice::present(const vk::PresentInfoKHR& present) {
        return graphics_queue.handle.presentKHR(&present);
    }

} // rune::renderer
