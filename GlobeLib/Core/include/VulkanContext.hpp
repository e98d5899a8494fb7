#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

/**
 * @brief Per-frame recording state handed to primitives by the frame driver.
 *
 * Primitives only record into `cmd`; they never submit or wait. A null
 * command buffer means "nothing to record into" (headless ticks, tests) and
 * makes draws no-ops.
 */
struct RenderFrameContext
{
    VkCommandBuffer cmd        = VK_NULL_HANDLE;
    uint32_t        frameIndex = 0;
};

/**
 * @brief Long-lived Vulkan device handles provided by the host application.
 *
 * GlobeLib uses this to create and own device resources (buffers). The host
 * owns instance/device creation, surfaces and presentation.
 */
struct VulkanContext
{
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;

    VkQueue  graphicsQueue            = VK_NULL_HANDLE;
    uint32_t graphicsQueueFamilyIndex = 0;
};

/**
 * @brief Pipelines used to draw surface polygons.
 *
 * Created by the host renderer (shaders, render pass, descriptor layouts are
 * outside GlobeLib). Both pipelines share one layout whose push-constant
 * range matches PolygonPushConstants.
 */
struct PolygonPipelines
{
    VkPipeline       opaque      = VK_NULL_HANDLE;
    VkPipeline       translucent = VK_NULL_HANDLE;
    VkPipelineLayout layout      = VK_NULL_HANDLE;
};
