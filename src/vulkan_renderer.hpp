#pragma once

#include <string>
#include <memory>

#include "renderer.hpp"
#include "vk_manager.hpp"
#include "buffer.hpp"

// Color and depth attachments of one frame size.
struct RenderTarget
{
	RenderTarget(VkDevice device,
		const VkPhysicalDeviceMemoryProperties& mem_props,
		VkRenderPass render_pass, VkFormat depth_format,
		uint32_t width, uint32_t height);

	uint32_t width;
	uint32_t height;

	UVkDeviceMemory color_mem;
	UVkImage color_image;
	UVkImageView color_view;

	UVkDeviceMemory depth_mem;
	UVkImage depth_image;
	UVkImageView depth_view;

	UVkFramebuffer framebuffer;
};

// Offscreen Vulkan renderer. One instance owns its own
// Vulkan instance and device, so it must not be shared
// between threads.
class VulkanRenderer: public Renderer
{
public:
	// Throws BackendInitError if no suitable device exists.
	explicit VulkanRenderer(RendererBackend backend);

	VulkanRenderer(const VulkanRenderer&) = delete;
	VulkanRenderer& operator=(const VulkanRenderer&) = delete;

	~VulkanRenderer();

	RawPixelBuffer render(const SceneDescription& scene,
		uint32_t width, uint32_t height) override;

	RendererBackend backend() const override
	{
		return kind;
	}

	const std::string& get_name() const
	{
		return device_name;
	}

	static constexpr VkFormat color_format = VK_FORMAT_R8G8B8A8_UNORM;

private:
	void select_device();
	void create_render_pipeline();
	RawPixelBuffer draw(const SceneDescription& scene,
		uint32_t width, uint32_t height);

	RendererBackend kind;
	std::string device_name;

	UVkInstance vk;
	VkPhysicalDevice pdevice = VK_NULL_HANDLE;
	VkPhysicalDeviceMemoryProperties mem_props;
	VkFormat depth_format = VK_FORMAT_UNDEFINED;

	UVkDevice d;
	uint32_t qf_idx = 0;
	VkQueue queue = VK_NULL_HANDLE;

	UVkCommandPool command_pool;

	// Shading parameters, mapped on every render.
	Buffer uniform_buf;
	UVkDescriptorSetLayout desc_set_layout;
	UVkDescriptorPool desc_pool;
	VkDescriptorSet desc_set = VK_NULL_HANDLE;

	UVkShaderModule vert_shader;
	UVkShaderModule frag_shader;
	UVkRenderPass render_pass;
	UVkPipelineLayout pipeline_layout;
	UVkGraphicsPipeline pipeline;

	UVkFence frame_fence;

	// Kept between renders of the same size.
	std::unique_ptr<RenderTarget> target;
};

std::unique_ptr<Renderer> make_vulkan_renderer(RendererBackend backend);
