#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <algorithm>
#include <new>
#include <string>

#include <spdlog/spdlog.h>

#include "vulkan_renderer.hpp"

// Interleaved vertex, as read by the vertex shader.
struct GpuVertex
{
	float position[3];
	float normal[3];
	float color[4];
};

// std140 layout of the Globals uniform block.
struct UniformData
{
	Mat4 view_proj;
	Vec4 light_dir[3];
	Vec4 light_intensity;
	Vec4 albedo;
	Vec4 shading;
	Vec4 view_dir;
};

struct MeshBuffers
{
	MeshBuffers(VkDevice device,
		const VkPhysicalDeviceMemoryProperties& mem_props,
		const Mesh& mesh, StagingUploader& uploader);

	UploadBuffer vertex;
	UploadBuffer index;
	uint32_t idx_count;
};

MeshBuffers::MeshBuffers(VkDevice device,
	const VkPhysicalDeviceMemoryProperties& mem_props,
	const Mesh& mesh, StagingUploader& uploader
):
	vertex(device, mem_props,
		VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
		mesh.vertices.size() * sizeof(GpuVertex)
	),
	index(device, mem_props,
		VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
		mesh.indices.size() * sizeof(uint32_t)
	),
	idx_count(mesh.indices.size())
{
	// Copy the vertex data to device memory.
	uploader.upload<GpuVertex*>(vertex, mesh.vertices.size(),
		[&](GpuVertex* ptr) {
			for(const auto& v: mesh.vertices) {
				for(int i = 0; i < 3; ++i) {
					ptr->position[i] = v.position[i];
					ptr->normal[i] = v.normal[i];
				}
				for(int i = 0; i < 4; ++i) {
					ptr->color[i] = v.color[i];
				}
				++ptr;
			}
		}
	);

	// Copy the index data to device memory.
	uploader.upload<uint32_t*>(index, mesh.indices.size(),
		[&](uint32_t *ptr) {
			std::copy(mesh.indices.begin(), mesh.indices.end(),
				ptr);
		}
	);
}

static int device_rank(RendererBackend backend, VkPhysicalDeviceType type)
{
	if(backend == RendererBackend::Software) {
		return type == VK_PHYSICAL_DEVICE_TYPE_CPU ? 1 : 0;
	}

	switch(type) {
	case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
		return 3;
	case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
		return 2;
	case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
		return 1;
	default:
		return 0;
	}
}

static UVkInstance initialize_vulkan()
{
	const VkApplicationInfo app_info {
		VK_STRUCTURE_TYPE_APPLICATION_INFO,
		nullptr,
		"meshthumb",
		1,
		nullptr,
		0,
		VK_API_VERSION_1_0
	};

	std::vector<const char*> layers;
#ifndef NDEBUG
	// Enable validation only where it is installed.
	uint32_t layer_count = 0;
	chk_vk(vkEnumerateInstanceLayerProperties(&layer_count, nullptr));
	std::vector<VkLayerProperties> available(layer_count);
	chk_vk(vkEnumerateInstanceLayerProperties(&layer_count,
		available.data()));
	for(const auto& l: available) {
		if(std::strcmp(l.layerName, "VK_LAYER_KHRONOS_validation") == 0) {
			layers.push_back("VK_LAYER_KHRONOS_validation");
		}
	}
#endif

	return UVkInstance{VkInstanceCreateInfo{
			VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
			nullptr,
			0,
			&app_info,
			uint32_t(layers.size()),
			layers.data(),
			0,
			nullptr
		}
	};
}

RenderTarget::RenderTarget(VkDevice device,
	const VkPhysicalDeviceMemoryProperties& mem_props,
	VkRenderPass render_pass, VkFormat depth_format,
	uint32_t w, uint32_t h
):
	width{w},
	height{h}
{
	auto create_image = [&](VkFormat format, VkImageUsageFlags usage,
		VkImageAspectFlags aspect, UVkImage& image,
		UVkDeviceMemory& mem, UVkImageView& view)
	{
		image = UVkImage{VkImageCreateInfo{
			VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
			nullptr,
			0,
			VK_IMAGE_TYPE_2D, // imageType
			format, // format
			{
				width, // width
				height, // height
				1 // depth
			}, // extent
			1, // mipLevels
			1, // arrayLayers
			VK_SAMPLE_COUNT_1_BIT, // samples
			VK_IMAGE_TILING_OPTIMAL, // tiling
			usage, // usage
			VK_SHARING_MODE_EXCLUSIVE, // sharing
			0, // queueFamilyIndexCount
			nullptr, // pQueueFamilyIndices
			VK_IMAGE_LAYOUT_UNDEFINED // initialLayout
		}, device};

		VkMemoryRequirements reqs;
		vkGetImageMemoryRequirements(device, image.get(), &reqs);

		// Find a suitable heap. No specific needs, but prefer it to be local.
		uint32_t mtype = find_memory_heap(
			mem_props,
			reqs.memoryTypeBits,
			0,
			VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT
		);

		mem = UVkDeviceMemory(VkMemoryAllocateInfo{
			VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO,
			nullptr,
			reqs.size,
			mtype
		}, device);

		chk_vk(vkBindImageMemory(device, image.get(), mem.get(), 0));

		view = UVkImageView{VkImageViewCreateInfo{
			VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
			nullptr,
			0,
			image.get(),
			VK_IMAGE_VIEW_TYPE_2D,
			format,
			{
				VK_COMPONENT_SWIZZLE_IDENTITY,
				VK_COMPONENT_SWIZZLE_IDENTITY,
				VK_COMPONENT_SWIZZLE_IDENTITY,
				VK_COMPONENT_SWIZZLE_IDENTITY
			},
			{
				aspect,
				0, 1, 0, 1
			}
		}, device};
	};

	create_image(VulkanRenderer::color_format,
		VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT
		| VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
		VK_IMAGE_ASPECT_COLOR_BIT,
		color_image, color_mem, color_view);

	create_image(depth_format,
		VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
		VK_IMAGE_ASPECT_DEPTH_BIT,
		depth_image, depth_mem, depth_view);

	const VkImageView attachments[] = {
		color_view.get(),
		depth_view.get()
	};
	framebuffer = UVkFramebuffer{VkFramebufferCreateInfo{
		VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO,
		nullptr,
		0,
		render_pass,
		2,
		attachments,
		width,
		height,
		1
	}, device};
}

VulkanRenderer::VulkanRenderer(RendererBackend backend):
	kind{backend}
{
	try {
		vk = initialize_vulkan();
		select_device();

		vkGetPhysicalDeviceMemoryProperties(pdevice, &mem_props);

		// A single graphics queue is all we need.
		const float priority = 1.0f;
		const VkDeviceQueueCreateInfo qci {
			.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
			.pNext = nullptr,
			.flags = 0,
			.queueFamilyIndex = qf_idx,
			.queueCount = 1,
			.pQueuePriorities = &priority
		};

		d = UVkDevice{VkDeviceCreateInfo{
				VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
				nullptr,
				0,
				1, &qci,
				0, nullptr,
				0, nullptr,
				nullptr
			}, pdevice
		};
		vkGetDeviceQueue(d.get(), qf_idx, 0, &queue);

		command_pool = UVkCommandPool{VkCommandPoolCreateInfo{
			VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
			nullptr,
			VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT,
			qf_idx
		}, d.get()};

		create_render_pipeline();

		frame_fence = UVkFence(VkFenceCreateInfo{
			VK_STRUCTURE_TYPE_FENCE_CREATE_INFO,
			nullptr,
			0
		}, d.get());
	} catch(const std::runtime_error& e) {
		throw BackendInitError(std::string("Vulkan ")
			+ backend_name(kind) + " backend unavailable: "
			+ e.what());
	}

	spdlog::info("[Renderer] Using {} device: {}",
		backend_name(kind), device_name);
}

VulkanRenderer::~VulkanRenderer()
{
	if(d) {
		vkDeviceWaitIdle(d.get());
	}
}

void VulkanRenderer::select_device()
{
	// Get the number of Vulkan devices in the system:
	uint32_t dcount;
	chk_vk(vkEnumeratePhysicalDevices(vk.get(), &dcount, nullptr));

	// Get the list of VkPhysicalDevice
	std::vector<VkPhysicalDevice> pds(dcount);
	chk_vk(vkEnumeratePhysicalDevices(vk.get(), &dcount, pds.data()));

	int best_rank = 0;
	for(auto pd: pds) {
		VkPhysicalDeviceProperties props;
		vkGetPhysicalDeviceProperties(pd, &props);

		const int rank = device_rank(kind, props.deviceType);
		if(rank <= best_rank) {
			continue;
		}

		// Query queue capabilities:
		uint32_t num_qf;
		vkGetPhysicalDeviceQueueFamilyProperties(pd, &num_qf, nullptr);

		std::vector<VkQueueFamilyProperties> qfp(num_qf);
		vkGetPhysicalDeviceQueueFamilyProperties(pd, &num_qf, qfp.data());

		auto graphics = std::find_if(qfp.begin(), qfp.end(),
			[](const VkQueueFamilyProperties& p) {
				return p.queueFlags & VK_QUEUE_GRAPHICS_BIT;
			});
		if(graphics == qfp.end()) {
			continue;
		}

		// Depth formats, in order of preference.
		VkFormat depth = VK_FORMAT_UNDEFINED;
		for(VkFormat f: {VK_FORMAT_D32_SFLOAT,
			VK_FORMAT_X8_D24_UNORM_PACK32, VK_FORMAT_D16_UNORM})
		{
			VkFormatProperties fp;
			vkGetPhysicalDeviceFormatProperties(pd, f, &fp);
			if(fp.optimalTilingFeatures
				& VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT)
			{
				depth = f;
				break;
			}
		}
		if(depth == VK_FORMAT_UNDEFINED) {
			continue;
		}

		best_rank = rank;
		pdevice = pd;
		qf_idx = uint32_t(graphics - qfp.begin());
		depth_format = depth;
		device_name = props.deviceName;
	}

	if(pdevice == VK_NULL_HANDLE) {
		throw std::runtime_error("no suitable Vulkan device found");
	}
}

void VulkanRenderer::create_render_pipeline()
{
	// Create the vertex shader:
	static const uint32_t vert_shader_data[] =
		#include "thumbnail.vert.inc"
	;

	vert_shader = UVkShaderModule(VkShaderModuleCreateInfo {
		VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
		nullptr,
		0,
		sizeof vert_shader_data,
		vert_shader_data
	}, d.get());

	// Create the fragment shader:
	static const uint32_t frag_shader_data[] =
		#include "thumbnail.frag.inc"
	;

	frag_shader = UVkShaderModule(VkShaderModuleCreateInfo {
		VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
		nullptr,
		0,
		sizeof frag_shader_data,
		frag_shader_data
	}, d.get());

	const VkPipelineShaderStageCreateInfo pss[] = {
		{
			VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
			nullptr,
			0,
			VK_SHADER_STAGE_VERTEX_BIT,
			vert_shader.get(),
			"main",
			nullptr
		},
		{
			VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
			nullptr,
			0,
			VK_SHADER_STAGE_FRAGMENT_BIT,
			frag_shader.get(),
			"main",
			nullptr
		}
	};

	// Vertex data description:
	const VkVertexInputBindingDescription vibd {
		0,
		sizeof(GpuVertex),
		VK_VERTEX_INPUT_RATE_VERTEX
	};

	// Position, normal and color attributes in vertex data:
	const VkVertexInputAttributeDescription viads[] = {
		{0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(GpuVertex, position)},
		{1, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(GpuVertex, normal)},
		{2, 0, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(GpuVertex, color)}
	};

	// Vertex input description:
	const VkPipelineVertexInputStateCreateInfo pvis {
		VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO,
		nullptr,
		0,
		1,
		&vibd,
		(sizeof viads) / (sizeof viads[0]),
		viads
	};

	// Primitive assembly description
	const VkPipelineInputAssemblyStateCreateInfo pias {
		VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO,
		nullptr,
		0,
		VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST,
		VK_FALSE
	};

	// Viewport and scissor are set at draw time,
	// the output size changes between attempts.
	const VkPipelineViewportStateCreateInfo pvs {
		VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO,
		nullptr,
		0,
		1,
		nullptr,
		1,
		nullptr
	};

	const VkDynamicState dynamic_states[] = {
		VK_DYNAMIC_STATE_VIEWPORT,
		VK_DYNAMIC_STATE_SCISSOR
	};

	const VkPipelineDynamicStateCreateInfo pds {
		VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO,
		nullptr,
		0,
		(sizeof dynamic_states) / (sizeof dynamic_states[0]),
		dynamic_states
	};

	// Rasterization configuration. No culling,
	// faces of open meshes are seen from both sides.
	const VkPipelineRasterizationStateCreateInfo prs {
		VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO,
		nullptr,
		0,
		VK_FALSE,
		VK_FALSE,
		VK_POLYGON_MODE_FILL,
		VK_CULL_MODE_NONE,
		VK_FRONT_FACE_COUNTER_CLOCKWISE,
		VK_FALSE,
		0.0,
		0.0,
		0.0,
		1.0
	};

	// Multisampling configuration:
	const VkPipelineMultisampleStateCreateInfo pms {
		VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO,
		nullptr,
		0,
		VK_SAMPLE_COUNT_1_BIT,
		VK_FALSE,
		1.0,
		nullptr,
		VK_FALSE,
		VK_FALSE
	};

	// Depth buffer configuration:
	const VkPipelineDepthStencilStateCreateInfo pdss {
		VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO,
		nullptr,
		0,
		VK_TRUE,
		VK_TRUE,
		VK_COMPARE_OP_LESS,
		VK_FALSE,
		VK_FALSE,
		{},
		{},
		0.0,
		1.0
	};

	// No blending, the shader writes opaque fragments.
	const VkPipelineColorBlendAttachmentState pcbas {
		VK_FALSE,
		VK_BLEND_FACTOR_ONE,
		VK_BLEND_FACTOR_ZERO,
		VK_BLEND_OP_ADD,
		VK_BLEND_FACTOR_ONE,
		VK_BLEND_FACTOR_ZERO,
		VK_BLEND_OP_ADD,
		VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT
		| VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT
	};

	const VkPipelineColorBlendStateCreateInfo pcbs {
		VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO,
		nullptr,
		0,
		VK_FALSE,
		VK_LOGIC_OP_COPY,
		1,
		&pcbas,
		{0.0f, 0.0f, 0.0f, 0.0f}
	};

	// Uniform variable setting.
	const VkDescriptorSetLayoutBinding dslb {
		0,
		VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		1,
		VK_SHADER_STAGE_VERTEX_BIT |
		VK_SHADER_STAGE_FRAGMENT_BIT,
		nullptr
	};

	desc_set_layout = UVkDescriptorSetLayout(
		VkDescriptorSetLayoutCreateInfo{
			VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
			nullptr,
			0,
			1,
			&dslb
		}, d.get()
	);

	pipeline_layout = UVkPipelineLayout(VkPipelineLayoutCreateInfo{
		VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
		nullptr,
		0,
		1,
		&desc_set_layout.get_ref(),
		0,
		nullptr
	}, d.get());

	// Color attachment. After the render pass the image
	// is copied out to a host visible buffer.
	const VkAttachmentDescription ads[] = {
		{
			0,
			color_format,
			VK_SAMPLE_COUNT_1_BIT,
			VK_ATTACHMENT_LOAD_OP_CLEAR,
			VK_ATTACHMENT_STORE_OP_STORE,
			VK_ATTACHMENT_LOAD_OP_DONT_CARE,
			VK_ATTACHMENT_STORE_OP_DONT_CARE,
			VK_IMAGE_LAYOUT_UNDEFINED,
			VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL
		},
		{
			0,
			depth_format,
			VK_SAMPLE_COUNT_1_BIT,
			VK_ATTACHMENT_LOAD_OP_CLEAR,
			VK_ATTACHMENT_STORE_OP_DONT_CARE,
			VK_ATTACHMENT_LOAD_OP_DONT_CARE,
			VK_ATTACHMENT_STORE_OP_DONT_CARE,
			VK_IMAGE_LAYOUT_UNDEFINED,
			VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL
		}
	};

	const VkAttachmentReference color_ref {
		0,
		VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL
	};

	const VkAttachmentReference depth_ref {
		1,
		VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL
	};

	// Only subpass in our render pass:
	const VkSubpassDescription sd {
		0,
		VK_PIPELINE_BIND_POINT_GRAPHICS,
		0,
		nullptr,
		1,
		&color_ref,
		nullptr,
		&depth_ref,
		0,
		nullptr
	};

	const VkSubpassDependency sdeps[] {
		// The host written uniform buffer must be visible
		// to the shaders.
		{
			VK_SUBPASS_EXTERNAL, // srcSubpass
			0, // dstSubpass
			VK_PIPELINE_STAGE_HOST_BIT, // srcStageMask
			VK_PIPELINE_STAGE_VERTEX_SHADER_BIT
			| VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT, // dstStageMask
			VK_ACCESS_HOST_WRITE_BIT, // srcAccessMask
			VK_ACCESS_UNIFORM_READ_BIT, // dstAccessMask
			0 // dependencyFlags
		},
		// The copy to the readback buffer waits
		// for the color writes.
		{
			0, // srcSubpass
			VK_SUBPASS_EXTERNAL, // dstSubpass
			VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT, // srcStageMask
			VK_PIPELINE_STAGE_TRANSFER_BIT, // dstStageMask
			VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT, // srcAccessMask
			VK_ACCESS_TRANSFER_READ_BIT, // dstAccessMask
			0 // dependencyFlags
		}
	};

	render_pass = UVkRenderPass(VkRenderPassCreateInfo {
		VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO,
		nullptr,
		0,
		(sizeof ads) / (sizeof ads[0]),
		ads,
		1,
		&sd,
		(sizeof sdeps) / (sizeof sdeps[0]),
		sdeps
	}, d.get());

	pipeline = UVkGraphicsPipeline(VkGraphicsPipelineCreateInfo{
		VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO,
		nullptr,
		0,
		2,       // stageCount
		pss,     // pStages
		&pvis,   // pVertexInputState
		&pias,   // pInputAssemblyState
		nullptr, // pTessellationState
		&pvs,    // pViewportState
		&prs,    // pRasterizationState
		&pms,    // pMultisampleState
		&pdss,   // pDepthStencilState
		&pcbs,   // pColorBlendState
		&pds,    // pDynamicState
		pipeline_layout.get(), // layout
		render_pass.get(),     // renderPass
		0,                     // subpass
		VK_NULL_HANDLE, // basePipelineHandle
		-1              // basePipelineIndex
	}, d.get(), nullptr, 1u);

	// The uniform buffer stays host visible, it is small
	// and rewritten on every frame.
	uniform_buf = Buffer{d.get(), mem_props,
		VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
		sizeof(UniformData),
		VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT,
		VK_MEMORY_PROPERTY_HOST_COHERENT_BIT
	};

	const VkDescriptorPoolSize dps {
		VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		1
	};
	desc_pool = UVkDescriptorPool(VkDescriptorPoolCreateInfo{
		VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
		nullptr,
		0,
		1,
		1,
		&dps
	}, d.get());

	const VkDescriptorSetAllocateInfo dsai {
		VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
		nullptr,
		desc_pool.get(),
		1,
		&desc_set_layout.get_ref()
	};
	chk_vk(vkAllocateDescriptorSets(d.get(), &dsai, &desc_set));

	const VkDescriptorBufferInfo buffer_info {
		uniform_buf.buf.get(),
		0,
		VK_WHOLE_SIZE
	};

	const VkWriteDescriptorSet wds {
		VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
		nullptr,
		desc_set,
		0,
		0,
		1,
		VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		nullptr,
		&buffer_info,
		nullptr
	};
	vkUpdateDescriptorSets(d.get(), 1, &wds, 0, nullptr);
}

RawPixelBuffer VulkanRenderer::render(const SceneDescription& scene,
	uint32_t width, uint32_t height)
{
	if(!scene.mesh || scene.mesh->indices.empty()) {
		throw RenderError("Scene has nothing to draw.");
	}

	try {
		return draw(scene, width, height);
	} catch(const std::runtime_error& e) {
		// Either a failed Vulkan call or no memory
		// suitable for this frame size.
		throw RenderError(std::string("Vulkan render failed: ")
			+ e.what());
	} catch(const std::bad_alloc&) {
		throw RenderError("Out of host memory while rendering "
			+ std::to_string(width) + "x" + std::to_string(height));
	}
}

RawPixelBuffer VulkanRenderer::draw(const SceneDescription& scene,
	uint32_t width, uint32_t height)
{
	StagingUploader uploader{d.get(), mem_props,
		command_pool.get(), queue};
	MeshBuffers mesh{d.get(), mem_props, *scene.mesh, uploader};

	// Set the shading parameters.
	{
		MemMapper map{d.get(), uniform_buf.mem.get()};
		auto params = map.get<UniformData*>();

		const CameraSpec& cam = scene.camera;
		params->view_proj = projection_matrix(cam) * cam.view;
		for(size_t i = 0; i < scene.lights.size(); ++i) {
			params->light_dir[i] = Vec4{scene.lights[i].direction, 0.0f};
			params->light_intensity[i] = scene.lights[i].intensity;
		}
		params->light_intensity.w = 0.0f;
		params->albedo = Vec4{Vec3{scene.style.grey},
			scene.use_vertex_color() ? 1.0f : 0.0f};
		params->shading = Vec4{scene.style.ambient,
			scene.style.exposure, 0.0f, 0.0f};
		params->view_dir = Vec4{cam.back, 0.0f};
	}

	if(!target || target->width != width || target->height != height) {
		target.reset();
		target = std::make_unique<RenderTarget>(d.get(), mem_props,
			render_pass.get(), depth_format, width, height);
	}

	// Where the finished image is copied to.
	const VkDeviceSize image_size = VkDeviceSize(width) * height * 4;
	Buffer readback{d.get(), mem_props,
		VK_BUFFER_USAGE_TRANSFER_DST_BIT,
		image_size,
		VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT,
		VK_MEMORY_PROPERTY_HOST_COHERENT_BIT
		| VK_MEMORY_PROPERTY_HOST_CACHED_BIT
	};

	UVkCommandBuffers cmd_bufs{d.get(), VkCommandBufferAllocateInfo{
		VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
		nullptr,
		command_pool.get(),
		VK_COMMAND_BUFFER_LEVEL_PRIMARY,
		1
	}};

	// Start recording the commands in the command buffer.
	const VkCommandBufferBeginInfo cbbi{
		VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
		nullptr,
		VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
		nullptr
	};
	chk_vk(vkBeginCommandBuffer(cmd_bufs[0], &cbbi));

	// Transparent clear, the background is composited later.
	VkClearValue cv[2];
	const Vec3& bg = scene.style.background;
	cv[0].color = {{bg.r, bg.g, bg.b, 0.0f}};
	cv[1].depthStencil = {1.0, 0};

	const VkRenderPassBeginInfo rpbi {
		VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO,
		nullptr,
		render_pass.get(),
		target->framebuffer.get(),
		{
			{0, 0},
			{width, height}
		},
		2,
		cv
	};
	vkCmdBeginRenderPass(cmd_bufs[0], &rpbi, VK_SUBPASS_CONTENTS_INLINE);

	const VkViewport viewport {
		0.0f,
		0.0f,
		float(width),
		float(height),
		0.0f,
		1.0f
	};
	vkCmdSetViewport(cmd_bufs[0], 0, 1, &viewport);

	const VkRect2D scissor = {
		{0, 0},
		{width, height}
	};
	vkCmdSetScissor(cmd_bufs[0], 0, 1, &scissor);

	// Bind the pipeline:
	vkCmdBindPipeline(cmd_bufs[0], VK_PIPELINE_BIND_POINT_GRAPHICS,
		pipeline.get());

	// Bind the uniform variable.
	vkCmdBindDescriptorSets(cmd_bufs[0],
		VK_PIPELINE_BIND_POINT_GRAPHICS,
		pipeline_layout.get(), 0, 1,
		&desc_set, 0, nullptr);

	// Bind vertex buffer.
	const VkDeviceSize zero_offset = 0;
	vkCmdBindVertexBuffers(cmd_bufs[0], 0, 1,
		&mesh.vertex.buf.get_ref(), &zero_offset);

	// Bind index buffer.
	vkCmdBindIndexBuffer(cmd_bufs[0],
		mesh.index.buf.get(), 0, VK_INDEX_TYPE_UINT32);

	// Draw the object:
	vkCmdDrawIndexed(cmd_bufs[0], mesh.idx_count, 1, 0, 0, 0);

	vkCmdEndRenderPass(cmd_bufs[0]);

	// Copy the color image out, tightly packed.
	const VkBufferImageCopy region {
		0,
		0,
		0,
		{VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1},
		{0, 0, 0},
		{width, height, 1}
	};
	vkCmdCopyImageToBuffer(cmd_bufs[0], target->color_image.get(),
		VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
		readback.buf.get(), 1, &region);

	// Make the copy visible to the host.
	const VkBufferMemoryBarrier bmb {
		VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER,
		nullptr,
		VK_ACCESS_TRANSFER_WRITE_BIT,
		VK_ACCESS_HOST_READ_BIT,
		VK_QUEUE_FAMILY_IGNORED,
		VK_QUEUE_FAMILY_IGNORED,
		readback.buf.get(),
		0,
		VK_WHOLE_SIZE
	};
	vkCmdPipelineBarrier(cmd_bufs[0],
		VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_HOST_BIT,
		0, 0, nullptr, 1, &bmb, 0, nullptr);

	chk_vk(vkEndCommandBuffer(cmd_bufs[0]));

	const VkSubmitInfo si{
		VK_STRUCTURE_TYPE_SUBMIT_INFO,
		nullptr,
		0,
		nullptr,
		nullptr,
		1,
		&cmd_bufs[0],
		0,
		nullptr
	};
	chk_vk(vkQueueSubmit(queue, 1, &si, frame_fence.get()));

	VkResult ret;
	do {
		ret = vkWaitForFences(d.get(), 1, &frame_fence.get_ref(),
			VK_TRUE, 1000ul*1000ul*1000ul*60ul /* one minute */);
	} while (ret == VK_TIMEOUT);
	chk_vk(ret);
	chk_vk(vkResetFences(d.get(), 1, &frame_fence.get_ref()));

	RawPixelBuffer out;
	out.width = width;
	out.height = height;
	out.rgba.resize(image_size);
	{
		MemMapper map{d.get(), readback.mem.get()};
		map.invalidate();
		auto src = map.get<const uint8_t*>();
		std::copy(src, src + image_size, out.rgba.begin());
	}

	return out;
}

std::unique_ptr<Renderer> make_vulkan_renderer(RendererBackend backend)
{
	return std::make_unique<VulkanRenderer>(backend);
}
