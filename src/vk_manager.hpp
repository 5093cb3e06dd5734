#pragma once

#include <memory>
#include <string>
#include <utility>
#include <stdexcept>
#include <type_traits>

#include <vulkan/vulkan.h>

// Error thrown if the create_vk fails.
struct VulkanCreationError: public std::runtime_error
{
public:
	VulkanCreationError(VkResult err):
		std::runtime_error{err_msg(err)},
		code{err}
	{}

	VkResult code;

private:
	static std::string err_msg(VkResult err)
	{
		return "Vulkan call failed: error code "
			+ std::to_string(err) + '.';
	}
};

// Throws if parameter is different from success.
void chk_vk(VkResult err);

// Memory mapping guard. Flushes and unmap when destroyed.
class MemMapper
{
public:
	MemMapper(
		VkDevice device, VkDeviceMemory memory,
		VkDeviceSize offset=0, VkDeviceSize size=VK_WHOLE_SIZE
	):
		d(device),
		m(memory),
		o(offset)
	{
		// Map the memory range.
		chk_vk(vkMapMemory(d, m, offset, size, 0, &data));
	}

	~MemMapper()
	{
		flush();

		// Unmap it.
		vkUnmapMemory(d, m);
	}

	MemMapper(const MemMapper&) = delete;
	void operator=(const MemMapper&) = delete;

	// Makes host writes visible to the device.
	void flush()
	{
		const VkMappedMemoryRange range = whole_range();
		vkFlushMappedMemoryRanges(d, 1, &range);
	}

	// Makes device writes visible to the host.
	void invalidate()
	{
		const VkMappedMemoryRange range = whole_range();
		chk_vk(vkInvalidateMappedMemoryRanges(d, 1, &range));
	}

	template<typename T>
	T get()
	{
		return static_cast<T>(data);
	}

private:
	VkMappedMemoryRange whole_range() const
	{
		return VkMappedMemoryRange {
			VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE,
			nullptr,
			m,
			o,
			VK_WHOLE_SIZE
		};
	}

	VkDevice d;
	VkDeviceMemory m;
	VkDeviceSize o;
	void *data = nullptr;
};

// Find the last argument type of a function pointer type.
// Adapted from https://stackoverflow.com/a/46560993/578749
template<typename T>
struct tag
{
	using type = T;
};

template<typename F>
struct select_last;

template<typename R, typename... Ts>
struct select_last<R(*)(Ts...)>
{
	using type = typename decltype((tag<Ts>{}, ...))::type;
};

// Find the first argument type of a function pointer type.
template<typename F>
struct select_first;

template<typename R, typename T, typename... Ts>
struct select_first<R(*)(T, Ts...)>
{
	using type = T;
};

// Base class for automatic manager of Vulkan objects.
// The destructor is provided by the derived class.
template <auto CreateFn>
class Manager
{
public:
	using ManagedType = typename std::remove_pointer<
			typename select_last<decltype(CreateFn)>::type
		>::type;

	Manager() = default;

	ManagedType get() const
	{
		return obj;
	}

	// Reference to the handle, for APIs taking arrays of them.
	const ManagedType& get_ref() const
	{
		return obj;
	}

	operator bool () const
	{
		return obj != VK_NULL_HANDLE;
	}

	// Non-copyable:
	Manager(const Manager&) = delete;
	void operator=(const Manager&) = delete;

protected:
	// Only constructable by base class:
	template<typename CreateInfo, typename... Args>
	Manager(const CreateInfo& info, Args... args)
	{
		// Create the object.
		chk_vk(CreateFn(args..., &info, nullptr, &obj));
	}

	ManagedType release()
	{
		return std::exchange(obj, VK_NULL_HANDLE);
	}

	ManagedType obj = VK_NULL_HANDLE;
};

// Manages a Vulkan object, pretty much like an
// std::unique_ptr would do, but taking the creation
// info as reference, for convenience.
template <auto CreateFn, auto DestroyFn>
class ManagedVk:
	public Manager<CreateFn>
{
public:
	ManagedVk() = default;

	template<typename CreateInfo, typename... Args>
	ManagedVk(const CreateInfo& info, Args... args):
		Manager<CreateFn>{info, args...}
	{}

	ManagedVk(ManagedVk&& other)
	{
		this->obj = other.release();
	}

	ManagedVk& operator=(ManagedVk&& other)
	{
		if(this != &other) {
			destroy();
			this->obj = other.release();
		}
		return *this;
	}

	~ManagedVk()
	{
		destroy();
	}

private:
	void destroy()
	{
		// I will not count on all Vulkan destroy functions
		// accepting nullptr as input, so I check if not null.
		if(this->obj) {
			DestroyFn(this->release(), nullptr);
		}
	}
};

// Manages a Vulkan object whose destructor takes the
// same first argument as the constructor.
template <auto CreateFn, auto DestroyFn>
class ManagedDPVk:
	public Manager<CreateFn>
{
public:
	using DestroyParamType = typename select_first<decltype(DestroyFn)>::type;

	ManagedDPVk() = default;

	template<typename CreateInfo, typename... Args>
	ManagedDPVk(const CreateInfo& info, DestroyParamType dparam, Args... args):
		Manager<CreateFn>{info, dparam, args...},
		destroy_param(dparam)
	{}

	ManagedDPVk(ManagedDPVk&& other):
		destroy_param{other.destroy_param}
	{
		this->obj = other.release();
	}

	ManagedDPVk& operator=(ManagedDPVk&& other)
	{
		if(this != &other) {
			destroy();
			destroy_param = other.destroy_param;
			this->obj = other.release();
		}
		return *this;
	}

	~ManagedDPVk()
	{
		destroy();
	}

private:
	void destroy()
	{
		// I will not count on all Vulkan destroy functions
		// accepting nullptr as input, so I check if not null.
		if(this->obj) {
			DestroyFn(destroy_param, this->release(), nullptr);
		}
	}

	DestroyParamType destroy_param = VK_NULL_HANDLE;
};

// Naming the managed types, for convenience.
using UVkInstance = ManagedVk<vkCreateInstance, vkDestroyInstance>;

using UVkDevice = ManagedVk<vkCreateDevice, vkDestroyDevice>;

using UVkBuffer = ManagedDPVk<vkCreateBuffer, vkDestroyBuffer>;

using UVkDeviceMemory = ManagedDPVk<vkAllocateMemory, vkFreeMemory>;

using UVkShaderModule = ManagedDPVk<
	vkCreateShaderModule,
	vkDestroyShaderModule
>;

using UVkDescriptorSetLayout = ManagedDPVk<
	vkCreateDescriptorSetLayout,
	vkDestroyDescriptorSetLayout
>;

using UVkDescriptorPool = ManagedDPVk<
	vkCreateDescriptorPool,
	vkDestroyDescriptorPool
>;

using UVkPipelineLayout = ManagedDPVk<
	vkCreatePipelineLayout,
	vkDestroyPipelineLayout
>;

using UVkRenderPass = ManagedDPVk<vkCreateRenderPass, vkDestroyRenderPass>;

using UVkGraphicsPipeline = ManagedDPVk<
	vkCreateGraphicsPipelines,
	vkDestroyPipeline
>;

using UVkImage = ManagedDPVk<
	vkCreateImage,
	vkDestroyImage
>;

using UVkImageView = ManagedDPVk<
	vkCreateImageView,
	vkDestroyImageView
>;

using UVkFramebuffer = ManagedDPVk<
	vkCreateFramebuffer,
	vkDestroyFramebuffer
>;

using UVkCommandPool = ManagedDPVk<
	vkCreateCommandPool,
	vkDestroyCommandPool
>;

using UVkFence = ManagedDPVk<vkCreateFence, vkDestroyFence>;

// Command buffers are allocated in batches from a pool,
// so they don't fit the Manager above.
class UVkCommandBuffers
{
public:
	UVkCommandBuffers() = default;
	UVkCommandBuffers(VkDevice device,
		const VkCommandBufferAllocateInfo& info);

	explicit operator bool () const
	{
		return bool(bufs);
	}

	VkCommandBuffer& operator[](size_t idx)
	{
		return bufs[idx];
	}

	const VkCommandBuffer& operator[](size_t idx) const
	{
		return bufs[idx];
	}

private:
	struct Deleter
	{
		VkDevice d;
		VkCommandPool cp;
		uint32_t count;

		void operator()(VkCommandBuffer* bufs);
	};

	std::unique_ptr<VkCommandBuffer[], Deleter> bufs;
};
