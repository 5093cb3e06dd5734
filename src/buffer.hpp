#pragma once

#include <memory>
#include <optional>
#include <type_traits>

#include "vk_manager.hpp"

// Index of the first memory type in "allowed" with all the "required"
// properties, stopping early at one that also has the "prefered" ones.
uint32_t find_memory_heap(
	const VkPhysicalDeviceMemoryProperties& mem_props,
	uint32_t allowed,
	VkMemoryPropertyFlags required,
	VkMemoryPropertyFlags prefered);

struct Buffer
{
	Buffer() = default;
	Buffer(VkDevice device,
		const VkPhysicalDeviceMemoryProperties& mem_props,
		VkBufferUsageFlags usage, VkDeviceSize size,
		VkMemoryPropertyFlags required,
		VkMemoryPropertyFlags prefered);

	UVkDeviceMemory mem;
	UVkBuffer buf;
};

// Device local buffer the host fills once. Mapped directly when the
// device has memory both local and host visible (integrated GPUs, CPU
// devices), otherwise filled through a staging copy.
struct UploadBuffer: public Buffer
{
	UploadBuffer(VkDevice d,
		const VkPhysicalDeviceMemoryProperties& mem_props,
		VkBufferUsageFlags usage, VkDeviceSize size);

	bool is_host_visible;
};

// Fills UploadBuffers, keeping one staging buffer and command buffer
// around for the buffers that are not host visible.
class StagingUploader
{
public:
	StagingUploader(VkDevice device,
		const VkPhysicalDeviceMemoryProperties& mem_props,
		VkCommandPool cmd_pool, VkQueue queue):
		d{device},
		mem_props{mem_props},
		cp{cmd_pool},
		q{queue}
	{}

	// Calls fill with a T pointing to room for count elements,
	// and makes what it wrote visible to the device.
	template <typename T, typename F>
	void upload(const UploadBuffer& dst, size_t count, const F& fill)
	{
		if(dst.is_host_visible) {
			MemMapper map{d, dst.mem.get()};
			fill(map.get<T>());
			map.flush();
			return;
		}

		const VkDeviceSize size = count *
			sizeof(typename std::remove_pointer<T>::type);
		Buffer& stage = staging(size);
		{
			MemMapper map{d, stage.mem.get()};
			fill(map.get<T>());
			map.flush();
		}
		copy_and_wait(stage.buf.get(), dst.buf.get(), size);
	}

private:
	Buffer& staging(VkDeviceSize size);
	void copy_and_wait(VkBuffer src, VkBuffer dst, VkDeviceSize size);

	VkDevice d;
	const VkPhysicalDeviceMemoryProperties& mem_props;
	VkCommandPool cp;
	VkQueue q;

	UVkCommandBuffers cb;
	std::unique_ptr<Buffer> stage_buf;
	VkDeviceSize stage_size = 0;
};
