#include "buffer.hpp"

uint32_t find_memory_heap(
	const VkPhysicalDeviceMemoryProperties& mem_props,
	uint32_t allowed,
	VkMemoryPropertyFlags required,
	VkMemoryPropertyFlags prefered)
{
	std::optional<uint32_t> found;
	for(uint32_t i = 0; i < mem_props.memoryTypeCount; ++i) {
		const VkMemoryPropertyFlags flags =
			mem_props.memoryTypes[i].propertyFlags;
		if(!(allowed & (1u << i)) || (flags & required) != required) {
			continue;
		}

		if((flags & prefered) == prefered) {
			return i;
		}
		if(!found) {
			found = i;
		}
	}

	if(!found) {
		throw std::runtime_error("No suitable memory type found.");
	}
	return *found;
}

Buffer::Buffer(VkDevice d,
	const VkPhysicalDeviceMemoryProperties& mem_props,
	VkBufferUsageFlags usage, VkDeviceSize size,
	VkMemoryPropertyFlags required,
	VkMemoryPropertyFlags prefered
):
	buf{VkBufferCreateInfo{
			VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
			nullptr,
			0,
			size,
			usage,
			VK_SHARING_MODE_EXCLUSIVE,
			0,
			nullptr
		}, d
	}
{
	VkMemoryRequirements reqs;
	vkGetBufferMemoryRequirements(d, buf.get(), &reqs);

	mem = UVkDeviceMemory{VkMemoryAllocateInfo{
			VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO,
			nullptr,
			reqs.size,
			find_memory_heap(mem_props, reqs.memoryTypeBits,
				required, prefered)
		}, d
	};
	chk_vk(vkBindBufferMemory(d, buf.get(), mem.get(), 0));
}

UploadBuffer::UploadBuffer(
	VkDevice d, const VkPhysicalDeviceMemoryProperties& mem_props,
	VkBufferUsageFlags usage, VkDeviceSize size)
{
	try {
		*static_cast<Buffer*>(this) = Buffer{
			d, mem_props, usage, size,
			VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT
			| VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT, 0};
		is_host_visible = true;
	} catch(const std::runtime_error&) {
		// Discrete device: the data arrives by copy.
		*static_cast<Buffer*>(this) = Buffer{
			d, mem_props, usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
			size, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, 0};
		is_host_visible = false;
	}
}

Buffer& StagingUploader::staging(VkDeviceSize size)
{
	if(!stage_buf || stage_size < size) {
		stage_buf = std::make_unique<Buffer>(d, mem_props,
			VK_BUFFER_USAGE_TRANSFER_SRC_BIT, size,
			VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT, 0);
		stage_size = size;
	}
	return *stage_buf;
}

void StagingUploader::copy_and_wait(VkBuffer src, VkBuffer dst,
	VkDeviceSize size)
{
	if(!cb) {
		cb = UVkCommandBuffers{d, VkCommandBufferAllocateInfo{
			VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
			nullptr,
			cp,
			VK_COMMAND_BUFFER_LEVEL_PRIMARY,
			1
		}};
	}

	const VkCommandBufferBeginInfo cbbi {
		VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
		nullptr,
		VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
		nullptr
	};
	const VkBufferCopy region{0, 0, size};

	chk_vk(vkBeginCommandBuffer(cb[0], &cbbi));
	vkCmdCopyBuffer(cb[0], src, dst, 1, &region);
	chk_vk(vkEndCommandBuffer(cb[0]));

	const VkSubmitInfo si{
		VK_STRUCTURE_TYPE_SUBMIT_INFO,
		nullptr,
		0,
		nullptr,
		nullptr,
		1,
		&cb[0],
		0,
		nullptr
	};
	chk_vk(vkQueueSubmit(q, 1, &si, VK_NULL_HANDLE));

	// The staging buffer is reused by the next upload.
	chk_vk(vkQueueWaitIdle(q));
}
