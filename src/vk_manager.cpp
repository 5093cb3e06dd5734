#include "vk_manager.hpp"

void chk_vk(VkResult err)
{
	if(err != VK_SUCCESS) {
		throw VulkanCreationError{err};
	}
}

UVkCommandBuffers::UVkCommandBuffers(
	VkDevice device, const VkCommandBufferAllocateInfo& info)
{
	std::unique_ptr<VkCommandBuffer[]> ptr{
		new VkCommandBuffer[info.commandBufferCount]
	};
	chk_vk(vkAllocateCommandBuffers(device, &info, ptr.get()));

	// Store in the unique_ptr.
	bufs = decltype(bufs){ptr.release(), Deleter{
		device,
		info.commandPool,
		info.commandBufferCount
	}};
}

void UVkCommandBuffers::Deleter::operator()(VkCommandBuffer* bufs)
{
	vkFreeCommandBuffers(d, cp, count, bufs);
	delete[] bufs;
}
