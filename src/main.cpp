#include <iostream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cli.hpp"
#include "vulkan_renderer.hpp"

static std::unique_ptr<ThumbnailPipeline> make_pipeline(
	const ThumbnailConfig& cfg)
{
	return std::make_unique<ThumbnailPipeline>(cfg,
		std::make_unique<AssimpMeshLoader>(), make_vulkan_renderer);
}

int main(int argc, char *argv[])
{
	// Logs go to stderr, stdout is kept for the result lines.
	spdlog::set_default_logger(spdlog::stderr_color_mt("meshthumb"));

	return run_cli(argc, argv, load_config_from_env(), make_pipeline,
		std::cout, std::cerr);
}
