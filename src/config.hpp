#pragma once

#include <string>
#include <cstdint>

#include <spdlog/common.h>

#include "float.hpp"
#include "normalizer.hpp"
#include "camera_framing.hpp"
#include "scene.hpp"
#include "quality_controller.hpp"
#include "publisher.hpp"
#include "turntable.hpp"

enum class BackendMode
{
	// Gpu, then Software.
	Auto,
	// Gpu only.
	Gpu,
	// Software only.
	Cpu
};

struct ThumbnailConfig
{
	// Starting resolution, width and height.
	uint32_t size = 1024;
	double max_ratio = 0.5;
	uint32_t min_size = 64;

	FramingParams framing;
	UpAxis source_up = UpAxis::Z;
	SceneStyle style;

	BackendMode backend = BackendMode::Auto;
	uint32_t placeholder_size = 256;

	TurntableParams turntable;

	PublisherPaths paths;

	spdlog::level::level_enum log_level = spdlog::level::info;
};

// Parsers for user given values. All of them throw
// std::invalid_argument on malformed input.
real parse_real(const std::string& s);
uint32_t parse_size(const std::string& s);
// Like parse_size, but 0 is allowed.
uint32_t parse_frame_count(const std::string& s);
Vec3 parse_rgb(const std::string& s);
BackendMode parse_backend_mode(const std::string& s);
UpAxis parse_up_axis(const std::string& s);

const char* backend_mode_name(BackendMode mode);

BackendPlan backend_plan(BackendMode mode);

// Throws std::invalid_argument if some value is out of range.
void validate_config(const ThumbnailConfig& cfg);

// Overlays the THUMBNAIL_* and related environment variables on
// the given defaults. Malformed values are reported and ignored.
ThumbnailConfig load_config_from_env(ThumbnailConfig cfg = {});
