#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "config.hpp"

real parse_real(const std::string& s)
{
	const char* begin = s.c_str();
	char *endptr;
	errno = 0;
	const double val = std::strtod(begin, &endptr);

	if(endptr == begin || *endptr != '\0' || errno == ERANGE
		|| !std::isfinite(val))
	{
		throw std::invalid_argument("Invalid number \"" + s + "\".");
	}
	return real(val);
}

uint32_t parse_size(const std::string& s)
{
	const char* begin = s.c_str();
	char *endptr;
	errno = 0;
	const long long val = std::strtoll(begin, &endptr, 10);

	if(endptr == begin || *endptr != '\0' || errno == ERANGE
		|| val <= 0 || val > 16384)
	{
		throw std::invalid_argument("Invalid size \"" + s
			+ "\", expected an integer between 1 and 16384.");
	}
	return uint32_t(val);
}

uint32_t parse_frame_count(const std::string& s)
{
	return s == "0" ? 0 : parse_size(s);
}

Vec3 parse_rgb(const std::string& s)
{
	std::stringstream ss{s};
	std::string item;
	Vec3 ret;
	int count = 0;

	while(std::getline(ss, item, ',')) {
		if(count == 3) {
			count = 4;
			break;
		}
		const real v = parse_real(item);
		if(v < 0.0f || v > 1.0f) {
			throw std::invalid_argument("Color component \"" + item
				+ "\" is outside [0, 1].");
		}
		ret[count++] = v;
	}

	// getline drops an empty last field, "1,1,1," would pass.
	if(count != 3 || s.back() == ',') {
		throw std::invalid_argument("Invalid color \"" + s
			+ "\", expected r,g,b.");
	}
	return ret;
}

BackendMode parse_backend_mode(const std::string& s)
{
	if(s == "auto") {
		return BackendMode::Auto;
	}
	if(s == "gpu") {
		return BackendMode::Gpu;
	}
	if(s == "cpu") {
		return BackendMode::Cpu;
	}
	throw std::invalid_argument("Invalid backend \"" + s
		+ "\", expected auto, gpu or cpu.");
}

UpAxis parse_up_axis(const std::string& s)
{
	if(s == "z" || s == "Z") {
		return UpAxis::Z;
	}
	if(s == "y" || s == "Y") {
		return UpAxis::Y;
	}
	throw std::invalid_argument("Invalid up axis \"" + s
		+ "\", expected z or y.");
}

const char* backend_mode_name(BackendMode mode)
{
	switch(mode) {
	case BackendMode::Gpu:
		return "gpu";
	case BackendMode::Cpu:
		return "cpu";
	case BackendMode::Auto:
	default:
		return "auto";
	}
}

BackendPlan backend_plan(BackendMode mode)
{
	switch(mode) {
	case BackendMode::Gpu:
		return BackendPlan{RendererBackend::Gpu, std::nullopt};
	case BackendMode::Cpu:
		return BackendPlan{RendererBackend::Software, std::nullopt};
	case BackendMode::Auto:
	default:
		return BackendPlan{RendererBackend::Gpu, RendererBackend::Software};
	}
}

void validate_config(const ThumbnailConfig& cfg)
{
	if(cfg.size == 0 || cfg.min_size == 0 || cfg.placeholder_size == 0) {
		throw std::invalid_argument("Sizes must be positive.");
	}
	if(cfg.turntable.size == 0) {
		throw std::invalid_argument("Turntable size must be positive.");
	}
	if(!(cfg.max_ratio > 0.0)) {
		throw std::invalid_argument("Size ratio must be positive.");
	}
	if(!(cfg.framing.margin >= 0.0f)) {
		throw std::invalid_argument("Margin must not be negative.");
	}
	if(!(cfg.style.grey >= 0.0f && cfg.style.grey <= 1.0f)) {
		throw std::invalid_argument("Grey level must be within [0, 1].");
	}
}

// Applies the variable if set, logging and ignoring malformed values.
template <typename F>
static void overlay(const char* name, const F& apply)
{
	const char* val = std::getenv(name);
	if(!val || !*val) {
		return;
	}

	try {
		apply(std::string(val));
	} catch(const std::invalid_argument& e) {
		spdlog::warn("[Config] Ignoring {}: {}", name, e.what());
	}
}

ThumbnailConfig load_config_from_env(ThumbnailConfig cfg)
{
	overlay("THUMBNAIL_SIZE", [&](const std::string& v) {
		cfg.size = parse_size(v);
	});
	overlay("THUMBNAIL_MARGIN", [&](const std::string& v) {
		const real m = parse_real(v);
		if(m < 0.0f) {
			throw std::invalid_argument("negative margin");
		}
		cfg.framing.margin = m;
	});
	overlay("THUMBNAIL_AZIM_DEG", [&](const std::string& v) {
		cfg.framing.azimuth_deg = parse_real(v);
	});
	overlay("THUMBNAIL_ELEV_DEG", [&](const std::string& v) {
		cfg.framing.elevation_deg = parse_real(v);
	});
	overlay("THUMBNAIL_BG_RGB", [&](const std::string& v) {
		cfg.style.background = parse_rgb(v);
	});
	overlay("MODEL_GREY", [&](const std::string& v) {
		const real g = parse_real(v);
		if(g < 0.0f || g > 1.0f) {
			throw std::invalid_argument("grey outside [0, 1]");
		}
		cfg.style.grey = g;
	});
	overlay("THUMBNAIL_BACKEND", [&](const std::string& v) {
		cfg.backend = parse_backend_mode(v);
	});
	overlay("THUMBNAIL_MAX_RATIO", [&](const std::string& v) {
		const real r = parse_real(v);
		if(!(r > 0.0f)) {
			throw std::invalid_argument("ratio must be positive");
		}
		cfg.max_ratio = r;
	});
	overlay("THUMBNAIL_MIN_SIZE", [&](const std::string& v) {
		cfg.min_size = parse_size(v);
	});
	overlay("THUMBNAIL_TURNTABLE_FRAMES", [&](const std::string& v) {
		cfg.turntable.frames = parse_frame_count(v);
	});
	overlay("THUMBNAIL_TURNTABLE_SIZE", [&](const std::string& v) {
		cfg.turntable.size = parse_size(v);
	});
	overlay("UPLOAD_DIR", [&](const std::string& v) {
		cfg.paths.source_root = v;
	});
	overlay("THUMBNAILS_DIR", [&](const std::string& v) {
		cfg.paths.artifact_root = v;
	});
	overlay("THUMBNAIL_SCRATCH_DIR", [&](const std::string& v) {
		cfg.paths.scratch_root = v;
	});
	overlay("MESHTHUMB_LOG_LEVEL", [&](const std::string& v) {
		const auto lvl = spdlog::level::from_str(v);
		// from_str gives "off" for anything it doesn't know.
		if(lvl == spdlog::level::off && v != "off") {
			throw std::invalid_argument("unknown level \"" + v + "\"");
		}
		cfg.log_level = lvl;
	});

	return cfg;
}
