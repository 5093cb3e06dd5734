#pragma once

#include <map>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <optional>
#include <functional>

#include "renderer.hpp"
#include "image_codec.hpp"

struct QualityBudget
{
	uint32_t start = 1024;
	uint64_t source_bytes = 0;

	// Largest accepted thumbnail size, relative to the source.
	double ratio = 0.5;

	// Accepted unconditionally once reached.
	uint32_t floor = 64;

	uint64_t byte_limit() const
	{
		return uint64_t(double(source_bytes) * ratio);
	}
};

// One render, composite and encode at a given resolution.
struct RenderAttempt
{
	uint32_t resolution = 0;
	size_t bytes = 0;
	std::vector<uint8_t> png;
	RendererBackend backend = RendererBackend::Gpu;
};

struct BackendPlan
{
	RendererBackend primary = RendererBackend::Gpu;
	std::optional<RendererBackend> fallback;
};

enum class BackendState
{
	Primary,
	Fallback,
	Fail
};

using ImageEncoder = std::function<std::vector<uint8_t>(const RgbImage&)>;

// Renders at decreasing resolutions until the encoded image fits the
// budget, switching to the fallback backend if the primary fails.
//
// Renderers are created on first use and kept for the lifetime of
// the controller. A backend that failed to initialize is not tried
// again.
class QualityController
{
public:
	QualityController(RendererFactory factory, BackendPlan plan,
		ImageEncoder encoder = encode_png);

	// Throws BackendInitError or RenderError when every backend of
	// the plan failed, and EncodeError if encoding failed.
	RenderAttempt run(const SceneDescription& scene,
		const QualityBudget& budget);

	// A single render at the given resolution, with the same
	// backend fallback as run() but no byte budget.
	RenderAttempt render_frame(const SceneDescription& scene,
		uint32_t resolution);

	// Takes effect on the next run. Renderers already
	// created are kept.
	void set_plan(const BackendPlan& p)
	{
		plan = p;
	}

	const BackendPlan& get_plan() const
	{
		return plan;
	}

	BackendState state() const
	{
		return st;
	}

	// Iterations of the last run, including the one that failed.
	size_t attempts() const
	{
		return attempt_count;
	}

	bool used_fallback() const
	{
		return st == BackendState::Fallback;
	}

	// Upper bound of iterations for the budget.
	static size_t max_attempts(const QualityBudget& budget);

private:
	RendererBackend current_backend() const;
	Renderer& renderer_for(RendererBackend b);
	RawPixelBuffer render_once(const SceneDescription& scene,
		uint32_t resolution);
	bool switch_to_fallback(RendererBackend failed, const char* what);

	RendererFactory factory;
	BackendPlan plan;
	ImageEncoder encoder;

	BackendState st = BackendState::Primary;
	size_t attempt_count = 0;

	std::map<RendererBackend, std::unique_ptr<Renderer>> renderers;
	std::map<RendererBackend, std::string> init_failures;
};
