#include <new>
#include <cmath>
#include <string>
#include <stdexcept>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "quality_controller.hpp"

QualityController::QualityController(RendererFactory factory,
	BackendPlan plan, ImageEncoder encoder
):
	factory{std::move(factory)},
	plan{plan},
	encoder{std::move(encoder)}
{}

size_t QualityController::max_attempts(const QualityBudget& budget)
{
	if(budget.start <= budget.floor) {
		return 1;
	}
	return size_t(std::ceil(std::log2(
		double(budget.start) / double(budget.floor)))) + 1;
}

RendererBackend QualityController::current_backend() const
{
	return st == BackendState::Fallback && plan.fallback
		? *plan.fallback : plan.primary;
}

Renderer& QualityController::renderer_for(RendererBackend b)
{
	auto failed = init_failures.find(b);
	if(failed != init_failures.end()) {
		throw BackendInitError(failed->second);
	}

	auto& r = renderers[b];
	if(!r) {
		try {
			r = factory(b);
		} catch(const BackendInitError& e) {
			renderers.erase(b);
			init_failures.emplace(b, e.what());
			throw;
		}
		if(!r) {
			renderers.erase(b);
			const std::string msg = std::string("No renderer for the ")
				+ backend_name(b) + " backend.";
			init_failures.emplace(b, msg);
			throw BackendInitError(msg);
		}
	}
	return *r;
}

bool QualityController::switch_to_fallback(RendererBackend failed,
	const char* what)
{
	if(st != BackendState::Primary || !plan.fallback) {
		spdlog::warn("[Quality] {} backend failed, no fallback left: {}",
			backend_name(failed), what);
		st = BackendState::Fail;
		return false;
	}

	spdlog::warn("[Quality] {} backend failed, retrying with {}: {}",
		backend_name(failed), backend_name(*plan.fallback), what);
	st = BackendState::Fallback;
	return true;
}

// Throws RenderError unless raw is a full RGBA frame of the size asked.
static void check_frame(const RawPixelBuffer& raw, uint32_t resolution)
{
	const size_t expected = size_t(resolution) * resolution * 4;
	if(raw.width != resolution || raw.height != resolution
		|| raw.rgba.size() != expected)
	{
		throw RenderError("Renderer returned a " + std::to_string(raw.width)
			+ "x" + std::to_string(raw.height) + " frame of "
			+ std::to_string(raw.rgba.size()) + " bytes, expected "
			+ std::to_string(resolution) + "x" + std::to_string(resolution)
			+ " of " + std::to_string(expected) + " bytes.");
	}
}

RawPixelBuffer QualityController::render_once(
	const SceneDescription& scene, uint32_t resolution)
{
	for(;;) {
		const RendererBackend b = current_backend();
		try {
			RawPixelBuffer raw =
				renderer_for(b).render(scene, resolution, resolution);
			check_frame(raw, resolution);
			return raw;
		} catch(const std::bad_alloc&) {
			const std::string what = "Out of memory rendering at "
				+ std::to_string(resolution) + "x"
				+ std::to_string(resolution);
			if(!switch_to_fallback(b, what.c_str())) {
				throw RenderError(what);
			}
		} catch(const BackendInitError& e) {
			if(!switch_to_fallback(b, e.what())) {
				throw;
			}
		} catch(const RenderError& e) {
			if(!switch_to_fallback(b, e.what())) {
				throw;
			}
		}
	}
}

RenderAttempt QualityController::run(const SceneDescription& scene,
	const QualityBudget& budget)
{
	if(budget.start == 0 || budget.floor == 0) {
		throw std::invalid_argument(
			"Start and floor resolutions must be positive.");
	}

	st = BackendState::Primary;
	attempt_count = 0;

	const uint64_t limit = budget.byte_limit();
	uint32_t res = budget.start;
	for(;;) {
		++attempt_count;

		const RawPixelBuffer raw = render_once(scene, res);
		const RgbImage img = composite_over(raw, scene.style.background);

		RenderAttempt attempt;
		attempt.resolution = res;
		attempt.backend = current_backend();
		attempt.png = encoder(img);
		attempt.bytes = attempt.png.size();

		const bool fits = attempt.bytes <= limit;
		spdlog::debug("[Quality] Attempt {}: {}x{} on {}, {} bytes, "
			"budget {} bytes", attempt_count, res, res,
			backend_name(attempt.backend), attempt.bytes, limit);

		if(fits || res <= budget.floor) {
			if(!fits) {
				spdlog::info("[Quality] Budget of {} bytes unreachable, "
					"accepting {}x{} at {} bytes", limit, res, res,
					attempt.bytes);
			}
			return attempt;
		}

		// Never below the floor.
		res = std::max(res / 2, budget.floor);
	}
}

RenderAttempt QualityController::render_frame(
	const SceneDescription& scene, uint32_t resolution)
{
	QualityBudget fixed;
	fixed.start = resolution;
	fixed.floor = resolution;
	return run(scene, fixed);
}
