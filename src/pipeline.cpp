#include <new>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "normalizer.hpp"
#include "camera_framing.hpp"
#include "scene.hpp"
#include "turntable.hpp"
#include "pipeline.hpp"

namespace fs = std::filesystem;

const char* failure_reason_name(FailureReason r)
{
	switch(r) {
	case FailureReason::LoadFailed:
		return "load-failed";
	case FailureReason::EmptyMesh:
		return "empty-mesh";
	case FailureReason::BackendUnavailable:
		return "backend-unavailable";
	case FailureReason::RenderFailed:
		return "render-failed";
	case FailureReason::EncodeFailed:
		return "encode-failed";
	case FailureReason::VerifyFailed:
	default:
		return "verify-failed";
	}
}

ThumbnailPipeline::ThumbnailPipeline(const ThumbnailConfig& config,
	std::unique_ptr<MeshLoader> loader,
	RendererFactory renderer_factory,
	ImageEncoder encoder
):
	cfg{config},
	loader{std::move(loader)},
	publisher{cfg.paths, cfg.placeholder_size},
	controller{std::move(renderer_factory), backend_plan(cfg.backend),
		std::move(encoder)}
{
	validate_config(cfg);
}

fs::path turntable_path(const fs::path& thumbnail)
{
	fs::path ret = thumbnail;
	ret.replace_extension(".turntable");
	return ret;
}

fs::path ThumbnailPipeline::destination(const ThumbnailRequest& req) const
{
	return req.destination
		? *req.destination : publisher.artifact_path(req.artifact_id);
}

ThumbnailPipeline::LoadResult ThumbnailPipeline::load(
	const ThumbnailRequest& req)
{
	Loaded ret;
	ret.source = publisher.resolve_source(req.source);

	try {
		ret.mesh = loader->load(ret.source);
	} catch(const LoadError& e) {
		return RenderFailure{FailureReason::LoadFailed, e.what()};
	} catch(const EmptyMeshError& e) {
		return RenderFailure{FailureReason::EmptyMesh, e.what()};
	} catch(const std::bad_alloc&) {
		return RenderFailure{FailureReason::LoadFailed,
			"Out of memory loading " + ret.source.string()};
	} catch(const std::length_error& e) {
		return RenderFailure{FailureReason::LoadFailed,
			std::string("Mesh too large: ") + e.what()};
	}
	if(ret.mesh.indices.empty()) {
		return RenderFailure{FailureReason::EmptyMesh,
			"Mesh has no triangles: " + ret.source.string()};
	}

	ret.fingerprint = geometry_fingerprint(ret.mesh);
	return ret;
}

ThumbnailPipeline::RenderResult ThumbnailPipeline::try_render(
	const ThumbnailRequest& req)
{
	LoadResult loaded = load(req);
	if(auto* failed = std::get_if<RenderFailure>(&loaded)) {
		return *failed;
	}
	const Mesh& mesh = std::get<Loaded>(loaded).mesh;
	const fs::path& source = std::get<Loaded>(loaded).source;
	const size_t fingerprint = std::get<Loaded>(loaded).fingerprint;

	// The budget is relative to the uploaded file.
	std::error_code ec;
	const uint64_t source_bytes = fs::file_size(source, ec);
	if(ec) {
		spdlog::debug("[Pipeline] No size for {}: {}",
			source.string(), ec.message());
	}

	const NormalizedMesh normalized = normalize_mesh(mesh,
		up_axis_rotation(cfg.source_up));
	const CameraSpec camera = frame_camera(normalized.mesh, cfg.framing);
	const SceneDescription scene = assemble_scene(normalized.mesh,
		camera, cfg.style);

	const QualityBudget budget{
		req.size.value_or(cfg.size),
		ec ? 0 : source_bytes,
		cfg.max_ratio,
		cfg.min_size
	};

	controller.set_plan(backend_plan(req.backend.value_or(cfg.backend)));

	try {
		RenderAttempt attempt = controller.run(scene, budget);
		return Rendered{std::move(attempt), fingerprint,
			controller.used_fallback(), controller.attempts()};
	} catch(const BackendInitError& e) {
		return RenderFailure{FailureReason::BackendUnavailable, e.what()};
	} catch(const RenderError& e) {
		return RenderFailure{FailureReason::RenderFailed, e.what()};
	} catch(const EncodeError& e) {
		return RenderFailure{FailureReason::EncodeFailed, e.what()};
	} catch(const std::bad_alloc&) {
		return RenderFailure{FailureReason::RenderFailed,
			"Out of memory while rendering or encoding"};
	} catch(const std::length_error& e) {
		return RenderFailure{FailureReason::RenderFailed,
			std::string("Image too large: ") + e.what()};
	}
}

ThumbnailOutcome ThumbnailPipeline::render(const ThumbnailRequest& req)
{
	const fs::path dest = destination(req);
	if(req.size && *req.size == 0) {
		throw std::invalid_argument("Requested size must be positive.");
	}

	ThumbnailOutcome out;
	RenderResult result = try_render(req);

	if(auto* ok = std::get_if<Rendered>(&result)) {
		try {
			out.artifact = publisher.publish_to(dest, ok->attempt.png);
			out.artifact.id = req.artifact_id;
			out.resolution = ok->attempt.resolution;
			out.backend = ok->attempt.backend;
			out.used_fallback = ok->used_fallback;
			out.attempts = ok->attempts;
			out.fingerprint = ok->fingerprint;

			spdlog::info("[Pipeline] {}: {}x{} on {}{}, {} bytes, "
				"{} attempt(s), geometry {:016x}", req.artifact_id,
				out.resolution, out.resolution,
				backend_name(*out.backend),
				out.used_fallback ? " (fallback)" : "",
				out.artifact.bytes, out.attempts, out.fingerprint);
			return out;
		} catch(const VerifyError& e) {
			result = RenderFailure{FailureReason::VerifyFailed, e.what()};
		}
	}

	out.failure = std::get<RenderFailure>(result);
	spdlog::warn("[Pipeline] {}: publishing placeholder ({}): {}",
		req.artifact_id, failure_reason_name(out.failure->reason),
		out.failure->detail);

	try {
		out.artifact = publisher.publish_placeholder_to(dest);
	} catch(const VerifyError& e) {
		// The placeholder is known good, so the filesystem is at fault.
		throw FilesystemError(e.what());
	}
	out.artifact.id = req.artifact_id;
	out.resolution = cfg.placeholder_size;

	return out;
}

TurntableOutcome ThumbnailPipeline::render_turntable(
	const ThumbnailRequest& req)
{
	const fs::path dest = turntable_path(destination(req));
	const uint32_t frames = cfg.turntable.frames;
	if(frames == 0) {
		throw std::invalid_argument("Turntable is disabled.");
	}

	TurntableOutcome out;
	out.resolution = cfg.turntable.size;

	LoadResult loaded = load(req);
	if(auto* failed = std::get_if<RenderFailure>(&loaded)) {
		out.failure = *failed;
		spdlog::warn("[Pipeline] {}: no turntable ({}): {}",
			req.artifact_id, failure_reason_name(out.failure->reason),
			out.failure->detail);
		return out;
	}

	const NormalizedMesh normalized = normalize_mesh(
		std::get<Loaded>(loaded).mesh, up_axis_rotation(cfg.source_up));
	const std::vector<CameraSpec> cameras = turntable_cameras(
		normalized.mesh, cfg.framing, frames);

	controller.set_plan(backend_plan(req.backend.value_or(cfg.backend)));

	std::vector<std::vector<uint8_t>> pngs;
	pngs.reserve(frames);
	try {
		for(const CameraSpec& cam: cameras) {
			const SceneDescription scene = assemble_scene(normalized.mesh,
				cam, cfg.style);
			RenderAttempt frame = controller.render_frame(scene,
				out.resolution);
			out.backend = frame.backend;
			pngs.push_back(std::move(frame.png));
		}
	} catch(const BackendInitError& e) {
		out.failure = RenderFailure{FailureReason::BackendUnavailable,
			e.what()};
	} catch(const RenderError& e) {
		out.failure = RenderFailure{FailureReason::RenderFailed, e.what()};
	} catch(const EncodeError& e) {
		out.failure = RenderFailure{FailureReason::EncodeFailed, e.what()};
	} catch(const std::bad_alloc&) {
		out.failure = RenderFailure{FailureReason::RenderFailed,
			"Out of memory rendering the turntable"};
	}

	if(!out.failure) {
		try {
			out.artifact = publisher.publish_frame_set(dest, pngs);
		} catch(const VerifyError& e) {
			out.failure = RenderFailure{FailureReason::VerifyFailed,
				e.what()};
		}
	}

	if(out.failure) {
		out.backend.reset();
		spdlog::warn("[Pipeline] {}: no turntable ({}): {}",
			req.artifact_id, failure_reason_name(out.failure->reason),
			out.failure->detail);
		return out;
	}

	spdlog::info("[Pipeline] {}: turntable of {} frames at {}x{} on {}",
		req.artifact_id, frames, out.resolution, out.resolution,
		backend_name(*out.backend));
	return out;
}
