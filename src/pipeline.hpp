#pragma once

#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <filesystem>

#include "config.hpp"
#include "mesh_tools.hpp"
#include "renderer.hpp"
#include "quality_controller.hpp"
#include "publisher.hpp"

enum class FailureReason
{
	LoadFailed,
	EmptyMesh,
	BackendUnavailable,
	RenderFailed,
	EncodeFailed,
	VerifyFailed
};

const char* failure_reason_name(FailureReason r);

struct RenderFailure
{
	FailureReason reason;
	std::string detail;
};

struct ThumbnailRequest
{
	std::filesystem::path source;
	std::string artifact_id;

	// Override the configuration for this request.
	std::optional<uint32_t> size;
	std::optional<BackendMode> backend;

	// Publish here instead of {artifact_root}/{artifact_id}.png.
	std::optional<std::filesystem::path> destination;
};

struct ThumbnailOutcome
{
	ThumbnailArtifact artifact;

	// Set when the placeholder was published instead of a render.
	std::optional<RenderFailure> failure;

	uint32_t resolution = 0;
	std::optional<RendererBackend> backend;
	bool used_fallback = false;
	size_t attempts = 0;

	// Identifies the rendered geometry, 0 if it could not be loaded.
	size_t fingerprint = 0;

	bool is_placeholder() const
	{
		return failure.has_value();
	}
};

// The turntable frame set published beside a thumbnail.
struct TurntableOutcome
{
	// Empty path when nothing was published.
	FrameSetArtifact artifact;

	// Set when the turntable could not be rendered. The previous
	// frame set, if any, is left in place.
	std::optional<RenderFailure> failure;

	uint32_t resolution = 0;
	std::optional<RendererBackend> backend;

	bool published() const
	{
		return !failure.has_value();
	}
};

// {artifact_root}/part.png gives {artifact_root}/part.turntable.
std::filesystem::path turntable_path(const std::filesystem::path& thumbnail);

// Load, normalize, frame, render and publish one thumbnail.
// Every failure but FilesystemError ends in the placeholder
// being published, so the artifact always exists afterwards.
class ThumbnailPipeline
{
public:
	ThumbnailPipeline(const ThumbnailConfig& cfg,
		std::unique_ptr<MeshLoader> loader,
		RendererFactory renderer_factory,
		ImageEncoder encoder = encode_png);

	const ThumbnailConfig& config() const
	{
		return cfg;
	}

	// Throws FilesystemError, and std::invalid_argument for
	// a malformed request.
	ThumbnailOutcome render(const ThumbnailRequest& req);

	// Renders cfg.turntable.frames views around the up axis and
	// publishes them as one frame set at turntable_path() of the
	// thumbnail destination. Failures leave no placeholder behind.
	// Throws FilesystemError, and std::invalid_argument for a
	// malformed request or a disabled turntable.
	TurntableOutcome render_turntable(const ThumbnailRequest& req);

	Publisher& get_publisher()
	{
		return publisher;
	}

private:
	struct Rendered
	{
		RenderAttempt attempt;
		size_t fingerprint;
		bool used_fallback;
		size_t attempts;
	};

	struct Loaded
	{
		Mesh mesh;
		size_t fingerprint;
		std::filesystem::path source;
	};

	using RenderResult = std::variant<Rendered, RenderFailure>;
	using LoadResult = std::variant<Loaded, RenderFailure>;

	std::filesystem::path destination(const ThumbnailRequest& req) const;
	LoadResult load(const ThumbnailRequest& req);
	RenderResult try_render(const ThumbnailRequest& req);

	ThumbnailConfig cfg;
	std::unique_ptr<MeshLoader> loader;
	Publisher publisher;
	QualityController controller;
};
