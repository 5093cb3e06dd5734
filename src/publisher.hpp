#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <filesystem>

struct PublisherPaths
{
	// Relative source paths are resolved against it.
	std::filesystem::path source_root;

	// Where {artifact_id}.png files are published.
	std::filesystem::path artifact_root;

	// Temporary files. When empty, or when it cannot be created,
	// they are written beside their destination.
	std::filesystem::path scratch_root;
};

struct ThumbnailArtifact
{
	std::string id;
	std::filesystem::path path;
	size_t bytes = 0;
};

// A directory of frame_NNN.png files, replaced as a whole.
struct FrameSetArtifact
{
	std::filesystem::path path;
	std::vector<std::filesystem::path> frames;
	size_t bytes = 0;
};

// Cannot write, sync or rename. Nothing a retry would fix.
struct FilesystemError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// The temporary file did not read back as a non-empty PNG.
struct VerifyError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// "frame_007.png" for index 7.
std::string frame_file_name(size_t index);

// Throws std::invalid_argument for identifiers that
// would escape the artifact root.
void validate_artifact_id(const std::string& id);

// Writes files so readers only ever see a complete file,
// or the previous one.
class Publisher
{
public:
	explicit Publisher(PublisherPaths paths,
		uint32_t placeholder_size = 256);

	const PublisherPaths& paths() const
	{
		return p;
	}

	std::filesystem::path artifact_path(const std::string& id) const;
	std::filesystem::path resolve_source(
		const std::filesystem::path& source) const;

	// Throws FilesystemError or VerifyError.
	ThumbnailArtifact publish(const std::string& id,
		const std::vector<uint8_t>& png);

	// Same protocol, to an explicit destination.
	ThumbnailArtifact publish_to(const std::filesystem::path& dest,
		const std::vector<uint8_t>& png);

	ThumbnailArtifact publish_placeholder(const std::string& id);
	ThumbnailArtifact publish_placeholder_to(
		const std::filesystem::path& dest);

	// Writes every frame into a hidden directory beside dest, then
	// swaps it with dest. Readers see the complete previous set or
	// the complete new one. Throws FilesystemError or VerifyError,
	// and std::invalid_argument for an empty set.
	FrameSetArtifact publish_frame_set(const std::filesystem::path& dest,
		const std::vector<std::vector<uint8_t>>& frames);

	// The encoded "no preview" image, identical on every call.
	const std::vector<uint8_t>& placeholder_png();

private:
	std::filesystem::path staging_dir(
		const std::filesystem::path& dest_dir) const;
	std::filesystem::path unique_temp_name(
		const std::filesystem::path& dir,
		const std::filesystem::path& dest) const;

	PublisherPaths p;
	uint32_t placeholder_size;
	std::optional<std::vector<uint8_t>> placeholder;
};
