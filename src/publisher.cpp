#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "image_codec.hpp"
#include "publisher.hpp"

namespace fs = std::filesystem;

// Removes the temporary file unless released.
struct TempFile
{
	explicit TempFile(fs::path path):
		path{std::move(path)}
	{}

	~TempFile()
	{
		if(!path.empty()) {
			std::error_code ec;
			fs::remove(path, ec);
			if(ec) {
				spdlog::warn("[Publisher] Could not remove {}: {}",
					path.string(), ec.message());
			}
		}
	}

	TempFile(const TempFile&) = delete;
	void operator=(const TempFile&) = delete;

	void release()
	{
		path.clear();
	}

	fs::path path;
};

// Removes the staging directory and whatever is left in it.
struct TempDirectory
{
	explicit TempDirectory(fs::path path):
		path{std::move(path)}
	{}

	~TempDirectory()
	{
		std::error_code ec;
		fs::remove_all(path, ec);
		if(ec) {
			spdlog::warn("[Publisher] Could not remove {}: {}",
				path.string(), ec.message());
		}
	}

	TempDirectory(const TempDirectory&) = delete;
	void operator=(const TempDirectory&) = delete;

	fs::path path;
};

static std::string errno_msg(const std::string& what, const fs::path& path)
{
	return what + " " + path.string() + ": " + std::strerror(errno);
}

static void create_dir(const fs::path& dir)
{
	std::error_code ec;
	fs::create_directories(dir, ec);
	if(ec) {
		throw FilesystemError("Cannot create directory "
			+ dir.string() + ": " + ec.message());
	}
}

// Write everything and fsync, so the rename never exposes
// a file whose data is not on disk yet.
static void write_synced(const fs::path& path, const std::vector<uint8_t>& data)
{
	const int fd = ::open(path.c_str(),
		O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
	if(fd < 0) {
		throw FilesystemError(errno_msg("Cannot create", path));
	}

	size_t done = 0;
	while(done < data.size()) {
		const ssize_t n = ::write(fd, data.data() + done,
			data.size() - done);
		if(n < 0) {
			if(errno == EINTR) {
				continue;
			}
			const std::string msg = errno_msg("Cannot write", path);
			::close(fd);
			throw FilesystemError(msg);
		}
		done += size_t(n);
	}

	if(::fsync(fd) != 0) {
		const std::string msg = errno_msg("Cannot sync", path);
		::close(fd);
		throw FilesystemError(msg);
	}

	if(::close(fd) != 0) {
		throw FilesystemError(errno_msg("Cannot close", path));
	}
}

static void verify_png_file(const fs::path& path, size_t expected)
{
	std::ifstream in(path, std::ios::binary);
	if(!in) {
		throw FilesystemError("Cannot read back " + path.string());
	}

	const std::vector<uint8_t> content{
		std::istreambuf_iterator<char>(in),
		std::istreambuf_iterator<char>()
	};

	if(content.empty()) {
		throw VerifyError("Temporary file " + path.string()
			+ " is empty.");
	}
	if(content.size() != expected) {
		throw VerifyError("Temporary file " + path.string()
			+ " has " + std::to_string(content.size())
			+ " bytes, expected " + std::to_string(expected) + '.');
	}
	if(!has_png_signature(content.data(), content.size())) {
		throw VerifyError("Temporary file " + path.string()
			+ " is not a PNG.");
	}
}

static void sync_dir(const fs::path& dir)
{
	const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
	if(fd < 0) {
		throw FilesystemError(errno_msg("Cannot open", dir));
	}
	const int r = ::fsync(fd);
	const std::string msg = r != 0 ? errno_msg("Cannot sync", dir) : "";
	::close(fd);
	if(r != 0) {
		throw FilesystemError(msg);
	}
}

// Puts the staged directory at dest. If dest already existed, the
// previous content ends up at staged.
static void swap_into_place(const fs::path& staged, const fs::path& dest)
{
	if(::rename(staged.c_str(), dest.c_str()) == 0) {
		return;
	}
	if(errno != EEXIST && errno != ENOTEMPTY) {
		throw FilesystemError(errno_msg("Cannot rename into", dest));
	}

	if(::renameat2(AT_FDCWD, staged.c_str(), AT_FDCWD, dest.c_str(),
		RENAME_EXCHANGE) == 0)
	{
		return;
	}
	if(errno != EINVAL && errno != ENOSYS) {
		throw FilesystemError(errno_msg("Cannot exchange with", dest));
	}

	// No exchange on this filesystem. Readers may briefly see no
	// set at all, but never a partial one.
	const fs::path old = staged.string() + ".old";
	if(::rename(dest.c_str(), old.c_str()) != 0) {
		throw FilesystemError(errno_msg("Cannot move aside", dest));
	}
	if(::rename(staged.c_str(), dest.c_str()) != 0) {
		const std::string msg = errno_msg("Cannot rename into", dest);
		if(::rename(old.c_str(), dest.c_str()) != 0) {
			spdlog::error("[Publisher] Previous {} left at {}",
				dest.string(), old.string());
		}
		throw FilesystemError(msg);
	}
	if(::rename(old.c_str(), staged.c_str()) != 0) {
		spdlog::warn("[Publisher] Stale {} left behind: {}",
			old.string(), std::strerror(errno));
	}
}

std::string frame_file_name(size_t index)
{
	std::string n = std::to_string(index);
	if(n.size() < 3) {
		n.insert(0, 3 - n.size(), '0');
	}
	return "frame_" + n + ".png";
}

void validate_artifact_id(const std::string& id)
{
	if(id.empty() || id == "." || id == ".."
		|| id.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
	{
		throw std::invalid_argument("Invalid artifact id \"" + id + "\".");
	}
}

Publisher::Publisher(PublisherPaths paths, uint32_t placeholder_size):
	p{std::move(paths)},
	placeholder_size{placeholder_size}
{
	if(p.artifact_root.empty()) {
		p.artifact_root = ".";
	}
}

fs::path Publisher::artifact_path(const std::string& id) const
{
	validate_artifact_id(id);
	return p.artifact_root / (id + ".png");
}

fs::path Publisher::resolve_source(const fs::path& source) const
{
	if(source.is_absolute() || p.source_root.empty()) {
		return source;
	}
	return p.source_root / source;
}

fs::path Publisher::unique_temp_name(const fs::path& dir,
	const fs::path& dest) const
{
	static std::atomic<uint64_t> counter{0};

	return dir / ("." + dest.filename().string() + '.'
		+ std::to_string(::getpid()) + '.'
		+ std::to_string(counter.fetch_add(1)) + ".tmp");
}

fs::path Publisher::staging_dir(const fs::path& dest_dir) const
{
	if(p.scratch_root.empty()) {
		return dest_dir;
	}

	try {
		create_dir(p.scratch_root);
	} catch(const FilesystemError& e) {
		spdlog::warn("[Publisher] Staging beside the destination instead: {}",
			e.what());
		return dest_dir;
	}
	return p.scratch_root;
}

ThumbnailArtifact Publisher::publish(const std::string& id,
	const std::vector<uint8_t>& png)
{
	ThumbnailArtifact ret = publish_to(artifact_path(id), png);
	ret.id = id;
	return ret;
}

ThumbnailArtifact Publisher::publish_to(const fs::path& dest,
	const std::vector<uint8_t>& png)
{
	const fs::path dest_dir = dest.has_parent_path()
		? dest.parent_path() : fs::path{"."};

	create_dir(dest_dir);
	const fs::path stage = staging_dir(dest_dir);

	TempFile tmp{unique_temp_name(stage, dest)};
	write_synced(tmp.path, png);
	verify_png_file(tmp.path, png.size());

	std::error_code ec;
	fs::rename(tmp.path, dest, ec);
	if(ec == std::errc::cross_device_link && stage != dest_dir) {
		// Scratch is on another filesystem. Copy beside the
		// destination first, so the final step is still a rename.
		TempFile near{unique_temp_name(dest_dir, dest)};
		write_synced(near.path, png);
		verify_png_file(near.path, png.size());

		ec.clear();
		fs::rename(near.path, dest, ec);
		if(!ec) {
			near.release();
		}
	} else if(!ec) {
		tmp.release();
	}

	if(ec) {
		spdlog::error("[Publisher] Cannot move into {}: {}",
			dest.string(), ec.message());
		throw FilesystemError("Cannot rename into " + dest.string()
			+ ": " + ec.message());
	}

	spdlog::info("[Publisher] Published {} ({} bytes)",
		dest.string(), png.size());

	ThumbnailArtifact ret;
	ret.id = dest.stem().string();
	ret.path = dest;
	ret.bytes = png.size();
	return ret;
}

const std::vector<uint8_t>& Publisher::placeholder_png()
{
	if(!placeholder) {
		placeholder = encode_png(make_placeholder_image(placeholder_size));
	}
	return *placeholder;
}

ThumbnailArtifact Publisher::publish_placeholder(const std::string& id)
{
	ThumbnailArtifact ret = publish_placeholder_to(artifact_path(id));
	ret.id = id;
	return ret;
}

ThumbnailArtifact Publisher::publish_placeholder_to(const fs::path& dest)
{
	return publish_to(dest, placeholder_png());
}

FrameSetArtifact Publisher::publish_frame_set(const fs::path& dest,
	const std::vector<std::vector<uint8_t>>& frames)
{
	if(frames.empty()) {
		throw std::invalid_argument("A frame set needs at least one frame.");
	}

	const fs::path parent = dest.has_parent_path()
		? dest.parent_path() : fs::path{"."};
	create_dir(parent);

	// Directories only move by rename within one filesystem,
	// so the set is always staged beside its destination.
	TempDirectory stage{unique_temp_name(parent, dest)};
	if(::mkdir(stage.path.c_str(), 0755) != 0) {
		throw FilesystemError(errno_msg("Cannot create", stage.path));
	}

	FrameSetArtifact ret;
	ret.path = dest;
	for(size_t i = 0; i < frames.size(); ++i) {
		const std::string name = frame_file_name(i);
		write_synced(stage.path / name, frames[i]);
		verify_png_file(stage.path / name, frames[i].size());

		ret.frames.push_back(dest / name);
		ret.bytes += frames[i].size();
	}
	sync_dir(stage.path);

	swap_into_place(stage.path, dest);

	spdlog::info("[Publisher] Published {} ({} frames, {} bytes)",
		dest.string(), frames.size(), ret.bytes);
	return ret;
}
