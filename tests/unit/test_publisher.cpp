#include <catch2/catch.hpp>

#include "publisher.hpp"
#include "image_codec.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

// Changes the working directory for the scope.
class ScopedCwd
{
public:
	explicit ScopedCwd(const fs::path& dir):
		saved{fs::current_path()}
	{
		fs::current_path(dir);
	}

	~ScopedCwd()
	{
		std::error_code ec;
		fs::current_path(saved, ec);
	}

private:
	fs::path saved;
};

static std::vector<uint8_t> tiny_png(uint8_t shade)
{
	RgbImage img;
	img.width = 4;
	img.height = 4;
	img.rgb.assign(4 * 4 * 3, shade);
	return encode_png(img);
}

// Leftover temporaries would show up as hidden *.tmp files.
static size_t count_temp_files(const TempDir& dir)
{
	size_t n = 0;
	for(const auto& f: dir.files()) {
		if(f.extension() == ".tmp") {
			++n;
		}
	}
	return n;
}

// ============================================================================
// Identifiers and paths
// ============================================================================

TEST_CASE("Artifact identifiers", "[publisher]")
{
	REQUIRE_NOTHROW(validate_artifact_id("model-42"));
	REQUIRE_NOTHROW(validate_artifact_id("a.b_c"));

	REQUIRE_THROWS_AS(validate_artifact_id(""), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id("."), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id(".."), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id("../x"), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id("a/b"), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id("a\\b"), std::invalid_argument);
	REQUIRE_THROWS_AS(validate_artifact_id(std::string("a\0b", 3)),
		std::invalid_argument);
}

TEST_CASE("Publisher paths", "[publisher]")
{
	Publisher pub{PublisherPaths{"/uploads", "/thumbs", ""}};

	REQUIRE(pub.artifact_path("part") == fs::path{"/thumbs/part.png"});
	REQUIRE(pub.paths().scratch_root.empty());
	REQUIRE(pub.resolve_source("a/b.stl") == fs::path{"/uploads/a/b.stl"});
	REQUIRE(pub.resolve_source("/abs/b.stl") == fs::path{"/abs/b.stl"});

	SECTION("empty artifact root is the working directory") {
		Publisher here{PublisherPaths{}};
		REQUIRE(here.artifact_path("x") == fs::path{"./x.png"});
		REQUIRE(here.resolve_source("m.stl") == fs::path{"m.stl"});
	}
}

// ============================================================================
// Atomic publication
// ============================================================================

TEST_CASE("Publishing writes the exact bytes", "[publisher]")
{
	TempDir dir("publish");
	Publisher pub{PublisherPaths{"", dir.path() / "thumbs", ""}};

	const auto png = tiny_png(0x10);
	const ThumbnailArtifact art = pub.publish("part", png);

	REQUIRE(art.id == "part");
	REQUIRE(art.path == dir.path() / "thumbs" / "part.png");
	REQUIRE(art.bytes == png.size());
	REQUIRE(read_file_bytes(art.path) == png);
	REQUIRE(count_temp_files(dir) == 0);

	SECTION("republishing replaces the file") {
		const auto second = tiny_png(0x80);
		pub.publish("part", second);
		REQUIRE(read_file_bytes(art.path) == second);
		REQUIRE(count_temp_files(dir) == 0);
	}
}

TEST_CASE("Explicit destination", "[publisher]")
{
	TempDir dir("publish_to");
	Publisher pub{PublisherPaths{"", dir.path(), ""}};

	const fs::path dest = dir.path() / "nested" / "out.png";
	const auto png = tiny_png(0x33);
	const ThumbnailArtifact art = pub.publish_to(dest, png);

	REQUIRE(art.id == "out");
	REQUIRE(read_file_bytes(dest) == png);
	REQUIRE(count_temp_files(dir) == 0);
}

TEST_CASE("Temporaries are staged beside the destination by default",
	"[publisher]")
{
	TempDir dir("stage_default");
	const fs::path dest = dir.path() / "out" / "part.png";
	const auto png = tiny_png(0x44);

	SECTION("from a working directory nothing can be created in") {
		ThumbnailArtifact art;
		{
			ScopedCwd cwd{"/proc"};
			Publisher pub{PublisherPaths{}};
			art = pub.publish_to(dest, png);
		}
		REQUIRE(art.path == dest);
		REQUIRE(read_file_bytes(dest) == png);
	}

	SECTION("no scratch directory is created") {
		Publisher pub{PublisherPaths{"", dir.path(), ""}};
		pub.publish_to(dest, png);
		REQUIRE_FALSE(fs::exists(dir.path() / ".tmp"));
		REQUIRE_FALSE(fs::exists(dir.path() / "out" / ".tmp"));
	}

	REQUIRE(count_temp_files(dir) == 0);
}

TEST_CASE("Unusable scratch directory", "[publisher]")
{
	TempDir dir("stage_fallback");
	const fs::path blocker = dir.path() / "blocker";
	write_file_bytes(blocker, 3);

	Publisher pub{PublisherPaths{"", dir.path() / "thumbs",
		blocker / "scratch"}};
	const auto png = tiny_png(0x55);
	const ThumbnailArtifact art = pub.publish("part", png);

	REQUIRE(read_file_bytes(art.path) == png);
	REQUIRE(count_temp_files(dir) == 0);
}

TEST_CASE("Configured scratch directory", "[publisher]")
{
	TempDir dir("stage_scratch");
	Publisher pub{PublisherPaths{"", dir.path() / "thumbs",
		dir.path() / "scratch"}};

	const auto png = tiny_png(0x66);
	const ThumbnailArtifact art = pub.publish("part", png);

	REQUIRE(read_file_bytes(art.path) == png);
	REQUIRE(fs::is_directory(dir.path() / "scratch"));
	REQUIRE(count_temp_files(dir) == 0);
}

TEST_CASE("Stale temporaries from a dead process", "[publisher]")
{
	TempDir dir("stale");
	Publisher pub{PublisherPaths{"", dir.path(), ""}};

	const auto old = tiny_png(0x01);
	const ThumbnailArtifact art = pub.publish("part", old);

	// What a process killed between write and rename leaves behind.
	// No live process has this id, and its content is truncated.
	const fs::path stale = dir.path() / ".part.png.4194304.0.tmp";
	{
		const auto partial = tiny_png(0x02);
		std::ofstream f(stale, std::ios::binary);
		f.write(reinterpret_cast<const char*>(partial.data()),
			partial.size() / 2);
	}

	REQUIRE(read_file_bytes(art.path) == old);

	const auto fresh = tiny_png(0x03);
	pub.publish("part", fresh);
	REQUIRE(read_file_bytes(art.path) == fresh);

	// Only the stale file is left over, it never became the artifact.
	REQUIRE(count_temp_files(dir) == 1);
	REQUIRE(fs::exists(stale));
}

TEST_CASE("Failed verification keeps the previous artifact", "[publisher]")
{
	TempDir dir("verify");
	Publisher pub{PublisherPaths{"", dir.path(), ""}};

	const auto good = tiny_png(0x20);
	const ThumbnailArtifact art = pub.publish("part", good);

	SECTION("not a PNG") {
		const std::vector<uint8_t> bogus{'G', 'I', 'F', '8', '9', 'a',
			0, 0, 0, 0};
		REQUIRE_THROWS_AS(pub.publish("part", bogus), VerifyError);
	}

	SECTION("empty") {
		REQUIRE_THROWS_AS(pub.publish("part", {}), VerifyError);
	}

	REQUIRE(read_file_bytes(art.path) == good);
	REQUIRE(count_temp_files(dir) == 0);
}

TEST_CASE("Unwritable artifact root", "[publisher]")
{
	TempDir dir("unwritable");

	// A regular file where a directory is expected.
	const fs::path blocker = dir.path() / "blocker";
	write_file_bytes(blocker, 3);

	Publisher pub{PublisherPaths{"", blocker / "thumbs", ""}};
	REQUIRE_THROWS_AS(pub.publish("part", tiny_png(0)), FilesystemError);
}

TEST_CASE("Bad identifiers never touch the filesystem", "[publisher]")
{
	TempDir dir("bad_id");
	Publisher pub{PublisherPaths{"", dir.path() / "thumbs", ""}};

	REQUIRE_THROWS_AS(pub.publish("../escape", tiny_png(0)),
		std::invalid_argument);
	REQUIRE_FALSE(fs::exists(dir.path() / "escape.png"));
	REQUIRE_FALSE(fs::exists(dir.path() / "thumbs"));
}

// ============================================================================
// Placeholder
// ============================================================================

TEST_CASE("Placeholder is byte identical every time", "[publisher]")
{
	TempDir dir("placeholder");
	Publisher a{PublisherPaths{"", dir.path(), ""}};
	Publisher b{PublisherPaths{"", dir.path(), ""}};

	const auto first = a.publish_placeholder("one");
	const auto second = b.publish_placeholder("two");

	REQUIRE(has_png_signature(a.placeholder_png().data(),
		a.placeholder_png().size()));
	REQUIRE(read_file_bytes(first.path) == read_file_bytes(second.path));
	REQUIRE(read_file_bytes(first.path) == a.placeholder_png());
}

// ============================================================================
// Frame sets
// ============================================================================

TEST_CASE("Frame file names", "[publisher]")
{
	REQUIRE(frame_file_name(0) == "frame_000.png");
	REQUIRE(frame_file_name(35) == "frame_035.png");
	REQUIRE(frame_file_name(1234) == "frame_1234.png");
}

TEST_CASE("Publishing a frame set", "[publisher][turntable]")
{
	TempDir dir("frame_set");
	Publisher pub{PublisherPaths{"", dir.path(), ""}};
	const fs::path dest = dir.path() / "part.turntable";

	const std::vector<std::vector<uint8_t>> first{
		tiny_png(0x10), tiny_png(0x20), tiny_png(0x30)
	};
	const FrameSetArtifact art = pub.publish_frame_set(dest, first);

	REQUIRE(art.path == dest);
	REQUIRE(art.frames.size() == 3);
	REQUIRE(art.frames[2] == dest / "frame_002.png");
	for(size_t i = 0; i < first.size(); ++i) {
		REQUIRE(read_file_bytes(art.frames[i]) == first[i]);
	}

	auto entries_beside = [&] {
		size_t n = 0;
		for(const auto& e: fs::directory_iterator(dir.path())) {
			(void)e;
			++n;
		}
		return n;
	};
	REQUIRE(entries_beside() == 1);

	SECTION("a new set replaces the whole directory") {
		const std::vector<std::vector<uint8_t>> second{
			tiny_png(0x40), tiny_png(0x50)
		};
		pub.publish_frame_set(dest, second);

		REQUIRE(read_file_bytes(dest / "frame_000.png") == second[0]);
		REQUIRE(read_file_bytes(dest / "frame_001.png") == second[1]);
		REQUIRE_FALSE(fs::exists(dest / "frame_002.png"));
		REQUIRE(entries_beside() == 1);
	}

	SECTION("a bad frame leaves the previous set untouched") {
		const std::vector<std::vector<uint8_t>> broken{
			tiny_png(0x40), {}
		};
		REQUIRE_THROWS_AS(pub.publish_frame_set(dest, broken),
			VerifyError);

		for(size_t i = 0; i < first.size(); ++i) {
			REQUIRE(read_file_bytes(art.frames[i]) == first[i]);
		}
		REQUIRE(entries_beside() == 1);
	}

	SECTION("an empty set is refused") {
		REQUIRE_THROWS_AS(pub.publish_frame_set(dest, {}),
			std::invalid_argument);
	}
}
