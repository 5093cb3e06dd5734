#include <catch2/catch.hpp>

#include "mesh_tools.hpp"
#include "test_helpers.hpp"

// ============================================================================
// Bounding box and fingerprint
// ============================================================================

TEST_CASE("Bounding box covers every vertex", "[mesh]")
{
	const Mesh m = make_box(Vec3{-1.0f, 2.0f, 0.0f}, Vec3{3.0f, 5.0f, 0.5f});
	const Aabb box = bounding_box(m);

	REQUIRE(box.lo.x == Approx(-1.0f));
	REQUIRE(box.lo.y == Approx(2.0f));
	REQUIRE(box.lo.z == Approx(0.0f));
	REQUIRE(box.hi.x == Approx(3.0f));
	REQUIRE(box.hi.y == Approx(5.0f));
	REQUIRE(box.hi.z == Approx(0.5f));
	REQUIRE(box.center().x == Approx(1.0f));
	REQUIRE(box.extents().y == Approx(3.0f));
}

TEST_CASE("Bounding box of a point has zero extents", "[mesh]")
{
	const Aabb box = bounding_box(make_single_point(Vec3{1.0f, 2.0f, 3.0f}));
	REQUIRE(box.extents().x == 0.0f);
	REQUIRE(box.extents().y == 0.0f);
	REQUIRE(box.extents().z == 0.0f);
}

TEST_CASE("Geometry fingerprint", "[mesh]")
{
	const Mesh a = make_unit_cube();

	SECTION("same geometry gives the same fingerprint") {
		REQUIRE(geometry_fingerprint(a) == geometry_fingerprint(make_unit_cube()));
	}

	SECTION("translation does not change it") {
		const Mesh b = make_box(Vec3{9.5f}, Vec3{10.5f});
		REQUIRE(geometry_fingerprint(a) == geometry_fingerprint(b));
	}

	SECTION("different dimensions change it") {
		const Mesh b = make_box(Vec3{-0.5f}, Vec3{0.5f, 0.5f, 0.75f});
		REQUIRE(geometry_fingerprint(a) != geometry_fingerprint(b));
	}
}

// ============================================================================
// File types
// ============================================================================

TEST_CASE("Supported mesh extensions", "[mesh]")
{
	REQUIRE(is_supported_mesh_file("part.stl"));
	REQUIRE(is_supported_mesh_file("dir/part.STL"));
	REQUIRE(is_supported_mesh_file("plate.3mf"));
	REQUIRE(is_supported_mesh_file("model.obj"));
	REQUIRE(is_supported_mesh_file("scan.Ply"));

	REQUIRE_FALSE(is_supported_mesh_file("notes.txt"));
	REQUIRE_FALSE(is_supported_mesh_file("model.xyz"));
	REQUIRE_FALSE(is_supported_mesh_file("stl"));
}

TEST_CASE("Assimp loader rejects unsupported files before reading", "[mesh]")
{
	AssimpMeshLoader loader;
	REQUIRE_THROWS_AS(loader.load("/nonexistent/model.xyz"), LoadError);
}

TEST_CASE("Assimp loader reads an ASCII STL", "[mesh][assimp]")
{
	TempDir dir("stl");
	const auto path = dir.path() / "tri.stl";
	{
		std::ofstream f(path);
		f << "solid tri\n"
			"facet normal 0 0 1\n"
			" outer loop\n"
			"  vertex 0 0 0\n"
			"  vertex 1 0 0\n"
			"  vertex 0 1 0\n"
			" endloop\n"
			"endfacet\n"
			"endsolid tri\n";
	}

	AssimpMeshLoader loader;
	const Mesh m = loader.load(path);
	REQUIRE(m.face_count() == 1);
	REQUIRE_FALSE(m.has_color);
}

TEST_CASE("Assimp loader fails on garbage", "[mesh][assimp]")
{
	TempDir dir("garbage");
	const auto path = dir.path() / "broken.stl";
	{
		std::ofstream f(path, std::ios::binary);
		f << "this is not a mesh";
	}

	AssimpMeshLoader loader;
	REQUIRE_THROWS(loader.load(path));
}
