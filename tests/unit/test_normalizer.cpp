#include <catch2/catch.hpp>

#include <algorithm>

#include <glm/geometric.hpp>

#include "normalizer.hpp"
#include "test_helpers.hpp"

TEST_CASE("Center of mass", "[normalizer]")
{
	SECTION("box centered away from the origin") {
		const Vec3 com = center_of_mass(
			make_box(Vec3{1.0f, 2.0f, 3.0f}, Vec3{3.0f, 4.0f, 5.0f}));
		REQUIRE(com.x == Approx(2.0f));
		REQUIRE(com.y == Approx(3.0f));
		REQUIRE(com.z == Approx(4.0f));
	}

	SECTION("degenerate mesh falls back to the vertex average") {
		const Vec3 com = center_of_mass(
			make_single_point(Vec3{5.0f, -1.0f, 2.0f}));
		REQUIRE(com.x == Approx(5.0f));
		REQUIRE(com.y == Approx(-1.0f));
		REQUIRE(com.z == Approx(2.0f));
	}

	SECTION("area weighting ignores vertex density") {
		// A big triangle plus a tiny one far away, carrying
		// the same number of vertices.
		Mesh m;
		add_triangle(m, Vec3{-1.0f, -1.0f, 0.0f}, Vec3{2.0f, -1.0f, 0.0f},
			Vec3{-1.0f, 2.0f, 0.0f});
		add_triangle(m, Vec3{100.0f, 0.0f, 0.0f},
			Vec3{100.001f, 0.0f, 0.0f}, Vec3{100.0f, 0.001f, 0.0f});
		const Vec3 com = center_of_mass(m);
		REQUIRE(com.x < 1.0f);
	}
}

TEST_CASE("Normalized mesh is centered with unit extent", "[normalizer]")
{
	const Mesh src = make_box(Vec3{10.0f, 20.0f, 30.0f},
		Vec3{14.0f, 22.0f, 31.0f});
	const NormalizedMesh n = normalize_mesh(src);

	const Aabb box = bounding_box(n.mesh);
	const Vec3 dims = box.extents();
	REQUIRE(std::max({dims.x, dims.y, dims.z}) == Approx(1.0f));
	REQUIRE(dims.y == Approx(0.5f));
	REQUIRE(dims.z == Approx(0.25f));

	const Vec3 com = center_of_mass(n.mesh);
	REQUIRE(com.x == Approx(0.0f).margin(1e-5));
	REQUIRE(com.y == Approx(0.0f).margin(1e-5));
	REQUIRE(com.z == Approx(0.0f).margin(1e-5));

	SECTION("pose maps source vertices onto normalized ones") {
		for(size_t i = 0; i < src.vertices.size(); ++i) {
			const Vec3 p = Vec3(n.pose
				* Vec4{src.vertices[i].position, 1.0f});
			REQUIRE(glm::length(p - n.mesh.vertices[i].position)
				< 1e-5f);
		}
	}

	SECTION("topology and colors are kept") {
		REQUIRE(n.mesh.indices == src.indices);
		REQUIRE(n.mesh.has_color == src.has_color);
	}
}

TEST_CASE("Normalizing a single point keeps it finite", "[normalizer]")
{
	const NormalizedMesh n = normalize_mesh(
		make_single_point(Vec3{3.0f, 3.0f, 3.0f}));
	for(const auto& v: n.mesh.vertices) {
		REQUIRE(glm::length(v.position) < 1e-6f);
	}
}

TEST_CASE("Y up sources are rotated to Z up", "[normalizer]")
{
	// Tall along Y.
	const Mesh src = make_box(Vec3{-0.1f, -1.0f, -0.1f},
		Vec3{0.1f, 1.0f, 0.1f});
	const NormalizedMesh n = normalize_mesh(src,
		up_axis_rotation(UpAxis::Y));

	const Vec3 dims = bounding_box(n.mesh).extents();
	REQUIRE(dims.z == Approx(1.0f));
	REQUIRE(dims.y == Approx(0.1f));

	SECTION("normals rotate with the mesh") {
		for(const auto& v: n.mesh.vertices) {
			REQUIRE(glm::length(v.normal) == Approx(1.0f));
		}
	}
}

TEST_CASE("Rotation between unit vectors", "[normalizer]")
{
	const Vec3 a = glm::normalize(Vec3{1.0f, 2.0f, 3.0f});
	const Vec3 b = glm::normalize(Vec3{-2.0f, 0.5f, 1.0f});
	const Vec3 r = rot_from_unit_a_to_unit_b(a, b) * a;
	REQUIRE(glm::length(r - b) < 1e-5f);
}
