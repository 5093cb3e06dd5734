#include <catch2/catch.hpp>

#include <cmath>
#include <vector>

#include <glm/geometric.hpp>

#include "normalizer.hpp"
#include "camera_framing.hpp"
#include "test_helpers.hpp"


static bool is_finite(const Mat4& m)
{
	for(int i = 0; i < 4; ++i) {
		for(int j = 0; j < 4; ++j) {
			if(!std::isfinite(m[i][j])) {
				return false;
			}
		}
	}
	return true;
}

// ============================================================================
// Containment
// ============================================================================

TEST_CASE("Every vertex lands inside the view volume", "[framing]")
{
	std::vector<Mesh> corpus;
	corpus.push_back(make_unit_cube());
	corpus.push_back(make_sphere(Vec3{0.0f}, 1.0f));
	corpus.push_back(make_box(Vec3{0.0f}, Vec3{10.0f, 0.5f, 0.5f}));
	corpus.push_back(make_box(Vec3{0.0f}, Vec3{3.0f, 3.0f, 0.01f}));
	corpus.push_back(make_single_triangle());
	corpus.push_back(make_single_point(Vec3{1.0f, 1.0f, 1.0f}));

	const std::vector<std::pair<real, real>> angles = {
		{45.0f, 25.0f}, {0.0f, 0.0f}, {135.0f, -30.0f},
		{270.0f, 60.0f}, {10.0f, 89.0f}, {0.0f, 90.0f}
	};

	for(const Mesh& src: corpus) {
		const NormalizedMesh n = normalize_mesh(src);
		for(const auto& [azim, elev]: angles) {
			FramingParams params;
			params.azimuth_deg = azim;
			params.elevation_deg = elev;

			const CameraSpec cam = frame_camera(n.mesh, params);
			REQUIRE(is_finite(cam.view));
			REQUIRE(is_finite(projection_matrix(cam)));
			REQUIRE(cam.near > 0.0f);
			REQUIRE(cam.far > cam.near);
			REQUIRE(cam.xmag == cam.ymag);

			// The margin leaves the outermost vertex this far in.
			const real limit = cam.xmag / (1.0f + params.margin) + 1e-5f;
			for(const auto& v: n.mesh.vertices) {
				const Vec3 c = Vec3(cam.view * Vec4{v.position, 1.0f});
				REQUIRE(std::abs(c.x) <= limit);
				REQUIRE(std::abs(c.y) <= limit);
				REQUIRE(-c.z >= cam.near - 1e-5f);
				REQUIRE(-c.z <= cam.far + 1e-5f);
			}
		}
	}
}

TEST_CASE("Projection maps the view volume to Vulkan clip space",
	"[framing]")
{
	CameraSpec cam;
	cam.xmag = 2.0f;
	cam.ymag = 2.0f;
	cam.near = 1.0f;
	cam.far = 5.0f;
	const Mat4 proj = projection_matrix(cam);

	const Vec4 near_corner = proj * Vec4{2.0f, 2.0f, -1.0f, 1.0f};
	REQUIRE(near_corner.x == Approx(1.0f));
	// Vulkan has y pointing down.
	REQUIRE(near_corner.y == Approx(-1.0f));
	REQUIRE(near_corner.z == Approx(0.0f).margin(1e-6));

	const Vec4 far_corner = proj * Vec4{-2.0f, -2.0f, -5.0f, 1.0f};
	REQUIRE(far_corner.x == Approx(-1.0f));
	REQUIRE(far_corner.y == Approx(1.0f));
	REQUIRE(far_corner.z == Approx(1.0f));
}

TEST_CASE("Framing is deterministic", "[framing]")
{
	const NormalizedMesh n = normalize_mesh(make_sphere(Vec3{2.0f}, 3.0f));
	const FramingParams params;

	const CameraSpec a = frame_camera(n.mesh, params);
	const CameraSpec b = frame_camera(n.mesh, params);

	REQUIRE(a.view == b.view);
	REQUIRE(a.eye == b.eye);
	REQUIRE(a.xmag == b.xmag);
	REQUIRE(a.near == b.near);
	REQUIRE(a.far == b.far);
}

TEST_CASE("Unit cube at default angles", "[framing]")
{
	const NormalizedMesh n = normalize_mesh(make_unit_cube());
	const CameraSpec cam = frame_camera(n.mesh, FramingParams{});

	// Silhouette of the cube seen from 45 degrees around and
	// 25 degrees up, padded by the margin.
	REQUIRE(cam.xmag > 0.7f);
	REQUIRE(cam.xmag < 0.85f);

	// Eye is in the +X+Y quadrant, above the ground.
	REQUIRE(cam.eye.x > 0.0f);
	REQUIRE(cam.eye.y > 0.0f);
	REQUIRE(cam.eye.z > 0.0f);
	REQUIRE(cam.eye.x == Approx(cam.eye.y));

	SECTION("camera basis is orthonormal and upright") {
		REQUIRE(glm::length(cam.right) == Approx(1.0f));
		REQUIRE(glm::length(cam.up) == Approx(1.0f));
		REQUIRE(glm::dot(cam.right, cam.up) == Approx(0.0f).margin(1e-6));
		REQUIRE(cam.up.z > 0.0f);
		REQUIRE(cam.right.z == Approx(0.0f).margin(1e-6));
	}

	SECTION("back points toward the eye") {
		REQUIRE(glm::dot(cam.back, glm::normalize(cam.eye)) == Approx(1.0f));
	}
}

TEST_CASE("Looking along the up axis", "[framing]")
{
	SECTION("straight down uses a secondary up") {
		const Mat4 view = look_at(Vec3{0.0f, 0.0f, 5.0f}, Vec3{0.0f},
			Vec3{0.0f, 0.0f, 1.0f});
		REQUIRE(is_finite(view));

		const Vec3 right{view[0][0], view[1][0], view[2][0]};
		REQUIRE(glm::length(right) == Approx(1.0f));
	}

	SECTION("up is Y and the view is along Y") {
		const Mat4 view = look_at(Vec3{0.0f, 5.0f, 0.0f}, Vec3{0.0f},
			Vec3{0.0f, 1.0f, 0.0f});
		REQUIRE(is_finite(view));

		const Vec3 right{view[0][0], view[1][0], view[2][0]};
		REQUIRE(glm::length(right) == Approx(1.0f));
	}

	SECTION("up is -Y and the view is along Y") {
		const Vec3 eye{0.0f, 5.0f, 0.0f};
		const Mat4 view = look_at(eye, Vec3{0.0f}, Vec3{0.0f, -1.0f, 0.0f});
		REQUIRE(is_finite(view));

		const Vec3 right{view[0][0], view[1][0], view[2][0]};
		const Vec3 up{view[0][1], view[1][1], view[2][1]};
		REQUIRE(glm::length(right) == Approx(1.0f));
		REQUIRE(glm::length(up) == Approx(1.0f));
		REQUIRE(glm::dot(right, up) == Approx(0.0f).margin(1e-6));

		// The target is straight ahead.
		const Vec3 c = Vec3(view * Vec4{0.0f, 0.0f, 0.0f, 1.0f});
		REQUIRE(c.x == Approx(0.0f).margin(1e-5));
		REQUIRE(c.y == Approx(0.0f).margin(1e-5));
		REQUIRE(c.z == Approx(-5.0f));
	}

	SECTION("nearly parallel up") {
		const Mat4 view = look_at(Vec3{0.0f, 0.0f, 5.0f}, Vec3{0.0f},
			Vec3{1e-7f, 0.0f, 1.0f});
		REQUIRE(is_finite(view));
	}
}

TEST_CASE("Spherical coordinates", "[framing]")
{
	const Vec3 p = spherical_to_cartesian(90.0f, 0.0f, 2.0f);
	REQUIRE(p.x == Approx(0.0f).margin(1e-6));
	REQUIRE(p.y == Approx(2.0f));
	REQUIRE(p.z == Approx(0.0f).margin(1e-6));

	const Vec3 top = spherical_to_cartesian(0.0f, 90.0f, 1.0f);
	REQUIRE(top.z == Approx(1.0f));
}
