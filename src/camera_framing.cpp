#include <cmath>
#include <limits>
#include <algorithm>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "camera_framing.hpp"

template <typename F>
constexpr F to_rad(F deg)
{
	return deg * M_PI / 180.0;
}

Vec3 spherical_to_cartesian(real azimuth_deg, real elevation_deg,
	real radius)
{
	const double az = to_rad(double(azimuth_deg));
	const double el = to_rad(double(elevation_deg));

	return Vec3{
		radius * std::cos(el) * std::cos(az),
		radius * std::cos(el) * std::sin(az),
		radius * std::sin(el)
	};
}

Mat4 look_at(const Vec3& eye, const Vec3& target, const Vec3& up)
{
	const Vec3 f = glm::normalize(target - eye);

	Vec3 u = up;
	if(glm::length(glm::cross(f, u)) < 1e-6f) {
		// Looking straight along up, pick an axis not parallel to f.
		const Vec3 y{0.0f, 1.0f, 0.0f};
		u = glm::length(glm::cross(f, y)) < 1e-6f
			? Vec3{1.0f, 0.0f, 0.0f} : y;
	}

	const Vec3 s = glm::normalize(glm::cross(f, u));
	u = glm::cross(s, f);

	// Rows are s, u and -f, the translation follows.
	Mat4 view{1.0f};
	for(int i = 0; i < 3; ++i) {
		view[i][0] = s[i];
		view[i][1] = u[i];
		view[i][2] = -f[i];
	}
	view[3][0] = -glm::dot(s, eye);
	view[3][1] = -glm::dot(u, eye);
	view[3][2] = glm::dot(f, eye);

	return view;
}

CameraSpec frame_camera(const Mesh& m, const FramingParams& params)
{
	const Aabb box = bounding_box(m);
	const Vec3 center = box.center();
	const real radius = std::max(glm::length(box.extents()) * 0.5f, 1e-6f);

	CameraSpec cam;
	cam.eye = center + spherical_to_cartesian(params.azimuth_deg,
		params.elevation_deg, radius * 4.0f + 1.0f);
	cam.view = look_at(cam.eye, center, params.up);

	cam.right = Vec3{cam.view[0][0], cam.view[1][0], cam.view[2][0]};
	cam.up = Vec3{cam.view[0][1], cam.view[1][1], cam.view[2][1]};
	cam.back = Vec3{cam.view[0][2], cam.view[1][2], cam.view[2][2]};

	// Project the box corners into camera space.
	Vec3 lo{std::numeric_limits<real>::max()};
	Vec3 hi{std::numeric_limits<real>::lowest()};
	for(int i = 0; i < 8; ++i) {
		const Vec3 corner{
			(i & 1) ? box.hi.x : box.lo.x,
			(i & 2) ? box.hi.y : box.lo.y,
			(i & 4) ? box.hi.z : box.lo.z
		};
		const Vec3 p = Vec3(cam.view * Vec4{corner, 1.0f});
		lo = glm::min(lo, p);
		hi = glm::max(hi, p);
	}

	const real pad = 1.0f + params.margin;
	const real xmag = std::max((hi.x - lo.x) * 0.5f * pad, 1e-6f);
	const real ymag = std::max((hi.y - lo.y) * 0.5f * pad, 1e-6f);

	// Square output, so the view volume is square too.
	cam.xmag = cam.ymag = std::max(xmag, ymag);

	cam.near = std::max(1e-3f, -hi.z - radius * 0.5f);
	cam.far = std::max(cam.near + 1e-3f, -lo.z + radius * 0.5f);

	return cam;
}

Mat4 projection_matrix(const CameraSpec& camera)
{
	Mat4 proj = glm::orthoRH_ZO(
		-camera.xmag, camera.xmag,
		-camera.ymag, camera.ymag,
		camera.near, camera.far);

	// Vulkan has y pointing down.
	proj[1][1] *= -1.0f;
	return proj;
}
