#pragma once

#include "float.hpp"
#include "mesh_tools.hpp"

struct FramingParams
{
	real azimuth_deg = 45.0f;
	real elevation_deg = 25.0f;

	// Fraction added around the projected silhouette.
	real margin = 0.06f;

	Vec3 up{0.0f, 0.0f, 1.0f};
};

// Orthographic camera. The camera looks down its own -Z axis.
struct CameraSpec
{
	Vec3 eye{0.0f};

	// World to camera transform.
	Mat4 view{1.0f};

	// Half width and half height of the view volume.
	real xmag = 1.0f;
	real ymag = 1.0f;

	real near = 1e-3f;
	real far = 1.0f;

	// Camera basis in world coordinates.
	Vec3 right{1.0f, 0.0f, 0.0f};
	Vec3 up{0.0f, 1.0f, 0.0f};
	Vec3 back{0.0f, 0.0f, 1.0f};
};

Vec3 spherical_to_cartesian(real azimuth_deg, real elevation_deg,
	real radius);

// Right handed look-at. If the view direction is parallel to up,
// a secondary up axis is used instead.
Mat4 look_at(const Vec3& eye, const Vec3& target, const Vec3& up);

CameraSpec frame_camera(const Mesh& m, const FramingParams& params);

// Vulkan clip space: y pointing down, depth in [0, 1].
Mat4 projection_matrix(const CameraSpec& camera);
