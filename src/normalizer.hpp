#pragma once

#include "float.hpp"
#include "mesh_tools.hpp"

// Mesh centered at the origin, with largest extent 1,
// and the transform that took it there.
struct NormalizedMesh
{
	Mesh mesh;
	Mat4 pose{1.0f};
};

// Canonical up axis is +Z.
enum class UpAxis
{
	Z,
	Y
};

// Get quaternion rotation from unit vector a to unit vector b.
// Doesn't work if a and b are opposites.
Quat rot_from_unit_a_to_unit_b(Vec3 a, Vec3 b);

// Rotation taking the given source up axis to +Z.
Quat up_axis_rotation(UpAxis source_up);

// Area weighted average of the triangle centroids. Falls back to the
// plain vertex average if every triangle is degenerate.
Vec3 center_of_mass(const Mesh& m);

NormalizedMesh normalize_mesh(const Mesh& m,
	const Quat& up_rotation = Quat{1.0f, 0.0f, 0.0f, 0.0f});
