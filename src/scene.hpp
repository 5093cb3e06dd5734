#pragma once

#include <array>

#include "float.hpp"
#include "mesh_tools.hpp"
#include "camera_framing.hpp"

struct SceneStyle
{
	// Flat background, opaque in the final image.
	Vec3 background{1.0f, 1.0f, 1.0f};

	// Albedo used when the mesh has no vertex colors.
	real grey = 0.9f;

	real ambient = 0.3f;

	// Maps the summed light intensities into displayable range.
	real exposure = 0.25f;
};

struct DirectionalLight
{
	// Unit vector in world space, pointing from the surface to the light.
	Vec3 direction;
	real intensity;
};

// Everything a renderer needs to draw one thumbnail.
// The mesh is referenced, it must outlive the scene.
struct SceneDescription
{
	const Mesh* mesh = nullptr;
	CameraSpec camera;
	std::array<DirectionalLight, 3> lights;
	SceneStyle style;

	bool use_vertex_color() const
	{
		return mesh && mesh->has_color;
	}
};

// Key, fill and back lights, in camera space.
extern const std::array<DirectionalLight, 3> camera_space_lights;

SceneDescription assemble_scene(const Mesh& m, const CameraSpec& camera,
	const SceneStyle& style);
