#include <glm/geometric.hpp>

#include "scene.hpp"

const std::array<DirectionalLight, 3> camera_space_lights = {{
	{glm::normalize(Vec3{0.3f, 0.2f, 1.0f}), 3.0f},
	{glm::normalize(Vec3{-0.6f, -0.2f, 1.0f}), 1.2f},
	{glm::normalize(Vec3{-0.2f, 0.8f, -0.3f}), 0.8f}
}};

SceneDescription assemble_scene(const Mesh& m, const CameraSpec& camera,
	const SceneStyle& style)
{
	SceneDescription scene;
	scene.mesh = &m;
	scene.camera = camera;
	scene.style = style;

	// The lights follow the camera, so every view angle
	// gets the same shading.
	for(size_t i = 0; i < camera_space_lights.size(); ++i) {
		const Vec3& d = camera_space_lights[i].direction;
		scene.lights[i] = DirectionalLight{
			glm::normalize(d.x * camera.right + d.y * camera.up
				+ d.z * camera.back),
			camera_space_lights[i].intensity
		};
	}

	return scene;
}
