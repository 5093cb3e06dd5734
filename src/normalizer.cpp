#include <algorithm>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "normalizer.hpp"

Quat rot_from_unit_a_to_unit_b(Vec3 a, Vec3 b)
{
	Quat ret{1.0f + glm::dot(a, b), glm::cross(a, b)};
	return glm::normalize(ret);
}

Quat up_axis_rotation(UpAxis source_up)
{
	switch(source_up) {
	case UpAxis::Y:
		return rot_from_unit_a_to_unit_b(
			Vec3{0.0f, 1.0f, 0.0f}, Vec3{0.0f, 0.0f, 1.0f});
	case UpAxis::Z:
	default:
		return Quat{1.0f, 0.0f, 0.0f, 0.0f};
	}
}

Vec3 center_of_mass(const Mesh& m)
{
	// Accumulate in double, big meshes lose too much in float.
	glm::dvec3 weighted{0.0};
	double total_area = 0.0;

	for(size_t i = 0; i + 2 < m.indices.size(); i += 3) {
		const glm::dvec3 a = m.vertices[m.indices[i]].position;
		const glm::dvec3 b = m.vertices[m.indices[i+1]].position;
		const glm::dvec3 c = m.vertices[m.indices[i+2]].position;

		const double area = 0.5 * glm::length(glm::cross(b - a, c - a));
		weighted += area * (a + b + c) / 3.0;
		total_area += area;
	}

	if(total_area > 0.0) {
		return Vec3(weighted / total_area);
	}

	glm::dvec3 sum{0.0};
	for(const auto& v: m.vertices) {
		sum += glm::dvec3(v.position);
	}
	if(!m.vertices.empty()) {
		sum /= double(m.vertices.size());
	}
	return Vec3(sum);
}

NormalizedMesh normalize_mesh(const Mesh& m, const Quat& up_rotation)
{
	const Vec3 com = center_of_mass(m);
	const Vec3 dims = bounding_box(m).extents();
	const real largest = std::max({dims.x, dims.y, dims.z});

	// A single point, or a mesh collapsed to one, keeps its size.
	const real scale = largest > 0.0f ? 1.0f / largest : 1.0f;

	const Mat4 rotation = glm::mat4_cast(up_rotation);
	const Mat4 pose = rotation
		* glm::scale(Mat4{1.0f}, Vec3{scale})
		* glm::translate(Mat4{1.0f}, -com);

	NormalizedMesh ret;
	ret.pose = pose;
	ret.mesh.indices = m.indices;
	ret.mesh.has_color = m.has_color;
	ret.mesh.vertices.reserve(m.vertices.size());

	for(const auto& v: m.vertices) {
		const Vec3 p = Vec3(pose * Vec4{v.position, 1.0f});
		const Vec3 n = up_rotation * v.normal;
		ret.mesh.vertices.emplace_back(p, n, v.color);
	}

	return ret;
}
