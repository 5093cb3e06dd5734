#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <filesystem>

#include "float.hpp"

struct VertexData
{
	VertexData() = default;
	VertexData(const Vec3& p, const Vec3& n, const Vec4& c = Vec4{1.0f}):
		position(p),
		normal(n),
		color(c)
	{}

	Vec3 position{0.0f};
	Vec3 normal{0.0f, 0.0f, 1.0f};
	Vec4 color{1.0f};
};

// Triangle soup. Every 3 indices make a face.
struct Mesh
{
	std::vector<VertexData> vertices;
	std::vector<uint32_t> indices;

	// True if the source file carried per-vertex colors.
	bool has_color = false;

	size_t face_count() const
	{
		return indices.size() / 3;
	}
};

// Axis aligned bounding box. lo[i] <= hi[i] always holds
// for a non-empty mesh; zero extents are legal.
struct Aabb
{
	Vec3 lo{0.0f};
	Vec3 hi{0.0f};

	Vec3 center() const
	{
		return (lo + hi) * 0.5f;
	}

	Vec3 extents() const
	{
		return hi - lo;
	}
};

// The file could not be read as a mesh.
struct LoadError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// The file was read, but has no triangles.
struct EmptyMeshError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

Aabb bounding_box(const Mesh& m);

// Stable hash of the mesh dimensions and element counts,
// used to recognize repeated renders of the same geometry.
size_t geometry_fingerprint(const Mesh& m);

// True if the extension is one of the accepted upload formats.
bool is_supported_mesh_file(const std::filesystem::path& path);

// Source of meshes for the pipeline.
class MeshLoader
{
public:
	virtual ~MeshLoader() = default;

	// Throws LoadError or EmptyMeshError.
	virtual Mesh load(const std::filesystem::path& path) = 0;
};

// Reads STL, 3MF, OBJ and PLY through Assimp.
class AssimpMeshLoader: public MeshLoader
{
public:
	Mesh load(const std::filesystem::path& path) override;
};
