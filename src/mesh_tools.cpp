#include <cmath>
#include <cctype>
#include <algorithm>

#include <boost/functional/hash.hpp>

#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <assimp/Importer.hpp>

#include <spdlog/spdlog.h>

#include "mesh_tools.hpp"

// Finding the axis aligned bounding box.
Aabb bounding_box(const Mesh& m)
{
	Aabb box;
	if(m.vertices.empty()) {
		return box;
	}

	box.lo = m.vertices[0].position;
	box.hi = box.lo;

	for(size_t i = 1; i < m.vertices.size(); ++i) {
		const Vec3 &p = m.vertices[i].position;
		for(int j = 0; j < 3; ++j) {
			if(p[j] < box.lo[j]) {
				box.lo[j] = p[j];
			} else if(p[j] > box.hi[j]) {
				box.hi[j] = p[j];
			}
		}
	}
	return box;
}

size_t geometry_fingerprint(const Mesh& m)
{
	// Dimensions are rounded to 6 decimal places, so tiny
	// float differences don't produce a different hash.
	const Vec3 dims = bounding_box(m).extents();

	std::size_t hash = m.vertices.size();
	boost::hash_combine(hash, m.face_count());
	for(int i = 0; i < 3; ++i) {
		boost::hash_combine(hash,
			std::llround(double(dims[i]) * 1e6));
	}
	return hash;
}

bool is_supported_mesh_file(const std::filesystem::path& path)
{
	std::string ext = path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	return ext == ".stl" || ext == ".3mf" || ext == ".obj" || ext == ".ply";
}

// Code adapted from assimp library example
// http://sir-kimmi.de/assimp/lib_html/usage.html
Mesh AssimpMeshLoader::load(const std::filesystem::path& path)
{
	if(!is_supported_mesh_file(path)) {
		throw LoadError("Unsupported mesh file type: " + path.string());
	}

	// Create an instance of the Importer class
	Assimp::Importer importer;

	// Configure the importer to filter out everything but the mesh data
	// and the vertex colors.
	importer.SetPropertyInteger(AI_CONFIG_PP_RVC_FLAGS,
		aiComponent_TANGENTS_AND_BITANGENTS |
		aiComponent_TEXCOORDS |
		aiComponent_BONEWEIGHTS |
		aiComponent_ANIMATIONS |
		aiComponent_TEXTURES |
		aiComponent_LIGHTS |
		aiComponent_CAMERAS |
		aiComponent_NORMALS
	);

	// Leave only triangles in the mesh (not points nor lines)
	importer.SetPropertyInteger(AI_CONFIG_PP_SBP_REMOVE,
		aiPrimitiveType_POINT |
		aiPrimitiveType_LINE
	);

	// Remove degenerate primitives
	importer.SetPropertyBool(AI_CONFIG_PP_FD_REMOVE, true);

	// Vertices are not joined, so the generated normals
	// are per face and the model is flat shaded.
	const aiScene* scene = importer.ReadFile(path.string(),
		aiProcess_Triangulate |
		aiProcess_SortByPType |
		aiProcess_RemoveComponent |
		aiProcess_GenNormals |
		aiProcess_PreTransformVertices |
		aiProcess_FindDegenerates |
		aiProcess_FindInvalidData
	);
	if(!scene) {
		// If the import failed, report it
		throw LoadError(
			"Could not load \"" + path.string() + "\": "
			+ importer.GetErrorString()
		);
	}

	// Before returning, we unify all the meshes in a single
	// buffer, to simplify the rendering and computation.

	// Count before allocating and copying.
	size_t vert_count = 0;
	size_t idx_count = 0;
	for(size_t i = 0; i < scene->mNumMeshes; ++i) {
		auto* m = scene->mMeshes[i];
		vert_count += m->mNumVertices;
		idx_count += m->mNumFaces * 3;
	}

	if(idx_count == 0) {
		throw EmptyMeshError(
			"Mesh has no triangles: " + path.string()
		);
	}

	Mesh ret;
	ret.vertices.reserve(vert_count);
	ret.indices.reserve(idx_count);

	// Copy the vertex data.
	for(size_t i = 0; i < scene->mNumMeshes; ++i) {
		auto* m = scene->mMeshes[i];
		const uint32_t base = ret.vertices.size();
		const bool colored = m->HasVertexColors(0);
		ret.has_color = ret.has_color || colored;

		for(size_t j = 0; j < m->mNumVertices; ++j) {
			ret.vertices.emplace_back();
			VertexData& v = ret.vertices.back();

			for(uint8_t k = 0; k < 3; ++k) {
				v.position[k] = m->mVertices[j][k];
				if(m->mNormals) {
					v.normal[k] = m->mNormals[j][k];
				}
			}

			if(colored) {
				const aiColor4D& c = m->mColors[0][j];
				v.color = Vec4{c.r, c.g, c.b, c.a};
			}
		}

		for(size_t j = 0; j < m->mNumFaces; ++j) {
			const aiFace& face = m->mFaces[j];
			if(face.mNumIndices != 3) {
				continue;
			}
			for(uint8_t k = 0; k < 3; ++k) {
				ret.indices.push_back(base + face.mIndices[k]);
			}
		}
	}

	if(ret.indices.empty()) {
		throw EmptyMeshError(
			"Mesh has no triangles: " + path.string()
		);
	}

	spdlog::debug("[MeshLoader] {}: {} vertices, {} faces{}",
		path.string(), ret.vertices.size(), ret.face_count(),
		ret.has_color ? ", vertex colors" : "");

	return ret;
}
