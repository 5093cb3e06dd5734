#pragma once

#include <vector>
#include <cstdint>

#include "float.hpp"
#include "mesh_tools.hpp"
#include "camera_framing.hpp"

struct TurntableParams
{
	// 0 disables the turntable.
	uint32_t frames = 0;

	// Width and height of every frame.
	uint32_t size = 512;
};

// Azimuths, in degrees within [0, 360), of frames evenly spaced
// over one full turn, the first one at start_deg.
std::vector<real> turntable_azimuths(real start_deg, uint32_t frames);

// One camera per azimuth, orbiting the up axis at the elevation of
// params. Every camera gets the widest view extent of them all, so
// the model keeps its apparent size while it turns.
std::vector<CameraSpec> turntable_cameras(const Mesh& m,
	const FramingParams& params, uint32_t frames);
