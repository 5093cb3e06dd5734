#include <cmath>
#include <algorithm>

#include "turntable.hpp"

std::vector<real> turntable_azimuths(real start_deg, uint32_t frames)
{
	std::vector<real> ret;
	ret.reserve(frames);
	for(uint32_t i = 0; i < frames; ++i) {
		double az = std::fmod(double(start_deg)
			+ 360.0 * double(i) / double(frames), 360.0);
		if(az < 0.0) {
			az += 360.0;
		}
		ret.push_back(real(az));
	}
	return ret;
}

std::vector<CameraSpec> turntable_cameras(const Mesh& m,
	const FramingParams& params, uint32_t frames)
{
	std::vector<CameraSpec> cams;
	cams.reserve(frames);

	real extent = 0.0f;
	for(const real az: turntable_azimuths(params.azimuth_deg, frames)) {
		FramingParams p = params;
		p.azimuth_deg = az;
		cams.push_back(frame_camera(m, p));
		extent = std::max(extent, cams.back().xmag);
	}

	for(auto& c: cams) {
		c.xmag = c.ymag = extent;
	}
	return cams;
}
