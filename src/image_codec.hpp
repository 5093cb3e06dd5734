#pragma once

#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include "float.hpp"
#include "renderer.hpp"

// Opaque 8 bit RGB image, rows top to bottom.
struct RgbImage
{
	uint32_t width = 0;
	uint32_t height = 0;
	std::vector<uint8_t> rgb;
};

// PNG encoding failed.
struct EncodeError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

extern const std::array<uint8_t, 8> PNG_SIGNATURE;

bool has_png_signature(const uint8_t* data, size_t size);

// Blends the rendered pixels over the flat background color,
// using the rendered alpha. Background is in [0, 1].
RgbImage composite_over(const RawPixelBuffer& raw, const Vec3& background);

// Encodes into memory. The output has no timestamp or other
// varying chunk, so equal images encode to equal bytes.
std::vector<uint8_t> encode_png(const RgbImage& img);

// The fixed "no preview" image: light grey, with a frame
// and a cross. Always the same for the same size.
RgbImage make_placeholder_image(uint32_t size);
