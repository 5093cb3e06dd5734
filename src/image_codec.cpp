#include <csetjmp>
#include <cmath>
#include <algorithm>

#include <png.h>

#include "image_codec.hpp"

const std::array<uint8_t, 8> PNG_SIGNATURE = {
	0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'
};

bool has_png_signature(const uint8_t* data, size_t size)
{
	return size >= PNG_SIGNATURE.size()
		&& std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), data);
}

static uint8_t to_byte(real v)
{
	return uint8_t(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

RgbImage composite_over(const RawPixelBuffer& raw, const Vec3& background)
{
	if(raw.rgba.size() != size_t(raw.width) * raw.height * 4) {
		throw EncodeError("Pixel buffer holds "
			+ std::to_string(raw.rgba.size()) + " bytes, not enough for "
			+ std::to_string(raw.width) + "x"
			+ std::to_string(raw.height) + " RGBA.");
	}

	RgbImage img;
	img.width = raw.width;
	img.height = raw.height;
	img.rgb.resize(size_t(raw.width) * raw.height * 3);

	const uint8_t bg[3] = {
		to_byte(background.r),
		to_byte(background.g),
		to_byte(background.b)
	};

	const size_t count = size_t(raw.width) * raw.height;
	for(size_t i = 0; i < count; ++i) {
		const uint8_t* src = &raw.rgba[i * 4];
		uint8_t* dst = &img.rgb[i * 3];
		const unsigned a = src[3];

		for(int c = 0; c < 3; ++c) {
			// Integer blend, rounded.
			dst[c] = uint8_t((src[c] * a + bg[c] * (255u - a) + 127u)
				/ 255u);
		}
	}

	return img;
}

static void write_to_vector(png_structp png, png_bytep data, png_size_t len)
{
	auto out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
	out->insert(out->end(), data, data + len);
}

static void flush_nothing(png_structp)
{}

static void raise_png_error(png_structp png, png_const_charp msg)
{
	// Stash the message and unwind through libpng's own longjmp.
	auto err = static_cast<std::string*>(png_get_error_ptr(png));
	*err = msg;
	png_longjmp(png, 1);
}

static void ignore_png_warning(png_structp, png_const_charp)
{}

std::vector<uint8_t> encode_png(const RgbImage& img)
{
	if(img.width == 0 || img.height == 0
		|| img.rgb.size() != size_t(img.width) * img.height * 3)
	{
		throw EncodeError("Invalid image dimensions for PNG encoding.");
	}

	std::string error;
	std::vector<uint8_t> out;

	png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING,
		&error, raise_png_error, ignore_png_warning);
	if(!png) {
		throw EncodeError("Could not create PNG write struct.");
	}

	png_infop info = png_create_info_struct(png);
	if(!info) {
		png_destroy_write_struct(&png, nullptr);
		throw EncodeError("Could not create PNG info struct.");
	}

	std::vector<png_const_bytep> rows(img.height);
	for(uint32_t y = 0; y < img.height; ++y) {
		rows[y] = &img.rgb[size_t(y) * img.width * 3];
	}

	if(setjmp(png_jmpbuf(png))) {
		png_destroy_write_struct(&png, &info);
		throw EncodeError("PNG encoding failed: " + error);
	}

	png_set_write_fn(png, &out, write_to_vector, flush_nothing);
	png_set_IHDR(png, info, img.width, img.height, 8,
		PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
		PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
	png_set_compression_level(png, 9);

	png_write_info(png, info);
	png_write_image(png, const_cast<png_bytepp>(rows.data()));
	png_write_end(png, nullptr);

	png_destroy_write_struct(&png, &info);

	return out;
}

RgbImage make_placeholder_image(uint32_t size)
{
	RgbImage img;
	img.width = size;
	img.height = size;
	img.rgb.assign(size_t(size) * size * 3, 0xee);

	const uint32_t border = std::max(1u, size / 64);
	const uint32_t stroke = std::max(1u, size / 128);
	const uint8_t ink = 0xa0;

	for(uint32_t y = 0; y < size; ++y) {
		for(uint32_t x = 0; x < size; ++x) {
			const bool frame = x < border || y < border
				|| x >= size - border || y >= size - border;

			// Distance to both diagonals, in pixels along x.
			const uint32_t d1 = x > y ? x - y : y - x;
			const uint32_t anti = size - 1 - x;
			const uint32_t d2 = anti > y ? anti - y : y - anti;
			const bool cross = d1 < stroke || d2 < stroke;

			if(frame || cross) {
				uint8_t* px = &img.rgb[(size_t(y) * size + x) * 3];
				px[0] = px[1] = px[2] = ink;
			}
		}
	}

	return img;
}
