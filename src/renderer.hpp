#pragma once

#include <vector>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <functional>

#include "scene.hpp"

enum class RendererBackend
{
	// Hardware accelerated device.
	Gpu,
	// CPU implementation of the same API, e.g. lavapipe.
	Software
};

// "gpu" or "cpu", as reported to the user.
const char* backend_name(RendererBackend b);

// RGBA8, rows top to bottom. Alpha is 0 where nothing was drawn.
struct RawPixelBuffer
{
	uint32_t width = 0;
	uint32_t height = 0;
	std::vector<uint8_t> rgba;
};

// The backend could not be brought up.
struct BackendInitError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// The backend was up, but drawing failed.
struct RenderError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

class Renderer
{
public:
	virtual ~Renderer() = default;

	// Throws RenderError.
	virtual RawPixelBuffer render(const SceneDescription& scene,
		uint32_t width, uint32_t height) = 0;

	virtual RendererBackend backend() const = 0;
};

// Builds a renderer for the backend. Throws BackendInitError.
using RendererFactory =
	std::function<std::unique_ptr<Renderer>(RendererBackend)>;
