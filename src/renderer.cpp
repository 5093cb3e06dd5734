#include "renderer.hpp"

const char* backend_name(RendererBackend b)
{
	return b == RendererBackend::Gpu ? "gpu" : "cpu";
}
