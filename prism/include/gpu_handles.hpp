/*
* File: gpu_handles
* Project: prism
* Created on: 1/12/2026
*
* Description: Opaque handle aliases handed out by an IGPUDevice
*/
#ifndef PRISM_GPU_HANDLES_HPP
#define PRISM_GPU_HANDLES_HPP

#include <cstdint>

namespace prism {
using BufferHandle = uint32_t;
using ShaderHandle = uint32_t;
using ProgramHandle = uint32_t;
using VertexArrayHandle = uint32_t;
using TextureHandle = uint32_t;
using FramebufferHandle = uint32_t;

// numbered vertex input of a linked program
using AttributeSlot = uint32_t;
using UniformLocation = int32_t;

// no backend ever hands out 0; framebuffer 0 is the window surface
inline constexpr uint32_t kNullHandle = 0;
}

#endif //PRISM_GPU_HANDLES_HPP
