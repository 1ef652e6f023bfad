/*
* File: gpu_types
* Project: prism
* Created on: 1/12/2026
*
* Description: Backend-neutral enums shared by the device interface and the core
*/
#ifndef PRISM_GPU_TYPES_HPP
#define PRISM_GPU_TYPES_HPP

#include <cstddef>
#include <cstdint>

#include "gpu_flags.hpp"

namespace prism {

/*
 * Buffers
 */

// Binding point a buffer is created for
enum class BufferKind : uint8_t {
    VERTEX, // per-vertex attribute data
    INDEX   // element indices
};

// Usage hint passed along with every upload
enum class UpdateFrequency : uint8_t {
    STATIC,
    DYNAMIC
};

/*
 * Vertex input
 */

enum class ComponentType : uint8_t {
    BYTE,
    UNSIGNED_BYTE,
    SHORT,
    UNSIGNED_SHORT,
    INT,
    UNSIGNED_INT,
    FLOAT
};

constexpr size_t componentSize(ComponentType type) {
    switch (type) {
    case ComponentType::BYTE:
    case ComponentType::UNSIGNED_BYTE:  return 1;
    case ComponentType::SHORT:
    case ComponentType::UNSIGNED_SHORT: return 2;
    case ComponentType::INT:
    case ComponentType::UNSIGNED_INT:
    case ComponentType::FLOAT:          return 4;
    }
    return 0;
}

enum class IndexType : uint8_t {
    UINT8,
    UINT16,
    UINT32
};

enum class PrimitiveTopology : uint8_t {
    POINTS,
    LINES,
    LINE_STRIP,
    TRIANGLES,
    TRIANGLE_STRIP,
    TRIANGLE_FAN
};

/*
 * Shaders
 */

enum class ShaderStage : uint8_t {
    VERTEX,
    FRAGMENT
};

constexpr const char* toString(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::VERTEX:   return "vertex";
    case ShaderStage::FRAGMENT: return "fragment";
    }
    return "unknown";
}

/*
 * Frame state
 */

enum class ClearMask : uint32_t {
    NONE = 0,
    COLOR = 1u << 0,
    DEPTH = 1u << 1,
    STENCIL = 1u << 2,
};
template<> struct is_flags_enum<ClearMask> : std::true_type {};

enum class Feature : uint8_t {
    DEPTH_TEST,
    CULL_FACE,
    BLEND
};

/*
 * Off-screen targets
 */

enum class Format : uint8_t {
    RGBA8_UNORM,
    DEPTH24,
    DEPTH32_FLOAT
};

struct TextureDescriptor {
    uint32_t width = 0;
    uint32_t height = 0;
    Format format = Format::RGBA8_UNORM;
};

} // namespace prism

#endif //PRISM_GPU_TYPES_HPP
