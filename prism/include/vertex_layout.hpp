/*
* File: vertex_layout.hpp
* Project: prism
* Created on: 1/15/2026
*
* Description: Field reflection for vertex records. Offsets come from offsetof
* on the real record type, component count and type from the member type.
*/
#ifndef PRISM_VERTEX_LAYOUT_HPP
#define PRISM_VERTEX_LAYOUT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include <glm/glm.hpp>

#include "gpu_types.hpp"

namespace prism {

/*
 * AttributeFormat<T> maps a member type onto (component count, component type).
 * Specialize it for your own small structs if they are tightly packed.
 */
template <typename T>
struct AttributeFormat;

template <ComponentType Type, uint32_t Count>
struct AttributeFormatBase {
    static constexpr ComponentType type = Type;
    static constexpr uint32_t components = Count;
};

template<> struct AttributeFormat<float>    : AttributeFormatBase<ComponentType::FLOAT, 1> {};
template<> struct AttributeFormat<int8_t>   : AttributeFormatBase<ComponentType::BYTE, 1> {};
template<> struct AttributeFormat<uint8_t>  : AttributeFormatBase<ComponentType::UNSIGNED_BYTE, 1> {};
template<> struct AttributeFormat<int16_t>  : AttributeFormatBase<ComponentType::SHORT, 1> {};
template<> struct AttributeFormat<uint16_t> : AttributeFormatBase<ComponentType::UNSIGNED_SHORT, 1> {};
template<> struct AttributeFormat<int32_t>  : AttributeFormatBase<ComponentType::INT, 1> {};
template<> struct AttributeFormat<uint32_t> : AttributeFormatBase<ComponentType::UNSIGNED_INT, 1> {};

template <glm::length_t L, typename T, glm::qualifier Q>
struct AttributeFormat<glm::vec<L, T, Q>>
    : AttributeFormatBase<AttributeFormat<T>::type, static_cast<uint32_t>(L)> {};

template <typename T, size_t N>
struct AttributeFormat<std::array<T, N>>
    : AttributeFormatBase<AttributeFormat<T>::type, static_cast<uint32_t>(N)> {};

template <typename T, size_t N>
struct AttributeFormat<T[N]>
    : AttributeFormatBase<AttributeFormat<T>::type, static_cast<uint32_t>(N)> {};

/*
 * IndexFormat<T>: element types usable in an index buffer
 */
template <typename T>
struct IndexFormat;

template<> struct IndexFormat<uint8_t>  { static constexpr IndexType type = IndexType::UINT8; };
template<> struct IndexFormat<uint16_t> { static constexpr IndexType type = IndexType::UINT16; };
template<> struct IndexFormat<uint32_t> { static constexpr IndexType type = IndexType::UINT32; };

// One bindable member of a record
struct VertexField {
    const char* name = "";
    size_t offset = 0;
    size_t size = 0;
    uint32_t components = 0;
    ComponentType type = ComponentType::FLOAT;
    bool normalized = false;

    [[nodiscard]] constexpr size_t end() const {
        return offset + components * componentSize(type);
    }
};

template <typename Record, typename Member>
constexpr VertexField makeVertexField(const char* name, size_t offset, bool normalized = false) {
    static_assert(std::is_standard_layout_v<Record>, "vertex records need a standard layout for offsetof");
    using Format = AttributeFormat<std::remove_cv_t<Member>>;
    static_assert(Format::components >= 1 && Format::components <= 4,
                  "a vertex attribute holds 1 to 4 components");
    static_assert(Format::components * componentSize(Format::type) == sizeof(Member),
                  "member is not tightly packed");
    return VertexField{name, offset, sizeof(Member), Format::components, Format::type, normalized};
}

} // namespace prism

// Describes Record::member for TypedBuffer::bindField
#define PRISM_VERTEX_FIELD(Record, member) \
    ::prism::makeVertexField<Record, decltype(Record::member)>(#member, offsetof(Record, member))

#define PRISM_VERTEX_FIELD_NORMALIZED(Record, member) \
    ::prism::makeVertexField<Record, decltype(Record::member)>(#member, offsetof(Record, member), true)

#endif //PRISM_VERTEX_LAYOUT_HPP
