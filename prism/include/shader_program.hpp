/*
* File: shader_program.hpp
* Project: prism
* Created on: 1/14/2026
*
* Description: Linked vertex/fragment program with its attribute slots and
* uniform locations resolved once, at construction.
*/
#ifndef PRISM_SHADER_PROGRAM_HPP
#define PRISM_SHADER_PROGRAM_HPP

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gpu_device.hpp"

namespace prism {

// transparent so lookups by string_view don't allocate
struct BindingNameHash {
    using is_transparent = void;
    size_t operator()(std::string_view name) const noexcept {
        return std::hash<std::string_view>{}(name);
    }
};

template <typename T>
using BindingMap = std::unordered_map<std::string, T, BindingNameHash, std::equal_to<>>;

class ShaderProgram {
public:
    /*
     * Compiles both stages, links them and resolves every listed name.
     * Throws ShaderCompileError, ShaderLinkError or UnknownBindingError;
     * on failure every object created so far has already been released.
     */
    ShaderProgram(IGPUDevice& device,
                  std::string_view vertexSource,
                  std::string_view fragmentSource,
                  const std::vector<std::string>& uniformNames,
                  const std::vector<std::string>& attributeNames);
    ~ShaderProgram();

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;
    ShaderProgram(ShaderProgram&& other) noexcept;
    ShaderProgram& operator=(ShaderProgram&& other) noexcept;

    // Throws UnknownBindingError for names not declared at construction
    [[nodiscard]] AttributeSlot findAttribute(std::string_view name) const;
    [[nodiscard]] UniformLocation findUniform(std::string_view name) const;

    void activate() const;

    // Uploads to the named uniform. The program has to be active.
    template <typename T>
    void setUniform(std::string_view name, const T& value) const {
        m_device->setUniform(findUniform(name), value);
    }

    [[nodiscard]] ProgramHandle handle() const { return m_program; }
    [[nodiscard]] const BindingMap<AttributeSlot>& attributes() const { return m_attributes; }
    [[nodiscard]] const BindingMap<UniformLocation>& uniforms() const { return m_uniforms; }

private:
    static ShaderHandle compileStage(IGPUDevice& device, ShaderStage stage, std::string_view source);
    static ProgramHandle linkStages(IGPUDevice& device, ShaderHandle vs, ShaderHandle fs);
    void resolveBindings(const std::vector<std::string>& uniformNames,
                         const std::vector<std::string>& attributeNames);
    void release();

    IGPUDevice* m_device = nullptr;
    ProgramHandle m_program = kNullHandle;
    BindingMap<AttributeSlot> m_attributes;
    BindingMap<UniformLocation> m_uniforms;
};

} // namespace prism

#endif //PRISM_SHADER_PROGRAM_HPP
