/*
* File: errors
* Project: prism
* Created on: 1/13/2026
*
* Description: Exceptions thrown while building programs, buffers and the frame loop
*/
#ifndef PRISM_ERRORS_HPP
#define PRISM_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "gpu_types.hpp"

namespace prism {

enum class ErrorKind : uint8_t {
    ShaderCompile,
    ShaderLink,
    UnknownBinding,
    BufferAllocation,
    SchedulerInit,
    Config
};

const char* toString(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

class ShaderCompileError : public Error {
public:
    ShaderCompileError(ShaderStage stage, std::string diagnostic);

    [[nodiscard]] ShaderStage stage() const noexcept { return m_stage; }
    [[nodiscard]] const std::string& diagnostic() const noexcept { return m_diagnostic; }

private:
    ShaderStage m_stage;
    std::string m_diagnostic;
};

class ShaderLinkError : public Error {
public:
    explicit ShaderLinkError(std::string diagnostic);

    [[nodiscard]] const std::string& diagnostic() const noexcept { return m_diagnostic; }

private:
    std::string m_diagnostic;
};

// attribute or uniform name the program does not declare
class UnknownBindingError : public Error {
public:
    explicit UnknownBindingError(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
};

class BufferAllocationError : public Error {
public:
    explicit BufferAllocationError(const std::string& what);
};

class SchedulerInitError : public Error {
public:
    explicit SchedulerInitError(const std::string& reason);
};

class ConfigError : public Error {
public:
    ConfigError(std::string key, const std::string& reason);

    [[nodiscard]] const std::string& key() const noexcept { return m_key; }

private:
    std::string m_key;
};

} // namespace prism

#endif //PRISM_ERRORS_HPP
