/*
* File: errors
* Project: prism
* Created on: 1/13/2026
*/
#include "errors.hpp"

#include <utility>

using namespace prism;

const char* prism::toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ShaderCompile:    return "ShaderCompile";
    case ErrorKind::ShaderLink:       return "ShaderLink";
    case ErrorKind::UnknownBinding:   return "UnknownBinding";
    case ErrorKind::BufferAllocation: return "BufferAllocation";
    case ErrorKind::SchedulerInit:    return "SchedulerInit";
    case ErrorKind::Config:           return "Config";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), m_kind(kind) {}

ShaderCompileError::ShaderCompileError(ShaderStage stage, std::string diagnostic)
    : Error(ErrorKind::ShaderCompile,
            std::string(toString(stage)) + " shader compile failed: " + diagnostic),
      m_stage(stage), m_diagnostic(std::move(diagnostic)) {}

ShaderLinkError::ShaderLinkError(std::string diagnostic)
    : Error(ErrorKind::ShaderLink, "Program link failed: " + diagnostic),
      m_diagnostic(std::move(diagnostic)) {}

UnknownBindingError::UnknownBindingError(std::string name)
    : Error(ErrorKind::UnknownBinding, "unknown shader binding: " + name),
      m_name(std::move(name)) {}

BufferAllocationError::BufferAllocationError(const std::string& what)
    : Error(ErrorKind::BufferAllocation, "failed to allocate " + what) {}

SchedulerInitError::SchedulerInitError(const std::string& reason)
    : Error(ErrorKind::SchedulerInit, "frame scheduler init failed: " + reason) {}

ConfigError::ConfigError(std::string key, const std::string& reason)
    : Error(ErrorKind::Config, "config '" + key + "': " + reason),
      m_key(std::move(key)) {}
