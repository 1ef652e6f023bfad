/*
* File: buffer_set.cpp
* Project: prism
* Created on: 1/16/2026
*/
#include "buffer_set.hpp"

#include <utility>

#include "errors.hpp"

using namespace prism;

BufferSet BufferSet::Builder::build(IGPUDevice& device) {
    VertexArrayHandle vao = device.createVertexArray();
    if (vao == kNullHandle) {
        throw BufferAllocationError("vertex array");
    }

    // index buffers attach to the vertex array bound while they are created
    device.bindVertexArray(vao);

    std::vector<std::unique_ptr<IBuffer>> buffers;
    buffers.reserve(m_factories.size());
    try {
        for (auto& make : m_factories) {
            buffers.push_back(make(device));
        }
    } catch (...) {
        buffers.clear();
        device.destroyVertexArray(vao);
        m_factories.clear();
        throw;
    }
    m_factories.clear();

    return BufferSet(device, vao, std::move(buffers));
}

BufferSet::BufferSet(IGPUDevice& device, VertexArrayHandle vao, std::vector<std::unique_ptr<IBuffer>> buffers)
    : m_device(&device), m_vao(vao), m_buffers(std::move(buffers)) {}

BufferSet::~BufferSet() { release(); }

BufferSet::BufferSet(BufferSet&& other) noexcept
    : m_device(other.m_device),
      m_vao(std::exchange(other.m_vao, kNullHandle)),
      m_buffers(std::move(other.m_buffers)) {}

BufferSet& BufferSet::operator=(BufferSet&& other) noexcept {
    if (this != &other) {
        release();
        m_device = other.m_device;
        m_vao = std::exchange(other.m_vao, kNullHandle);
        m_buffers = std::move(other.m_buffers);
    }
    return *this;
}

void BufferSet::release() {
    m_buffers.clear();
    if (m_vao != kNullHandle) {
        m_device->destroyVertexArray(m_vao);
        m_vao = kNullHandle;
    }
}

void BufferSet::activate() const {
    m_device->bindVertexArray(m_vao);
}

IBuffer& BufferSet::at(size_t index) {
    if (index >= m_buffers.size()) {
        throw std::out_of_range("buffer index " + std::to_string(index) + " out of range ("
                                + std::to_string(m_buffers.size()) + " buffers)");
    }
    return *m_buffers[index];
}

const IBuffer& BufferSet::at(size_t index) const {
    return const_cast<BufferSet*>(this)->at(index);
}
