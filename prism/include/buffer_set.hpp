/*
* File: buffer_set.hpp
* Project: prism
* Created on: 1/16/2026
*
* Description: A vertex array together with the buffers it reads from.
*/
#ifndef PRISM_BUFFER_SET_HPP
#define PRISM_BUFFER_SET_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "typed_buffer.hpp"

namespace prism {

// Position of a buffer inside its set, typed by the record it holds
template <typename Record>
struct BufferSlot {
    size_t index = 0;
};

class BufferSet {
public:
    /*
     * One add() per buffer; the returned slot addresses that buffer in the
     * built set. Buffers keep the order they were added in.
     */
    class Builder {
    public:
        template <typename Record>
        BufferSlot<Record> add(std::vector<Record> records, BufferKind kind, UpdateFrequency frequency) {
            const size_t index = m_factories.size();
            m_factories.emplace_back(
                [records = std::move(records), kind, frequency](IGPUDevice& device) mutable
                    -> std::unique_ptr<IBuffer> {
                    return std::make_unique<TypedBuffer<Record>>(device, std::move(records), kind, frequency);
                });
            return BufferSlot<Record>{index};
        }

        // Creates the vertex array, leaves it bound, then creates the buffers.
        // Consumes the queued buffers.
        BufferSet build(IGPUDevice& device);

        [[nodiscard]] size_t size() const { return m_factories.size(); }

    private:
        std::vector<std::function<std::unique_ptr<IBuffer>(IGPUDevice&)>> m_factories;
    };

    ~BufferSet();

    BufferSet(const BufferSet&) = delete;
    BufferSet& operator=(const BufferSet&) = delete;
    BufferSet(BufferSet&& other) noexcept;
    BufferSet& operator=(BufferSet&& other) noexcept;

    // Must precede any draw that uses this set
    void activate() const;

    template <typename Record>
    TypedBuffer<Record>& buffer(BufferSlot<Record> slot) { return buffer<Record>(slot.index); }

    template <typename Record>
    const TypedBuffer<Record>& buffer(BufferSlot<Record> slot) const {
        return const_cast<BufferSet*>(this)->buffer<Record>(slot.index);
    }

    template <typename Record>
    TypedBuffer<Record>& buffer(size_t index) {
        auto* typed = dynamic_cast<TypedBuffer<Record>*>(&at(index));
        if (!typed) {
            throw std::logic_error("buffer " + std::to_string(index) + " holds a different record type");
        }
        return *typed;
    }

    IBuffer& at(size_t index);
    const IBuffer& at(size_t index) const;

    /*
     * Activates the set and draws `instances` copies of the indexed geometry.
     * Returns false without drawing when the index buffer is empty.
     */
    template <typename Index>
    bool drawIndexed(BufferSlot<Index> indices, PrimitiveTopology topology, uint32_t instances = 1) {
        const auto& idx = buffer(indices);
        if (idx.length() == 0 || instances == 0) return false;
        activate();
        m_device->drawElements(topology, static_cast<uint32_t>(idx.length()),
                               IndexFormat<Index>::type, 0, instances);
        return true;
    }

    template <typename Record>
    bool drawArrays(BufferSlot<Record> vertices, PrimitiveTopology topology, uint32_t instances = 1) {
        const auto& vtx = buffer(vertices);
        if (vtx.length() == 0 || instances == 0) return false;
        activate();
        m_device->drawArrays(topology, 0, static_cast<uint32_t>(vtx.length()), instances);
        return true;
    }

    [[nodiscard]] size_t size() const { return m_buffers.size(); }
    [[nodiscard]] VertexArrayHandle handle() const { return m_vao; }

private:
    BufferSet(IGPUDevice& device, VertexArrayHandle vao, std::vector<std::unique_ptr<IBuffer>> buffers);
    void release();

    IGPUDevice* m_device = nullptr;
    VertexArrayHandle m_vao = kNullHandle;
    std::vector<std::unique_ptr<IBuffer>> m_buffers;
};

} // namespace prism

#endif //PRISM_BUFFER_SET_HPP
