/*
* File: typed_buffer.hpp
* Project: prism
* Created on: 1/15/2026
*
* Description: GPU buffer backed by a host-side vector of fixed-layout records.
*
* The vector is the source of truth. Nothing reaches the GPU until
* synchronize() is called, which replaces the whole buffer content.
*/
#ifndef PRISM_TYPED_BUFFER_HPP
#define PRISM_TYPED_BUFFER_HPP

#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "gpu_device.hpp"
#include "vertex_layout.hpp"

namespace prism {

// Record-type independent view used by BufferSet
class IBuffer {
public:
    virtual ~IBuffer() = default;

    virtual void synchronize() = 0;

    [[nodiscard]] virtual size_t length() const = 0;
    [[nodiscard]] virtual size_t byteSize() const = 0;
    [[nodiscard]] virtual BufferKind kind() const = 0;
    [[nodiscard]] virtual UpdateFrequency frequency() const = 0;
    [[nodiscard]] virtual BufferHandle handle() const = 0;
};

template <typename Record>
class TypedBuffer final : public IBuffer {
    static_assert(std::is_trivially_copyable_v<Record>, "records are uploaded byte-for-byte");
    static_assert(std::is_standard_layout_v<Record>, "field offsets are taken with offsetof");

public:
    static constexpr size_t kStride = sizeof(Record);

    // Allocates the GPU buffer and uploads the initial records.
    // Index buffers attach to whatever vertex array is current at creation,
    // so build them with their owning set active (BufferSet::Builder does this).
    TypedBuffer(IGPUDevice& device, std::vector<Record> records, BufferKind kind, UpdateFrequency frequency)
        : m_device(&device), m_records(std::move(records)), m_kind(kind), m_frequency(frequency) {
        m_buffer = m_device->createBuffer();
        if (m_buffer == kNullHandle) {
            throw BufferAllocationError(kind == BufferKind::INDEX ? "index buffer" : "vertex buffer");
        }
        if (m_kind == BufferKind::INDEX) {
            // attaches to the current vertex array; the only INDEX bind ever made
            m_device->bindBuffer(BufferKind::INDEX, m_buffer);
        }
        synchronize();
    }

    ~TypedBuffer() override {
        if (m_buffer != kNullHandle) {
            m_device->destroyBuffer(m_buffer);
            m_buffer = kNullHandle;
        }
    }

    TypedBuffer(const TypedBuffer&) = delete;
    TypedBuffer& operator=(const TypedBuffer&) = delete;
    TypedBuffer(TypedBuffer&&) = delete;
    TypedBuffer& operator=(TypedBuffer&&) = delete;

    // Both kinds upload through the array target; a vertex array's index
    // binding is never changed here.
    void synchronize() override {
        serialize();
        m_device->bindBuffer(BufferKind::VERTEX, m_buffer);
        m_device->uploadBuffer(BufferKind::VERTEX, m_staging, m_frequency);
    }

    /*
     * Points `slot` at `components` values of `type` starting `byteOffset` bytes
     * into every record, and enables the slot. The caller's vertex array must be
     * active. Throws std::out_of_range if the field would read past the record.
     */
    void bindField(AttributeSlot slot, uint32_t components, ComponentType type,
                   bool normalized, size_t byteOffset) const {
        if (m_kind != BufferKind::VERTEX) {
            throw std::logic_error("bindField on an index buffer");
        }
        if (components < 1 || components > 4) {
            throw std::out_of_range("attribute component count must be 1-4, got " + std::to_string(components));
        }
        const size_t span = components * componentSize(type);
        if (byteOffset > kStride || span > kStride - byteOffset) {
            throw std::out_of_range("attribute at offset " + std::to_string(byteOffset) + " of "
                                    + std::to_string(span) + " bytes, record is "
                                    + std::to_string(kStride));
        }

        m_device->bindBuffer(BufferKind::VERTEX, m_buffer);
        m_device->vertexAttribPointer(slot, components, type, normalized,
                                      static_cast<uint32_t>(kStride), byteOffset);
        m_device->enableVertexAttrib(slot);
    }

    void bindField(AttributeSlot slot, const VertexField& field) const {
        bindField(slot, field.components, field.type, field.normalized, field.offset);
    }

    // 0 = per vertex, n = advance once every n instances
    void bindFieldDivisor(AttributeSlot slot, const VertexField& field, uint32_t divisor) const {
        bindField(slot, field);
        m_device->vertexAttribDivisor(slot, divisor);
    }

    [[nodiscard]] std::vector<Record>& records() { return m_records; }
    [[nodiscard]] const std::vector<Record>& records() const { return m_records; }
    Record& operator[](size_t i) { return m_records[i]; }
    const Record& operator[](size_t i) const { return m_records[i]; }

    [[nodiscard]] size_t length() const override { return m_records.size(); }
    [[nodiscard]] size_t byteSize() const override { return m_records.size() * kStride; }
    [[nodiscard]] BufferKind kind() const override { return m_kind; }
    [[nodiscard]] UpdateFrequency frequency() const override { return m_frequency; }
    [[nodiscard]] BufferHandle handle() const override { return m_buffer; }

    // only for uint8_t / uint16_t / uint32_t records
    [[nodiscard]] IndexType indexType() const {
        return IndexFormat<Record>::type;
    }

private:
    // copy each record into the staging bytes, in order, sizeof(Record) apart
    void serialize() {
        m_staging.resize(byteSize());
        std::byte* dst = m_staging.data();
        for (const Record& r : m_records) {
            std::memcpy(dst, &r, kStride);
            dst += kStride;
        }
    }

    IGPUDevice* m_device;
    std::vector<Record> m_records;
    std::vector<std::byte> m_staging;
    BufferKind m_kind;
    UpdateFrequency m_frequency;
    BufferHandle m_buffer = kNullHandle;
};

} // namespace prism

#endif //PRISM_TYPED_BUFFER_HPP
