/*
* File: test_buffer_set.cpp
* Project: prism
* Created on: 1/26/2026
*/
#include <gtest/gtest.h>

#include "buffer_set.hpp"
#include "errors.hpp"
#include "mock_gpu_device.hpp"

using namespace prism;
using prism::test::MockGpuDevice;

namespace {

struct Vertex {
    glm::vec3 pos;
    glm::vec3 color;
};

std::vector<Vertex> square() {
    return {
        {{0, 0, 0}, {1, 0, 0}},
        {{1, 0, 0}, {0, 1, 0}},
        {{1, 1, 0}, {0, 0, 1}},
        {{0, 1, 0}, {1, 1, 1}},
    };
}

} // namespace

TEST(BufferSet, BuffersKeepInsertionOrder) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    auto vertices = builder.add(square(), BufferKind::VERTEX, UpdateFrequency::DYNAMIC);
    auto indices = builder.add(std::vector<uint8_t>{0, 1, 2, 0, 2, 3}, BufferKind::INDEX, UpdateFrequency::STATIC);
    EXPECT_EQ(builder.size(), 2u);

    BufferSet set = builder.build(device);

    EXPECT_EQ(vertices.index, 0u);
    EXPECT_EQ(indices.index, 1u);
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.at(0).kind(), BufferKind::VERTEX);
    EXPECT_EQ(set.at(1).kind(), BufferKind::INDEX);
    EXPECT_EQ(set.buffer(vertices).length(), 4u);
    EXPECT_EQ(set.buffer(indices).length(), 6u);
    EXPECT_EQ(builder.size(), 0u);
}

TEST(BufferSet, IndexBufferAttachesToItsVertexArray) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    auto indices = builder.add(std::vector<uint16_t>{0, 1, 2}, BufferKind::INDEX, UpdateFrequency::STATIC);

    BufferSet set = builder.build(device);

    EXPECT_NE(set.handle(), kNullHandle);
    EXPECT_EQ(device.elementBindings.at(set.handle()), set.buffer(indices).handle());
}

TEST(BufferSet, SyncingOneSetsIndicesKeepsOtherSetsBindings) {
    MockGpuDevice device;
    BufferSet::Builder builderA;
    builderA.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    auto indicesA = builderA.add(std::vector<uint8_t>{0, 1, 2}, BufferKind::INDEX, UpdateFrequency::DYNAMIC);
    BufferSet a = builderA.build(device);

    BufferSet::Builder builderB;
    builderB.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    auto indicesB = builderB.add(std::vector<uint8_t>{2, 3, 0}, BufferKind::INDEX, UpdateFrequency::STATIC);
    BufferSet b = builderB.build(device);
    const auto bytesB = device.contents(b.buffer(indicesB).handle());

    b.activate();
    auto& ia = a.buffer(indicesA);
    ia.records() = {0, 2, 3, 0, 1, 2};
    ia.synchronize();

    EXPECT_EQ(device.elementBindings.at(b.handle()), b.buffer(indicesB).handle());
    EXPECT_EQ(device.elementBindings.at(a.handle()), ia.handle());
    EXPECT_EQ(device.contents(b.buffer(indicesB).handle()), bytesB);
    EXPECT_EQ(device.contents(ia.handle()).size(), 6u);

    EXPECT_TRUE(b.drawIndexed(indicesB, PrimitiveTopology::TRIANGLES));
    EXPECT_EQ(device.draws.back().count, 3u);
}

TEST(BufferSet, WrongRecordTypeAtPositionThrows) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    BufferSet set = builder.build(device);

    EXPECT_THROW((void)set.buffer<uint8_t>(0), std::logic_error);
    EXPECT_NO_THROW((void)set.buffer<Vertex>(0));
    EXPECT_THROW((void)set.at(1), std::out_of_range);
    EXPECT_THROW((void)set.buffer<Vertex>(3), std::out_of_range);
}

TEST(BufferSet, EmptyIndexBufferDrawsNothing) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    auto vertices = builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    auto indices = builder.add(std::vector<uint8_t>{}, BufferKind::INDEX, UpdateFrequency::STATIC);
    BufferSet set = builder.build(device);

    EXPECT_EQ(set.buffer(indices).length(), 0u);
    EXPECT_EQ(set.buffer(vertices).length(), 4u);
    EXPECT_FALSE(set.drawIndexed(indices, PrimitiveTopology::TRIANGLES));
    EXPECT_TRUE(device.draws.empty());
}

TEST(BufferSet, DrawIndexedUsesIndexCountAndType) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    auto indices = builder.add(std::vector<uint8_t>(36, 0), BufferKind::INDEX, UpdateFrequency::STATIC);
    BufferSet set = builder.build(device);
    device.bindVertexArray(kNullHandle);

    EXPECT_TRUE(set.drawIndexed(indices, PrimitiveTopology::TRIANGLES, 5000));

    ASSERT_EQ(device.draws.size(), 1u);
    const auto& draw = device.draws.back();
    EXPECT_TRUE(draw.indexed);
    EXPECT_EQ(draw.count, 36u);
    EXPECT_EQ(draw.indexType, IndexType::UINT8);
    EXPECT_EQ(draw.instances, 5000u);
    EXPECT_EQ(draw.vertexArray, set.handle());
}

TEST(BufferSet, ZeroInstancesDrawNothing) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    auto vertices = builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    BufferSet set = builder.build(device);

    EXPECT_FALSE(set.drawArrays(vertices, PrimitiveTopology::POINTS, 0));
    EXPECT_TRUE(set.drawArrays(vertices, PrimitiveTopology::TRIANGLE_FAN));
    ASSERT_EQ(device.draws.size(), 1u);
    EXPECT_FALSE(device.draws[0].indexed);
    EXPECT_EQ(device.draws[0].count, 4u);
}

TEST(BufferSet, DestructionReleasesBuffersAndVertexArray) {
    MockGpuDevice device;
    {
        BufferSet::Builder builder;
        builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
        builder.add(std::vector<uint32_t>{0, 1, 2}, BufferKind::INDEX, UpdateFrequency::STATIC);
        BufferSet set = builder.build(device);
        EXPECT_EQ(device.liveBuffers.size(), 2u);
        EXPECT_EQ(device.liveVertexArrays.size(), 1u);
    }
    EXPECT_TRUE(device.nothingAlive());
}

TEST(BufferSet, MovedSetOwnsTheHandles) {
    MockGpuDevice device;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    BufferSet a = builder.build(device);
    const VertexArrayHandle vao = a.handle();

    BufferSet b(std::move(a));
    EXPECT_EQ(b.handle(), vao);
    EXPECT_EQ(a.handle(), kNullHandle);
    EXPECT_EQ(device.liveVertexArrays.count(vao), 1u);
}

TEST(BufferSet, VertexArrayFailureThrows) {
    MockGpuDevice device;
    device.failVertexArrayCreate = true;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);

    EXPECT_THROW((void)builder.build(device), BufferAllocationError);
    EXPECT_TRUE(device.nothingAlive());
}

TEST(BufferSet, BufferFailureMidBuildReleasesWhatWasMade) {
    MockGpuDevice device;
    device.buffersBeforeFailure = 1;
    BufferSet::Builder builder;
    builder.add(square(), BufferKind::VERTEX, UpdateFrequency::STATIC);
    builder.add(std::vector<uint8_t>{0, 1, 2}, BufferKind::INDEX, UpdateFrequency::STATIC);

    EXPECT_THROW((void)builder.build(device), BufferAllocationError);
    EXPECT_TRUE(device.nothingAlive());
}
