/*
* File: test_math.cpp
* Project: prism
* Created on: 1/26/2026
*/
#include <gtest/gtest.h>

#include <cmath>

#include <glm/gtc/constants.hpp>

#include "math.hpp"

using namespace prism;

namespace {

void expectNear(const Vector3& a, const Vector3& b, float eps = 1e-5f) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
    EXPECT_NEAR(a.z, b.z, eps);
}

} // namespace

TEST(Math, PerspectiveMatchesTheGLProjection) {
    const float fov = glm::radians(90.0f);
    const float aspect = 800.0f / 600.0f;
    const float n = 0.1f, f = 1000.0f;
    const Matrix4 m = perspective(fov, aspect, n, f);

    const float t = 1.0f / std::tan(fov / 2.0f);
    EXPECT_NEAR(m[0][0], t / aspect, 1e-5f);
    EXPECT_NEAR(m[1][1], t, 1e-5f);
    EXPECT_NEAR(m[2][2], (f + n) / (n - f), 1e-5f);
    EXPECT_NEAR(m[2][3], -1.0f, 1e-6f);
    EXPECT_NEAR(m[3][2], 2.0f * f * n / (n - f), 1e-4f);
    EXPECT_FLOAT_EQ(m[3][3], 0.0f);
    EXPECT_FLOAT_EQ(m[0][1], 0.0f);
}

TEST(Math, QuarterTurnAboutY) {
    const float quarter = glm::half_pi<float>();
    expectNear(rotateAboutAxis({1, 0, 0}, {0, 1, 0}, quarter), {0, 0, -1});
    expectNear(rotateAboutAxis({0, 0, 1}, {0, 1, 0}, quarter), {1, 0, 0});
}

TEST(Math, AxisNeedNotBeNormalized) {
    const Vector3 p(0.4f, -0.4f, 0.4f);
    expectNear(rotateAboutAxis(p, {0, 5, 0}, 0.3f), rotateAboutAxis(p, {0, 1, 0}, 0.3f));
}

TEST(Math, RepeatedSmallRotationsKeepLength) {
    Vector3 p(0.4f, 0.4f, -0.4f);
    const float len = glm::length(p);
    for (int i = 0; i < 1000; ++i) {
        p = rotateAboutAxis(p, {0, 1, 0}, 1.0f / 30.0f);
    }
    EXPECT_NEAR(glm::length(p), len, 1e-4f);
    EXPECT_NEAR(p.y, 0.4f, 1e-4f);
}
