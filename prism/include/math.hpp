/*
* File: math
* Project: prism
* Created on: 1/20/2026
*
* Description: Small glm helpers shared by the demo scenes
*/
#ifndef PRISM_MATH_HPP
#define PRISM_MATH_HPP

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace prism {
    /*
     * glm type wrappers (to maintain consistent style)
     */
    using Vector2 = glm::vec2;
    using Vector3 = glm::vec3;
    using Vector4 = glm::vec4;
    using Matrix4 = glm::mat4;
    using Quaternion = glm::quat;

    // Right-handed, clip depth in [-1, 1] (GL convention)
    inline Matrix4 perspective(float fovRadians, float aspect, float zNear, float zFar) {
        return glm::perspectiveRH_NO(fovRadians, aspect, zNear, zFar);
    }

    // Rotates `point` by `theta` radians around `axis` (need not be unit length)
    inline Vector3 rotateAboutAxis(const Vector3& point, const Vector3& axis, float theta) {
        Quaternion q = glm::angleAxis(theta, glm::normalize(axis));
        return q * point;
    }
}

#endif //PRISM_MATH_HPP
