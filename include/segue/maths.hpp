#ifndef SEGUE_MATHS_HPP_INCLUDED
#define SEGUE_MATHS_HPP_INCLUDED

#include <complex>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <glm/gtc/quaternion.hpp>

namespace segue {
    // Shortest-arc rotation; t is not clamped so overshooting curves keep turning.
    inline glm::quat blend_rotation(const glm::quat& from, const glm::quat& to, float t) {
        return glm::slerp(from, to, t);
    }

    inline glm::vec3 blend_vec3(const glm::vec3& from, const glm::vec3& to, float t) {
        return from + (to - from) * t;
    }

    inline std::complex<double> blend_complex(const std::complex<double>& from, const std::complex<double>& to, float t) {
        return from + (to - from) * static_cast<double>(t);
    }

    // Registers the glm vector, quaternion and complex kinds with the blends above.
    void register_math_kinds();
}

#endif
