#include <segue/maths.hpp>
#include <segue/registry.hpp>
#include <glm/common.hpp>

void segue::register_math_kinds() {
    set_blend<glm::vec2>([](const glm::vec2& a, const glm::vec2& b, float t) { return glm::mix(a, b, t); });
    set_blend<glm::vec3>(blend_vec3);
    set_blend<glm::vec4>([](const glm::vec4& a, const glm::vec4& b, float t) { return glm::mix(a, b, t); });
    set_blend<glm::quat>(blend_rotation);
    set_blend<std::complex<double>>(blend_complex);
}
