#include <segue/easing.hpp>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace {
    constexpr float back_s = 1.70158f;
    constexpr float back_s2 = 2.5949095f;

    constexpr float pi = glm::pi<float>();
}

float segue::easing::linear::in(float k) {
    return k;
}

float segue::easing::linear::out(float k) {
    return k;
}

float segue::easing::linear::in_out(float k) {
    return k;
}

float segue::easing::quadratic::in(float k) {
    return k * k;
}

float segue::easing::quadratic::out(float k) {
    return k * (2.0f - k);
}

float segue::easing::quadratic::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return 0.5f * k * k;
    k -= 1.0f;
    return -0.5f * (k * (k - 2.0f) - 1.0f);
}

float segue::easing::quadratic::bezier(float k, float c) {
    return c * 2.0f * k * (1.0f - k) + k * k;
}

float segue::easing::cubic::in(float k) {
    return k * k * k;
}

float segue::easing::cubic::out(float k) {
    k -= 1.0f;
    return 1.0f + k * k * k;
}

float segue::easing::cubic::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return 0.5f * k * k * k;
    k -= 2.0f;
    return 0.5f * (k * k * k + 2.0f);
}

float segue::easing::quartic::in(float k) {
    return k * k * k * k;
}

float segue::easing::quartic::out(float k) {
    k -= 1.0f;
    return 1.0f - k * k * k * k;
}

float segue::easing::quartic::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return 0.5f * k * k * k * k;
    k -= 2.0f;
    return -0.5f * (k * k * k * k - 2.0f);
}

float segue::easing::quintic::in(float k) {
    return k * k * k * k * k;
}

float segue::easing::quintic::out(float k) {
    k -= 1.0f;
    return 1.0f + k * k * k * k * k;
}

float segue::easing::quintic::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return 0.5f * k * k * k * k * k;
    k -= 2.0f;
    return 0.5f * (k * k * k * k * k + 2.0f);
}

float segue::easing::sinusoidal::in(float k) {
    return 1.0f - std::cos(k * pi / 2.0f);
}

float segue::easing::sinusoidal::out(float k) {
    return std::sin(k * pi / 2.0f);
}

float segue::easing::sinusoidal::in_out(float k) {
    return 0.5f * (1.0f - std::cos(pi * k));
}

float segue::easing::exponential::in(float k) {
    return k == 0.0f ? 0.0f : std::pow(1024.0f, k - 1.0f);
}

float segue::easing::exponential::out(float k) {
    return k == 1.0f ? 1.0f : 1.0f - std::pow(2.0f, -10.0f * k);
}

float segue::easing::exponential::in_out(float k) {
    if (k == 0.0f) return 0.0f;
    if (k == 1.0f) return 1.0f;
    if ((k *= 2.0f) < 1.0f) return 0.5f * std::pow(1024.0f, k - 1.0f);
    return 0.5f * (-std::pow(2.0f, -10.0f * (k - 1.0f)) + 2.0f);
}

float segue::easing::circular::in(float k) {
    return 1.0f - std::sqrt(1.0f - k * k);
}

float segue::easing::circular::out(float k) {
    k -= 1.0f;
    return std::sqrt(1.0f - k * k);
}

float segue::easing::circular::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return -0.5f * (std::sqrt(1.0f - k * k) - 1.0f);
    k -= 2.0f;
    return 0.5f * (std::sqrt(1.0f - k * k) + 1.0f);
}

float segue::easing::elastic::in(float k) {
    if (k == 0.0f) return 0.0f;
    if (k == 1.0f) return 1.0f;
    k -= 1.0f;
    return -std::pow(2.0f, 10.0f * k) * std::sin((k - 0.1f) * (2.0f * pi) / 0.4f);
}

float segue::easing::elastic::out(float k) {
    if (k == 0.0f) return 0.0f;
    if (k == 1.0f) return 1.0f;
    return std::pow(2.0f, -10.0f * k) * std::sin((k - 0.1f) * (2.0f * pi) / 0.4f) + 1.0f;
}

float segue::easing::elastic::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) {
        k -= 1.0f;
        return -0.5f * std::pow(2.0f, 10.0f * k) * std::sin((k - 0.1f) * (2.0f * pi) / 0.4f);
    }
    k -= 1.0f;
    return std::pow(2.0f, -10.0f * k) * std::sin((k - 0.1f) * (2.0f * pi) / 0.4f) * 0.5f + 1.0f;
}

float segue::easing::back::in(float k) {
    return k * k * ((back_s + 1.0f) * k - back_s);
}

float segue::easing::back::out(float k) {
    k -= 1.0f;
    return k * k * ((back_s + 1.0f) * k + back_s) + 1.0f;
}

float segue::easing::back::in_out(float k) {
    if ((k *= 2.0f) < 1.0f) return 0.5f * (k * k * ((back_s2 + 1.0f) * k - back_s2));
    k -= 2.0f;
    return 0.5f * (k * k * ((back_s2 + 1.0f) * k + back_s2) + 2.0f);
}

float segue::easing::bounce::in(float k) {
    return 1.0f - out(1.0f - k);
}

float segue::easing::bounce::out(float k) {
    if (k < 1.0f / 2.75f) {
        return 7.5625f * k * k;
    } else if (k < 2.0f / 2.75f) {
        k -= 1.5f / 2.75f;
        return 7.5625f * k * k + 0.75f;
    } else if (k < 2.5f / 2.75f) {
        k -= 2.25f / 2.75f;
        return 7.5625f * k * k + 0.9375f;
    } else {
        k -= 2.625f / 2.75f;
        return 7.5625f * k * k + 0.984375f;
    }
}

float segue::easing::bounce::in_out(float k) {
    if (k < 0.5f) return in(k * 2.0f) * 0.5f;
    return out(k * 2.0f - 1.0f) * 0.5f + 0.5f;
}
