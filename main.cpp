#include <segue/scheduler.hpp>
#include <segue/maths.hpp>
#include <segue/easing.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <complex>

struct rig {
    glm::vec3 focus { 0.0f, 0.0f, 0.0f };
    float zoom_factor = 12.0f;
    glm::quat orientation { 1.0f, 0.0f, 0.0f, 0.0f };
    std::complex<double> radius { 0.6, 0.0 };
    float fade = 1.0f;
};

static const segue::property_table<rig>& rig_properties() {
    static const auto table = [] {
        segue::property_table<rig> t;
        t.add("focus", &rig::focus)
         .add("zoom_factor", &rig::zoom_factor)
         .add("orientation", &rig::orientation)
         .add("radius", &rig::radius)
         .add("fade", &rig::fade);
        return t;
    }();
    return table;
}

int main(const int argc, const char** argv) {
    spdlog::cfg::load_env_levels();
    segue::register_math_kinds();

    rig cam;
    segue::scheduler tweens;
    const auto& props = rig_properties();

    // glide around, pause, then swing the camera and come back
    auto tour = tweens.tween(props, &cam, "focus", 1.0f, glm::vec3{0.0f, 1.0f, 0.0f});
    tour = tour->then(tweens.tween(props, &cam, "focus", 1.0f, glm::vec3{1.0f, 1.0f, 0.0f}));
    tour = tour->then(tweens.tween(props, &cam, "focus", 0.5f, glm::vec3{1.0f, 1.0f, 1.0f},
                                   {.easing = segue::easing::bounce::out}));
    tour = tour->then(tweens.wait(0.3f));
    tour->append(tweens.tween(props, &cam, "orientation", 1.0f,
                              glm::angleAxis(glm::half_pi<float>(), glm::vec3{0.0f, 0.0f, 1.0f})));
    tour->append(tweens.tween(props, &cam, "radius", 1.0f, std::polar(0.6, glm::half_pi<double>()),
                              {.easing = segue::easing::cubic::out}));
    tour->set_loop(segue::loop_type::reflect);
    tour->on_finished.connect([&]() {
        spdlog::info("Tour done, focus back at ({}, {}, {})", cam.focus.x, cam.focus.y, cam.focus.z);
    });

    // fade out and back in while zooming
    tweens.tween<float>([&](const float& a) { cam.fade = a; }, 1.0f, 0.0f,
                        {.from = 1.0f, .easing = segue::easing::quadratic::out, .loop = segue::loop_type::reflect});
    tweens.tween(props, &cam, "zoom_factor", 2.0f, 4.0f);

    // misspelt on purpose: reported once, never animates
    tweens.tween(props, &cam, "zoom", 1.0f, 1.0f);

    constexpr float frame = 1.0f / 60.0f;
    int frames = 0;
    while (tweens.size() > 0 && frames < 60 * 60) {
        tweens.tick(frame);
        if (++frames % 30 == 0) {
            spdlog::info("t={:.2f} focus=({:.2f}, {:.2f}, {:.2f}) zoom={:.2f} fade={:.2f} radius=({:.2f}, {:.2f})",
                         frames * frame, cam.focus.x, cam.focus.y, cam.focus.z, cam.zoom_factor, cam.fade,
                         cam.radius.real(), cam.radius.imag());
        }
    }
    spdlog::info("All tweens finished after {} frames", frames);
    return 0;
}
