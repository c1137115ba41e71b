#include <segue/wait.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

segue::wait::wait(float seconds) : duration{seconds} {
    if (!(seconds >= 0.0f)) {
        spdlog::warn("Wait of {} seconds treated as no wait", seconds);
        duration = 0.0f;
    }
}

bool segue::wait::advance(direction dir, float dt) {
    if (pending_reset) {
        if (*pending_reset != dir) {
            return false;
        }
        elapsed = dir == direction::forward ? 0.0f : duration;
        pending_reset.reset();
    }
    if ((dir == direction::forward && elapsed >= duration) ||
        (dir == direction::reverse && elapsed <= 0.0f)) {
        return false;
    }
    elapsed = std::clamp(elapsed + sign(dir) * dt, 0.0f, duration);
    return true;
}

void segue::wait::reset(direction dir) {
    pending_reset = dir;
}
