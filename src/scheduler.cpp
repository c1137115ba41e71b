#include <segue/scheduler.hpp>
#include <segue/wait.hpp>
#include <algorithm>

segue::scheduler::scheduler(scheduler_settings settings) : settings{settings} {
}

void segue::scheduler::tick(float dt) {
    float scaled = dt * settings.time_scale;
    if (!(scaled >= 0.0f)) {
        spdlog::warn("Ignoring tick of {} seconds", scaled);
        return;
    }
    if (settings.max_delta > 0.0f) {
        scaled = std::min(scaled, settings.max_delta);
    }
    // handles may stop, restart or chain each other from inside a setter or on_finished
    const auto ticking = active;
    for (const auto& h : ticking) {
        if (!contains(*h)) {
            continue;
        }
        if (!h->advance(direction::forward, scaled)) {
            remove(*h);
            spdlog::debug("Tween finished, {} active", active.size());
            h->on_finished();
        }
    }
}

void segue::scheduler::add(std::shared_ptr<handle> h) {
    if (!h || contains(*h)) {
        return;
    }
    active.push_back(std::move(h));
    spdlog::debug("Tween scheduled, {} active", active.size());
}

void segue::scheduler::remove(const handle& h) {
    std::erase_if(active, [&](const std::shared_ptr<handle>& each) { return each.get() == &h; });
}

bool segue::scheduler::contains(const handle& h) const {
    return std::any_of(active.begin(), active.end(), [&](const std::shared_ptr<handle>& each) {
        return each.get() == &h;
    });
}

std::size_t segue::scheduler::size() const {
    return active.size();
}

void segue::scheduler::clear() {
    active.clear();
}

std::shared_ptr<segue::handle> segue::scheduler::make(std::unique_ptr<playable> tree, loop_type loop) {
    auto created = std::make_shared<handle>(*this, std::move(tree), loop);
    add(created);
    return created;
}

std::shared_ptr<segue::handle> segue::scheduler::wait(float seconds) {
    return make(std::make_unique<segue::wait>(seconds));
}
