#include <segue/handle.hpp>
#include <segue/chain.hpp>
#include <segue/scheduler.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

segue::handle::handle(scheduler& owner, std::unique_ptr<playable> tree, loop_type loop) :
    owner { owner },
    root { std::make_unique<looped>(std::move(tree), loop) } {
}

bool segue::handle::advance(direction dir, float dt) {
    if (!root) {
        return false;
    }
    try {
        return root->advance(dir, dt);
    } catch (const std::exception& e) {
        spdlog::error("Tween aborted by its setter or getter: {}", e.what());
        return false;
    }
}

void segue::handle::reset(direction dir) {
    if (root) {
        root->reset(dir);
    }
}

void segue::handle::stop() {
    owner.remove(*this);
}

void segue::handle::restart() {
    if (!root) {
        spdlog::warn("Cannot restart a tween that was chained into another");
        return;
    }
    auto self = shared_from_this();
    owner.remove(*this);
    root->reset(direction::forward);
    owner.add(std::move(self));
}

bool segue::handle::scheduled() const {
    return owner.contains(*this);
}

void segue::handle::set_loop(loop_type loop) {
    if (root) {
        root->loop = loop;
    }
}

segue::loop_type segue::handle::loop() const {
    return root ? root->loop : loop_type::none;
}

bool segue::handle::can_chain(const std::shared_ptr<handle>& next) const {
    if (!next) {
        spdlog::warn("Cannot chain a null tween");
        return false;
    }
    if (next.get() == this) {
        spdlog::warn("Cannot chain a tween to itself");
        return false;
    }
    if (!root || !next->root) {
        spdlog::warn("Cannot chain a tween that was already chained into another");
        return false;
    }
    if (&next->owner != &owner) {
        spdlog::warn("Cannot chain tweens driven by different schedulers");
        return false;
    }
    return true;
}

std::shared_ptr<segue::handle> segue::handle::then(const std::shared_ptr<handle>& next) {
    if (!can_chain(next)) {
        return shared_from_this();
    }
    // the scheduler may hold the last reference to either side
    auto self = shared_from_this();
    auto composite = std::make_shared<handle>(owner, std::make_unique<chain>(std::move(root), std::move(next->root)));
    owner.remove(*this);
    owner.remove(*next);
    owner.add(composite);
    return composite;
}

segue::handle& segue::handle::append(const std::shared_ptr<handle>& next) {
    if (!can_chain(next)) {
        return *this;
    }
    auto self = shared_from_this();
    root = std::make_unique<looped>(std::make_unique<chain>(std::move(root), std::move(next->root)));
    owner.remove(*next);
    owner.add(std::move(self));
    return *this;
}
