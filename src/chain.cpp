#include <segue/chain.hpp>
#include <utility>

segue::chain::chain(std::unique_ptr<playable> first, std::unique_ptr<playable> second) :
    first { std::move(first) },
    second { std::move(second) },
    current { this->first.get() } {
}

bool segue::chain::advance(direction dir, float dt) {
    if (current->advance(dir, dt)) {
        return true;
    }
    if ((dir == direction::reverse && current == first.get()) ||
        (dir == direction::forward && current == second.get())) {
        return false;
    }
    // cross over within the same tick
    current = current == first.get() ? second.get() : first.get();
    return current->advance(dir, dt);
}

void segue::chain::reset(direction dir) {
    first->reset(dir);
    second->reset(dir);
    current = dir == direction::forward ? first.get() : second.get();
}

void segue::chain::rewind(direction dir) {
    first->rewind(dir);
    second->rewind(dir);
    current = dir == direction::forward ? first.get() : second.get();
}
