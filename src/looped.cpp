#include <segue/looped.hpp>
#include <utility>

segue::looped::looped(std::unique_ptr<playable> inner, loop_type loop) : inner{std::move(inner)}, loop{loop} {
}

void segue::looped::reset(direction dir) {
    const bool flips = loop == loop_type::ping_pong || loop == loop_type::reflect;
    reversed = flips && dir == direction::reverse;
    inner->reset(flips ? direction::forward : dir);
}

void segue::looped::rewind(direction dir) {
    const bool flips = loop == loop_type::ping_pong || loop == loop_type::reflect;
    reversed = flips && dir == direction::reverse;
    inner->rewind(flips ? direction::forward : dir);
}

bool segue::looped::advance(direction dir, float dt) {
    direction actual = reversed ? -dir : dir;
    if (inner->advance(actual, dt)) {
        return true;
    }
    switch (loop) {
        case loop_type::repeat:
            inner->rewind(actual);
            return inner->advance(actual, dt);
        case loop_type::reflect:
            // only the boundary that ends the first half turns around
            if (reversed != (dir == direction::reverse)) {
                return false;
            }
            [[fallthrough]];
        case loop_type::ping_pong:
            reversed = !reversed;
            actual = -actual;
            inner->rewind(actual);
            return inner->advance(actual, dt);
        case loop_type::none:
            break;
    }
    return false;
}
