#ifndef SEGUE_PLAYABLE_HPP_INCLUDED
#define SEGUE_PLAYABLE_HPP_INCLUDED

#include <segue/error.hpp>

namespace segue {
    enum class direction : int {
        forward = 1,
        reverse = -1
    };

    constexpr direction operator-(direction dir) {
        return dir == direction::forward ? direction::reverse : direction::forward;
    }

    constexpr float sign(direction dir) {
        return static_cast<float>(static_cast<int>(dir));
    }

    enum class loop_type {
        none,      // end after playing once
        repeat,    // start over from the boundary, forever
        reflect,   // play through, play back, then end
        ping_pong  // play through and back, forever
    };

    // Anything that can be stepped through time in either direction.
    // After reset(d) or rewind(d), advancing in d produces output and advancing against d reports exhaustion.
    struct playable {
        virtual ~playable() = default;
        // Returns false when already exhausted in dir; the caller should stop driving it.
        virtual bool advance(direction dir, float dt) = 0;
        // Starts over, reading start and original values from their sources again.
        virtual void reset(direction dir) = 0;
        // Moves back to a boundary for another pass over the values captured at the last reset.
        virtual void rewind(direction dir) {
            reset(dir);
        }
    };

    // Stand-in for a tween that could not be built.
    struct inert : playable {
        errc fault;
        explicit inert(errc fault) : fault{fault} {
        }
        bool advance(direction, float) override {
            return false;
        }
        void reset(direction) override {
        }
    };
}

#endif
