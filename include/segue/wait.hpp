#ifndef SEGUE_WAIT_HPP_INCLUDED
#define SEGUE_WAIT_HPP_INCLUDED

#include <optional>
#include <segue/playable.hpp>

namespace segue {
    // Lets time pass without producing a value, in either direction.
    class wait : public playable {
        float duration;
        float elapsed = 0.0f;
        std::optional<direction> pending_reset;
    public:
        explicit wait(float seconds);

        bool advance(direction dir, float dt) override;
        void reset(direction dir) override;

        float time() const {
            return elapsed;
        }
    };
}

#endif
