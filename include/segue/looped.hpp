#ifndef SEGUE_LOOPED_HPP_INCLUDED
#define SEGUE_LOOPED_HPP_INCLUDED

#include <memory>
#include <segue/playable.hpp>

namespace segue {
    // Rewrites the inner unit's exhaustion according to a loop policy.
    class looped : public playable {
        std::unique_ptr<playable> inner;
        // inner is currently driven against the requested direction (second half of reflect/ping-pong)
        bool reversed = false;
    public:
        loop_type loop;

        explicit looped(std::unique_ptr<playable> inner, loop_type loop = loop_type::none);

        bool advance(direction dir, float dt) override;
        void reset(direction dir) override;
        void rewind(direction dir) override;

        bool playing_back() const {
            return reversed;
        }
    };
}

#endif
