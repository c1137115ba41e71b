#ifndef SEGUE_CHAIN_HPP_INCLUDED
#define SEGUE_CHAIN_HPP_INCLUDED

#include <memory>
#include <segue/playable.hpp>

namespace segue {
    // Plays first then second forward, second then first in reverse.
    class chain : public playable {
        std::unique_ptr<playable> first;
        std::unique_ptr<playable> second;
        playable* current;
    public:
        chain(std::unique_ptr<playable> first, std::unique_ptr<playable> second);

        bool advance(direction dir, float dt) override;
        void reset(direction dir) override;
        void rewind(direction dir) override;

        bool in_second() const {
            return current == second.get();
        }
    };
}

#endif
