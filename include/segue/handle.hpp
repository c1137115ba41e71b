#ifndef SEGUE_HANDLE_HPP_INCLUDED
#define SEGUE_HANDLE_HPP_INCLUDED

#include <memory>
#include <boost/signals2.hpp>
#include <segue/looped.hpp>
#include <segue/playable.hpp>

namespace segue {
    class scheduler;

    // Caller-side control of one animation tree. The tree belongs to the handle until it is chained,
    // after which the handle is empty and never advances again.
    class handle : public std::enable_shared_from_this<handle> {
        scheduler& owner;
        std::unique_ptr<looped> root;

        bool can_chain(const std::shared_ptr<handle>& next) const;
    public:
        // Fired when the scheduler drops the handle because it ran out, not on stop().
        boost::signals2::signal<void()> on_finished;

        handle(scheduler& owner, std::unique_ptr<playable> tree, loop_type loop = loop_type::none);
        handle(const handle&) = delete;
        handle& operator=(const handle&) = delete;

        bool advance(direction dir, float dt);
        void reset(direction dir);

        void stop();
        void restart();
        bool scheduled() const;
        bool absorbed() const {
            return !root;
        }

        void set_loop(loop_type loop);
        loop_type loop() const;

        // Both this and next are taken off the scheduler; only the returned composite is driven.
        std::shared_ptr<handle> then(const std::shared_ptr<handle>& next);
        // Like then(), but the composite stays under this handle.
        handle& append(const std::shared_ptr<handle>& next);
    };
}

#endif
