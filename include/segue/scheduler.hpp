#ifndef SEGUE_SCHEDULER_HPP_INCLUDED
#define SEGUE_SCHEDULER_HPP_INCLUDED

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include <segue/error.hpp>
#include <segue/handle.hpp>
#include <segue/playable.hpp>
#include <segue/property.hpp>
#include <segue/raw_tween.hpp>

namespace segue {
    struct scheduler_settings {
        // multiplies every delta passed to tick()
        float time_scale = 1.0f;
        // upper bound on one scaled delta, 0 for none
        float max_delta = 0.0f;
    };

    // The active set of handles. The host calls tick() once per frame with the elapsed seconds.
    class scheduler {
        std::vector<std::shared_ptr<handle>> active;
    public:
        scheduler_settings settings;

        explicit scheduler(scheduler_settings settings = {});

        // Advances every scheduled handle forward; handles that cannot advance are dropped.
        void tick(float dt);

        void add(std::shared_ptr<handle> h);
        void remove(const handle& h);
        bool contains(const handle& h) const;
        std::size_t size() const;
        void clear();

        // Wraps tree in a new handle and schedules it.
        std::shared_ptr<handle> make(std::unique_ptr<playable> tree, loop_type loop = loop_type::none);

        template<typename T>
        std::shared_ptr<handle> tween(std::type_identity_t<setter<T>> set, float duration, T to,
                                      std::type_identity_t<options<T>> opts = {}) {
            const loop_type loop = opts.loop;
            return make(std::make_unique<raw_tween<T>>(std::move(set), duration, std::move(to), std::move(opts)), loop);
        }

        // Animates a named member of object. Without opts.from the tween starts from the member's current value.
        // A binding that fails yields a handle that is never scheduled and never finishes.
        template<typename T, typename Object>
        std::shared_ptr<handle> tween(const property_table<Object>& table, Object* object, const std::string& name,
                                      float duration, T to, std::type_identity_t<options<T>> opts = {}) {
            bound_property<T> property;
            try {
                property = table.template bind<T>(object, name);
            } catch (const error& e) {
                spdlog::warn("Cannot tween {}: {} Will not tween.", name, e.what());
                return std::make_shared<handle>(*this, std::make_unique<inert>(e.code()));
            }
            if (std::holds_alternative<std::monostate>(opts.from)) {
                opts.from = property.get;
            }
            if (!opts.original) {
                opts.original = property.get;
            }
            return tween<T>(std::move(property.set), duration, std::move(to), std::move(opts));
        }

        std::shared_ptr<handle> wait(float seconds);
    };
}

#endif
