#ifndef SEGUE_RAW_TWEEN_HPP_INCLUDED
#define SEGUE_RAW_TWEEN_HPP_INCLUDED

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>
#include <segue/easing.hpp>
#include <segue/error.hpp>
#include <segue/playable.hpp>
#include <segue/registry.hpp>
#include <segue/util.hpp>

namespace segue {
    template<typename T>
    using setter = std::function<void(const T&)>;

    template<typename T>
    using getter = std::function<T()>;

    // Where a tween starts: a fixed value, or a getter evaluated every time the tween (re)starts.
    template<typename T>
    using source = std::variant<std::monostate, T, getter<T>>;

    template<typename T>
    struct options {
        source<T> from;
        easing_function easing;
        loop_type loop = loop_type::none;
        // Value restored when playing back past the start. Defaults to the start value.
        getter<T> original;
    };

    // A single interpolation from a start value to `to`, integrated over time in either direction.
    template<typename T>
    class raw_tween : public playable {
        enum class state {
            left_end,
            running,
            right_end,
            resetting
        };

        setter<T> set;
        float duration;
        T to;
        source<T> from;
        getter<T> original_source;
        easing_function ease;
        blend_function<T> blend;
        std::optional<errc> failure;

        state current = state::resetting;
        direction reset_direction = direction::forward;
        // start and original hold values read since the last reset
        bool captured = false;
        float elapsed = 0.0f;
        std::optional<T> start;
        std::optional<T> original;

        void fail(errc code, const std::string& reason) {
            spdlog::warn("Cannot tween {}: {} Will not tween.", type_name<T>(), reason);
            failure = code;
        }

        // Where a pending reset will land; exhaustion is judged against it.
        state boundary() const {
            if (current != state::resetting) {
                return current;
            }
            return reset_direction == direction::forward ? state::left_end : state::right_end;
        }

        void begin() {
            if (!captured) {
                if (const T* value = std::get_if<T>(&from)) {
                    start = *value;
                } else {
                    start = std::get<getter<T>>(from)();
                }
                original = original_source ? original_source() : *start;
                captured = true;
            }
            if (reset_direction == direction::forward) {
                current = state::left_end;
                elapsed = 0.0f;
            } else {
                current = state::right_end;
                elapsed = duration;
            }
        }

    public:
        raw_tween(setter<T> set, float duration, T to, options<T> opts) :
            set { std::move(set) },
            duration { duration },
            to { std::move(to) },
            from { std::move(opts.from) },
            original_source { std::move(opts.original) },
            ease { std::move(opts.easing) }
        {
            if (!this->set) {
                fail(errc::invalid_argument, "setter is null.");
                return;
            }
            if (std::holds_alternative<std::monostate>(from)) {
                fail(errc::invalid_argument, fmt::format("from must be either a value of type {} or a getter.", type_name<T>()));
                return;
            }
            if (const auto* get = std::get_if<getter<T>>(&from); get && !*get) {
                fail(errc::invalid_argument, "from getter is null.");
                return;
            }
            if (!(duration > 0.0f)) {
                fail(errc::invalid_argument, fmt::format("duration {} is not positive.", duration));
                return;
            }
            try {
                blend = resolve_blend<T>();
            } catch (const error& e) {
                fail(e.code(), e.what());
                return;
            }
            if (!ease) {
                ease = easing::sinusoidal::in_out;
            }
        }

        // Set when construction failed; the tween then never advances.
        std::optional<errc> fault() const {
            return failure;
        }

        float time() const {
            return elapsed;
        }

        bool at_start() const {
            return current == state::left_end;
        }

        bool at_end() const {
            return current == state::right_end;
        }

        bool advance(direction dir, float dt) override {
            if (failure) {
                return false;
            }
            const state edge = boundary();
            if ((edge == state::right_end && dir == direction::forward) ||
                (edge == state::left_end && dir == direction::reverse)) {
                return false;
            }
            if (current == state::resetting) {
                begin();
            }
            elapsed = std::clamp(elapsed + sign(dir) * dt, 0.0f, duration);
            const float t = elapsed / duration;
            if (current == state::running ||
                (current == state::left_end && t > 0.0f) ||
                (current == state::right_end && t < 1.0f)) {
                set(blend(*start, to, ease(t)));
                current = state::running;
            }
            if (t >= 1.0f) {
                current = state::right_end;
            } else if (t <= 0.0f) {
                current = state::left_end;
                // exact pre-tween value, whatever drift accumulated in elapsed
                set(*original);
            }
            return true;
        }

        // Takes effect on the next advance, so a freshly reset tween has not touched its target yet.
        void reset(direction dir) override {
            rewind(dir);
            captured = false;
        }

        // Loops and chains rewind between passes; the sources are not read again.
        void rewind(direction dir) override {
            reset_direction = dir;
            current = state::resetting;
        }
    };
}

#endif
