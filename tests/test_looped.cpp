/*
 * Segue Loop Policy Tests
 *
 * Tests for repeat, reflect and ping-pong over a raw tween.
 */

#include <catch2/catch.hpp>
#include <segue/looped.hpp>
#include <segue/raw_tween.hpp>
#include <segue/easing.hpp>
#include <memory>
#include <vector>

namespace {
    using segue::direction;
    using segue::loop_type;

    struct fixture {
        std::vector<float> values;
        segue::looped loop;

        explicit fixture(loop_type type) :
            loop {
                std::make_unique<segue::raw_tween<float>> (
                    [this](const float& v) { values.push_back(v); }, 1.0f, 8.0f,
                    segue::options<float>{.from = 0.0f, .easing = segue::easing::linear::in}
                ),
                type
            } {
        }

        int run(direction dir, int calls) {
            int moved = 0;
            for (int i = 0; i < calls; i++) {
                if (loop.advance(dir, 0.25f)) {
                    moved++;
                }
            }
            return moved;
        }
    };

    // Tweens the current value down to 0, reading where it starts from a getter.
    struct live_fixture {
        float value = 8.0f;
        int reads = 0;
        std::vector<float> values;
        segue::looped loop;

        explicit live_fixture(loop_type type) :
            loop {
                std::make_unique<segue::raw_tween<float>> (
                    [this](const float& v) { value = v; values.push_back(v); }, 1.0f, 0.0f,
                    segue::options<float> {
                        .from = segue::getter<float>{[this]() { reads++; return value; }},
                        .easing = segue::easing::linear::in
                    }
                ),
                type
            } {
        }

        int run(direction dir, int calls) {
            int moved = 0;
            for (int i = 0; i < calls; i++) {
                if (loop.advance(dir, 0.25f)) {
                    moved++;
                }
            }
            return moved;
        }
    };
}

/* ============================================================================
 * None and Repeat
 * ============================================================================ */

TEST_CASE("Without a loop the tween ends after one pass", "[looped][none]") {
    fixture f{loop_type::none};
    REQUIRE(f.run(direction::forward, 4) == 4);
    REQUIRE_FALSE(f.loop.advance(direction::forward, 0.25f));
    REQUIRE(f.values == std::vector<float>{2.0f, 4.0f, 6.0f, 8.0f});
}

TEST_CASE("Repeat replays every pass identically", "[looped][repeat]") {
    fixture f{loop_type::repeat};
    REQUIRE(f.run(direction::forward, 20) == 20);
    REQUIRE(f.values.size() == 20);
    const std::vector<float> first(f.values.begin(), f.values.begin() + 4);
    REQUIRE(first == std::vector<float>{2.0f, 4.0f, 6.0f, 8.0f});
    for (int pass = 1; pass < 5; pass++) {
        const std::vector<float> later(f.values.begin() + pass * 4, f.values.begin() + pass * 4 + 4);
        REQUIRE(later == first);
    }
}

TEST_CASE("Repeat in reverse replays from the end", "[looped][repeat]") {
    fixture f{loop_type::repeat};
    f.loop.reset(direction::reverse);
    REQUIRE(f.run(direction::reverse, 5) == 5);
    // each pass ends on the blended start followed by the restored original
    REQUIRE(f.values == std::vector<float>{6.0f, 4.0f, 2.0f, 0.0f, 0.0f, 6.0f});
}

/* ============================================================================
 * Ping-Pong
 * ============================================================================ */

TEST_CASE("Ping-pong alternates forever", "[looped][ping_pong]") {
    fixture f{loop_type::ping_pong};

    SECTION("Two durations return to the original") {
        REQUIRE(f.run(direction::forward, 8) == 8);
        REQUIRE(f.values.back() == 0.0f);
        REQUIRE(f.values[3] == 8.0f);
        REQUIRE(f.values[4] == 6.0f);
    }

    SECTION("Direction flips at every boundary") {
        REQUIRE(f.run(direction::forward, 80) == 80);
        REQUIRE(f.values.size() == 90);
        // ten round trips; the top of each trip is the target
        for (int trip = 0; trip < 10; trip++) {
            const std::size_t base = trip * 9;
            REQUIRE(f.values[base + 3] == 8.0f);
            REQUIRE(f.values[base + 4] == 6.0f);
        }
    }

    SECTION("Playing back is tracked") {
        f.run(direction::forward, 5);
        REQUIRE(f.loop.playing_back());
    }
}

/* ============================================================================
 * Reflect
 * ============================================================================ */

TEST_CASE("Reflect plays through once and back once", "[looped][reflect]") {
    fixture f{loop_type::reflect};

    SECTION("Started forward") {
        REQUIRE(f.run(direction::forward, 8) == 8);
        REQUIRE_FALSE(f.loop.advance(direction::forward, 0.25f));
        REQUIRE_FALSE(f.loop.advance(direction::forward, 0.25f));
        REQUIRE(f.values == std::vector<float>{2.0f, 4.0f, 6.0f, 8.0f, 6.0f, 4.0f, 2.0f, 0.0f, 0.0f});
    }

    SECTION("Started in reverse") {
        f.loop.reset(direction::reverse);
        REQUIRE(f.run(direction::reverse, 8) == 8);
        REQUIRE_FALSE(f.loop.advance(direction::reverse, 0.25f));
        REQUIRE(f.values == std::vector<float>{2.0f, 4.0f, 6.0f, 8.0f, 6.0f, 4.0f, 2.0f, 0.0f, 0.0f});
    }

    SECTION("Can be replayed after a reset") {
        f.run(direction::forward, 9);
        f.values.clear();
        f.loop.reset(direction::forward);
        REQUIRE(f.run(direction::forward, 9) == 8);
        REQUIRE(f.values.size() == 9);
    }
}

/* ============================================================================
 * Starting From the Current Value
 * ============================================================================ */

TEST_CASE("Loops keep the values read when the tween started", "[looped][getter]") {
    SECTION("Repeat") {
        live_fixture f{loop_type::repeat};
        REQUIRE(f.run(direction::forward, 12) == 12);
        REQUIRE(f.values == std::vector<float>{6.0f, 4.0f, 2.0f, 0.0f, 6.0f, 4.0f, 2.0f, 0.0f, 6.0f, 4.0f, 2.0f, 0.0f});
        REQUIRE(f.reads == 1);
    }

    SECTION("Ping-pong") {
        live_fixture f{loop_type::ping_pong};
        REQUIRE(f.run(direction::forward, 8) == 8);
        REQUIRE(f.value == 8.0f);
        REQUIRE(f.run(direction::forward, 8) == 8);
        REQUIRE(f.value == 8.0f);
        REQUIRE(f.values[9] == 6.0f);
        REQUIRE(f.values[12] == 0.0f);
        REQUIRE(f.reads == 1);
    }

    SECTION("Reflect started forward") {
        live_fixture f{loop_type::reflect};
        REQUIRE(f.run(direction::forward, 8) == 8);
        REQUIRE_FALSE(f.loop.advance(direction::forward, 0.25f));
        REQUIRE(f.values == std::vector<float>{6.0f, 4.0f, 2.0f, 0.0f, 2.0f, 4.0f, 6.0f, 8.0f, 8.0f});
        REQUIRE(f.value == 8.0f);
    }

    SECTION("Reflect started in reverse") {
        live_fixture f{loop_type::reflect};
        f.value = 4.0f;
        f.loop.reset(direction::reverse);
        REQUIRE(f.run(direction::reverse, 8) == 8);
        REQUIRE_FALSE(f.loop.advance(direction::reverse, 0.25f));
        REQUIRE(f.values == std::vector<float>{3.0f, 2.0f, 1.0f, 0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 4.0f});
        REQUIRE(f.value == 4.0f);
    }

    SECTION("A reset reads the current value again") {
        live_fixture f{loop_type::reflect};
        f.run(direction::forward, 9);
        f.value = 4.0f;
        f.values.clear();
        f.loop.reset(direction::forward);
        REQUIRE(f.run(direction::forward, 4) == 4);
        REQUIRE(f.values == std::vector<float>{3.0f, 2.0f, 1.0f, 0.0f});
        REQUIRE(f.reads == 2);
    }
}

/* ============================================================================
 * Exhausted Inner Units
 * ============================================================================ */

TEST_CASE("Loops around a dead unit do not spin", "[looped][error]") {
    for (auto type : {loop_type::repeat, loop_type::reflect, loop_type::ping_pong}) {
        segue::looped loop{std::make_unique<segue::inert>(segue::errc::invalid_argument), type};
        REQUIRE_FALSE(loop.advance(direction::forward, 0.25f));
    }
}
