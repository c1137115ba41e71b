#ifndef SEGUE_REGISTRY_HPP_INCLUDED
#define SEGUE_REGISTRY_HPP_INCLUDED

#include <concepts>
#include <functional>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <segue/error.hpp>
#include <segue/unique_any.hpp>
#include <segue/util.hpp>

namespace segue {
    // Combines two values of a kind; the fraction may lie outside [0, 1] for overshooting curves.
    template<typename T>
    using blend_function = std::function<T(const T&, const T&, float)>;

    namespace detail {
        // Process-wide, holds a blend_function<T> per kind. Not synchronised.
        std::unordered_map<std::type_index, unique_any>& blend_table();

        template<typename T>
        blend_function<T> derive_blend() {
            if constexpr (requires (const T& a, const T& b, float t) { { T::lerp(a, b, t) } -> std::convertible_to<T>; }) {
                return [](const T& a, const T& b, float t) -> T { return T::lerp(a, b, t); };
            } else if constexpr (requires (const T& a, const T& b, float t) { { mix(a, b, t) } -> std::convertible_to<T>; }) {
                return [](const T& a, const T& b, float t) -> T { return mix(a, b, t); };
            } else {
                return {};
            }
        }
    }

    // Installs or replaces the blend function for T. The last registration wins.
    template<typename T>
    void set_blend(blend_function<T> blend) {
        if (!blend) {
            spdlog::error("Blend function for {} is null", type_name<T>());
            return;
        }
        auto& table = detail::blend_table();
        auto [it, inserted] = table.insert_or_assign (
            std::type_index{typeid(T)},
            unique_any{std::in_place_type_t<blend_function<T>>{}, std::move(blend)}
        );
        if (!inserted) {
            spdlog::debug("Replaced blend function for {}", type_name<T>());
        }
    }

    template<typename T>
    bool has_blend() {
        return detail::blend_table().contains(std::type_index{typeid(T)});
    }

    // Looks up T's blend function, deriving and caching one from T::lerp or an ADL mix() if none was set.
    // Throws error{errc::unsupported_value_kind} when neither exists.
    template<typename T>
    blend_function<T> resolve_blend() {
        auto& table = detail::blend_table();
        if (auto found = table.find(std::type_index{typeid(T)}); found != table.end()) {
            return found->second.template get<blend_function<T>>();
        }
        if (auto derived = detail::derive_blend<T>()) {
            spdlog::debug("Derived blend function for {}", type_name<T>());
            table.insert_or_assign (
                std::type_index{typeid(T)},
                unique_any{std::in_place_type_t<blend_function<T>>{}, derived}
            );
            return derived;
        }
        throw error {
            errc::unsupported_value_kind,
            fmt::format("Type {} has no blend function. Register one with set_blend().", type_name<T>())
        };
    }
}

#endif
