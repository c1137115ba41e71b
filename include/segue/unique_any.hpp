#ifndef SEGUE_UNIQUE_ANY_HPP_INCLUDED
#define SEGUE_UNIQUE_ANY_HPP_INCLUDED

#include <memory>
#include <typeindex>
#include <utility>
#include <fmt/format.h>
#include <segue/error.hpp>
#include <segue/util.hpp>

namespace segue {
    // Owns one value of a type fixed at construction; access must name that type again.
    class unique_any {
        std::type_index contained_type;
        std::unique_ptr<void, void(*)(void*)> store;

        template<typename T>
        static void destroy(void* object) {
            std::default_delete<T>{}(static_cast<T*>(object));
        }
    public:
        template<typename T, typename... Args>
        unique_any(std::in_place_type_t<T>, Args&&... args) :
            contained_type { typeid(T) },
            store { new T(std::forward<Args>(args)...), &destroy<T> } {
        }

        std::type_index type() const {
            return contained_type;
        }

        template<typename T>
        bool holds() const {
            return contained_type == std::type_index{typeid(T)};
        }

        template<typename T>
        T& get() {
            if (holds<T>()) {
                return *static_cast<T*>(store.get());
            } else {
                throw error{errc::unsupported_value_kind, fmt::format("Bad cast to {}!", type_name<T>())};
            }
        }

        template<typename T>
        const T& get() const {
            if (holds<T>()) {
                return *static_cast<const T*>(store.get());
            } else {
                throw error{errc::unsupported_value_kind, fmt::format("Bad cast to {}!", type_name<T>())};
            }
        }
    };
}

#endif
