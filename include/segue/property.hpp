#ifndef SEGUE_PROPERTY_HPP_INCLUDED
#define SEGUE_PROPERTY_HPP_INCLUDED

#include <string>
#include <unordered_map>
#include <utility>
#include <fmt/format.h>
#include <segue/error.hpp>
#include <segue/raw_tween.hpp>
#include <segue/unique_any.hpp>
#include <segue/util.hpp>

namespace segue {
    template<typename T>
    struct bound_property {
        setter<T> set;
        getter<T> get;
    };

    // Named data members of Object, resolved to setter/getter pairs once per binding.
    template<typename Object>
    class property_table {
        std::unordered_map<std::string, unique_any> members;
    public:
        template<typename T>
        property_table& add(std::string name, T Object::* member) {
            members.insert_or_assign(std::move(name), unique_any{std::in_place_type_t<T Object::*>{}, member});
            return *this;
        }

        bool contains(const std::string& name) const {
            return members.contains(name);
        }

        template<typename T>
        bound_property<T> bind(Object* object, const std::string& name) const {
            if (!object) {
                throw error{errc::invalid_argument, fmt::format("target {} is null.", type_name<Object>())};
            }
            auto found = members.find(name);
            if (found == members.end()) {
                throw error {
                    errc::no_such_property,
                    fmt::format("{} does not contain a property named {}.", type_name<Object>(), name)
                };
            }
            if (!found->second.template holds<T Object::*>()) {
                throw error {
                    errc::unsupported_value_kind,
                    fmt::format("Property {} on {} is not of type {}.", name, type_name<Object>(), type_name<T>())
                };
            }
            T Object::* member = found->second.template get<T Object::*>();
            return bound_property<T> {
                .set = [object, member](const T& value) { object->*member = value; },
                .get = [object, member]() { return object->*member; }
            };
        }
    };
}

#endif
