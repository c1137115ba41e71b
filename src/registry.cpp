#include <segue/registry.hpp>
#include <algorithm>

namespace {
    std::unordered_map<std::type_index, segue::unique_any> make_default_table() {
        std::unordered_map<std::type_index, segue::unique_any> table;
        table.emplace (
            std::type_index{typeid(float)},
            segue::unique_any {
                std::in_place_type_t<segue::blend_function<float>>{},
                [](const float& a, const float& b, float t) {
                    return a + (b - a) * std::clamp(t, 0.0f, 1.0f);
                }
            }
        );
        table.emplace (
            std::type_index{typeid(double)},
            segue::unique_any {
                std::in_place_type_t<segue::blend_function<double>>{},
                [](const double& a, const double& b, float t) {
                    return a + (b - a) * static_cast<double>(t);
                }
            }
        );
        return table;
    }
}

std::unordered_map<std::type_index, segue::unique_any>& segue::detail::blend_table() {
    static std::unordered_map<std::type_index, unique_any> table = make_default_table();
    return table;
}
