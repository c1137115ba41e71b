#include <segue/error.hpp>

const char* segue::to_string(errc code) {
    switch (code) {
        case errc::invalid_argument: return "invalid argument";
        case errc::unsupported_value_kind: return "unsupported value kind";
        case errc::no_such_property: return "no such property";
    }
    return "unknown error";
}

segue::error::error(errc code, const std::string& what) : std::runtime_error{what}, ec{code} {
}
