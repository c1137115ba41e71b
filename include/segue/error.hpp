#ifndef SEGUE_ERROR_HPP_INCLUDED
#define SEGUE_ERROR_HPP_INCLUDED

#include <stdexcept>
#include <string>

namespace segue {
    enum class errc {
        invalid_argument,
        unsupported_value_kind,
        no_such_property
    };

    const char* to_string(errc code);

    class error : public std::runtime_error {
        errc ec;
    public:
        error(errc code, const std::string& what);
        errc code() const {
            return ec;
        }
    };
}

#endif
