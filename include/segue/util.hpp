#ifndef SEGUE_UTIL_HPP_INCLUDED
#define SEGUE_UTIL_HPP_INCLUDED

#include <string>
#include <typeinfo>
#include <boost/core/demangle.hpp>

namespace segue {
    template<typename T>
    std::string type_name() {
        return boost::core::demangle(typeid(T).name());
    }
}

#endif
