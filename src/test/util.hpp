#pragma once

#include "error.hpp"
#include <functional>

namespace slipconv::test {

// Predicate for BOOST_CHECK_EXCEPTION matching one error kind
inline std::function<bool(const ConvertError&)> is_error(ConvertError::ErrorType type) {
    return [type](const ConvertError& e) { return e.type() == type; };
}

} // namespace slipconv::test
