/**
 * @file TestSupport.hpp
 * @brief Helpers shared by the assert-based test executables.
 */

#pragma once

/// True when calling fn throws an exception of type Error.
template <typename Error, typename Fn>
static bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}
