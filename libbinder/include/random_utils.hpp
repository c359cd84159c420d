#ifndef BINDER_RANDOM_UTILS_HPP
#define BINDER_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for unique scratch names.
 */
namespace RandomUtils {

    /// @return A random 64-bit value from a thread-local generator.
    unsigned long long next_u64();

    /// @return 16 lowercase hex digits, suitable as a file name suffix.
    std::string random_suffix();

} // namespace RandomUtils

#endif // BINDER_RANDOM_UTILS_HPP
