#ifndef CBZSAN_RANDOM_UTILS_HPP
#define CBZSAN_RANDOM_UTILS_HPP

#include <cstddef>
#include <string>

/**
 * @brief Thread-local random helpers used to build unique temporary names.
 */
namespace RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /**
     * @brief Generates a random lowercase alphanumeric suffix.
     * @param length Number of characters (default 10).
     */
    std::string random_suffix(std::size_t length = 10);

} // namespace RandomUtils

#endif // CBZSAN_RANDOM_UTILS_HPP
