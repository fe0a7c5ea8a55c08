#ifndef VETSCAN_RANDOM_UTILS_HPP
#define VETSCAN_RANDOM_UTILS_HPP

#include <cstddef>
#include <string>

/**
 * @brief Thread-local random helpers for temp names and document ids.
 */
namespace vetscan::RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /// @return A decimal random suffix for temp file and directory names.
    std::string random_suffix();

    /**
     * @brief Random lowercase hexadecimal identifier.
     * @param length Number of hex digits (default 12, the document id length).
     */
    std::string random_hex_id(std::size_t length = 12);

} // namespace vetscan::RandomUtils

#endif // VETSCAN_RANDOM_UTILS_HPP
