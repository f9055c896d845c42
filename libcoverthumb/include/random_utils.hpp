//
// Created by Giuseppe Francione on 07/10/25.
//

#ifndef COVERTHUMB_RANDOM_UTILS_HPP
#define COVERTHUMB_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for unique temporary file names.
 *
 * The underlying std::mt19937_64 is thread-local.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random suffix for temporary file names.
     * @return Sixteen lowercase hex digits.
     */
    std::string random_suffix();

} // namespace

#endif //COVERTHUMB_RANDOM_UTILS_HPP
