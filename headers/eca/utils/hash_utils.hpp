//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_HASH_UTILS_HPP
#define ERRORCLUSTERANALYZER_HASH_UTILS_HPP

/**
 * @file hash_utils.hpp
 * @brief Non-cryptographic hashing for display identifiers.
 *
 * The hashes here are stable across runs and platforms. They are not
 * collision-free and are never used as identity keys.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace eca::hash_utils {

    /**
     * Computes the 64-bit FNV-1a hash of the input data.
     */
    std::uint64_t fnv1a_hash(std::string_view data) noexcept;

    /**
     * Computes a 32-bit hash by folding the 64-bit FNV-1a hash.
     */
    std::uint32_t compute_hash32(std::string_view data) noexcept;

    /**
     * Renders a 32-bit value as exactly eight upper-case hex digits.
     */
    std::string to_hex32(std::uint32_t value);

}  // namespace eca::hash_utils

#endif //ERRORCLUSTERANALYZER_HASH_UTILS_HPP
