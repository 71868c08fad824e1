//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/utils/hash_utils.hpp"

#include <array>

namespace eca::hash_utils {

std::uint64_t fnv1a_hash(const std::string_view data) noexcept {
    constexpr std::uint64_t FNV_offset_basis = 14695981039346656037ULL;

    std::uint64_t hash = FNV_offset_basis;
    for (const char c : data) {
        constexpr std::uint64_t FNV_prime = 1099511628211ULL;
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        hash *= FNV_prime;
    }
    return hash;
}

std::uint32_t compute_hash32(const std::string_view data) noexcept {
    const std::uint64_t hash64 = fnv1a_hash(data);
    return static_cast<std::uint32_t>(hash64 ^ (hash64 >> 32));
}

std::string to_hex32(std::uint32_t value) {
    static constexpr std::array<char, 16> digits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'
    };

    std::string hex(8, '0');
    for (auto it = hex.rbegin(); it != hex.rend(); ++it) {
        *it = digits[value & 0xFu];
        value >>= 4;
    }
    return hex;
}

}  // namespace eca::hash_utils
