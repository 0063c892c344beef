/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file id_generator.cpp
 * @brief Implementation of the UUID generation utility.
 *
 * @details
 * Follows RFC 4122 for Version 4 (Random) UUIDs: two 64-bit random draws,
 * with the version nibble forced to `0100` and the variant bits to `10`.
 */

#include "uuidmesh/infra/id_generator.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace uuidmesh::infra {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Offsets of the hyphens in the canonical 36-character form.
bool is_hyphen_position(size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

/// @brief Engine seeded with 256 bits from `std::random_device`.
std::mt19937_64 seeded_engine()
{
    std::random_device rd;
    std::array<std::random_device::result_type, 8> words;
    for (auto& word : words) {
        word = rd();
    }
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
}

} // namespace

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Each worker thread owns its own Mersenne Twister seeded from
 * `std::random_device`, so concurrent requests never contend on a lock.
 */
std::string IdGenerator::generate()
{
    static thread_local std::mt19937_64 gen = seeded_engine();
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    // Version 4 in the high nibble of time_hi_and_version.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Variant 10xx in the high bits of clock_seq_hi_and_reserved.
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out(36, '-');
    size_t pos = 0;
    for (int nibble = 0; nibble < 32; ++nibble) {
        if (is_hyphen_position(pos)) {
            ++pos;
        }
        uint64_t word = nibble < 16 ? hi : lo;
        int shift = 60 - 4 * (nibble % 16);
        out[pos++] = kHexDigits[(word >> shift) & 0xF];
    }
    return out;
}

bool IdGenerator::is_v4(const std::string& text)
{
    if (text.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_hyphen_position(i)) {
            if (c != '-')
                return false;
            continue;
        }
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex)
            return false;
    }
    if (text[14] != '4') {
        return false;
    }
    char variant = text[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace uuidmesh::infra
