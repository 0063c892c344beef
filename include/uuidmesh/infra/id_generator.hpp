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
 * @file id_generator.hpp
 * @brief Version 4 (random) UUID generation and format validation.
 *
 * @details
 * This file declares the `IdGenerator` class, the entropy source behind every
 * value returned by the UUID service. Each call draws 122 fresh random bits;
 * no state is shared between calls on different threads.
 */

#pragma once

#include <string>

namespace uuidmesh::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating and checking Version 4 UUIDs.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID string.
     *
     * The output adheres to the canonical textual representation:
     * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`
     *
     * **Format Specifications:**
     * - `x`: A random lowercase hexadecimal digit (0-9, a-f).
     * - `4`: The version identifier (Version 4, Random).
     * - `y`: The variant identifier (RFC 4122), strictly limited to `{8, 9, a, b}`.
     *
     * @return std::string The generated 36-character UUID.
     *
     * @code
     * std::string id = uuidmesh::infra::IdGenerator::generate();
     * @endcode
     */
    static std::string generate();

    /**
     * @brief Checks that a string is a canonical lowercase Version 4 UUID.
     *
     * Verifies the 8-4-4-4-12 grouping, the hex alphabet, the version nibble
     * and the variant nibble.
     *
     * @param text Candidate string.
     * @return true If `text` could have been produced by `generate()`.
     */
    static bool is_v4(const std::string& text);
};

} // namespace uuidmesh::infra
