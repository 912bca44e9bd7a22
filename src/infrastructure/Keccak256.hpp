/**
 * @file Keccak256.hpp
 * @brief Ethereum-flavoured Keccak-256 (original Keccak padding, not FIPS-202 SHA3).
 */

#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace solverify::infrastructure {

class Keccak256 {
public:
    using Digest = std::array<uint8_t, 32>;

    /** @brief Hashes raw bytes. */
    static Digest Hash(const std::string& data);

    /** @brief Hashes raw bytes and renders the digest as lowercase "0x"-prefixed hex. */
    static std::string HexHash(const std::string& data);
};

} // namespace solverify::infrastructure
