/**
 * @file Keccak256.cpp
 * @brief Implementation of Keccak-256 over the Keccak-f[1600] permutation.
 */

#include "infrastructure/Keccak256.hpp"
#include <cstring>

namespace solverify::infrastructure {

namespace {

constexpr size_t kRate = 136; // 1600 - 2 * 256 bits, in bytes

constexpr uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

constexpr int kRotations[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

constexpr int kPiLanes[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

inline uint64_t RotateLeft(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void KeccakF(uint64_t st[25]) {
    uint64_t bc[5];
    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ RotateLeft(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
        }

        // Rho and Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = kPiLanes[i];
            bc[0] = st[j];
            st[j] = RotateLeft(t, kRotations[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) bc[i] = st[j + i];
            for (int i = 0; i < 5; ++i) st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // Iota
        st[0] ^= kRoundConstants[round];
    }
}

// Lanes are little-endian regardless of host order.
void AbsorbBlock(uint64_t st[25], const uint8_t* block) {
    for (size_t lane = 0; lane < kRate / 8; ++lane) {
        uint64_t v = 0;
        for (int b = 7; b >= 0; --b) {
            v = (v << 8) | block[lane * 8 + static_cast<size_t>(b)];
        }
        st[lane] ^= v;
    }
    KeccakF(st);
}

} // namespace

Keccak256::Digest Keccak256::Hash(const std::string& data) {
    uint64_t st[25] = {};
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    size_t remaining = data.size();

    while (remaining >= kRate) {
        AbsorbBlock(st, bytes);
        bytes += kRate;
        remaining -= kRate;
    }

    uint8_t last[kRate] = {};
    if (remaining > 0) std::memcpy(last, bytes, remaining);
    last[remaining] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    AbsorbBlock(st, last);

    Digest digest{};
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return digest;
}

std::string Keccak256::HexHash(const std::string& data) {
    static const char* kHex = "0123456789abcdef";
    Digest digest = Hash(data);
    std::string out = "0x";
    out.reserve(2 + digest.size() * 2);
    for (uint8_t byte : digest) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0f]);
    }
    return out;
}

} // namespace solverify::infrastructure
