#pragma once

#include "utils.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace txtrack::hashing
{
/// The virtual cumulative hash preceding the first log of an assertion.
inline constexpr Bytes32 ZERO_HASH = {};

/// keccak256(abi.encodePacked(prev, value)); the on-chain verifier folds log
/// value hashes with exactly this construction.
Bytes32 chainHash(const Bytes32& prev, const Bytes32& value);

/// Content hash of one raw log value.
Bytes32 valueHash(std::span<const unsigned char> raw);

/// Accumulates fields the way Solidity's `abi.encodePacked` lays them out and
/// hashes the result with keccak256.
class PackedHasher {
public:
    PackedHasher& add(std::span<const unsigned char> bytes);
    PackedHasher& add(uint64_t value);

    template <size_t N>
    PackedHasher& add(const std::array<unsigned char, N>& bytes) {
        return add(std::span<const unsigned char>{bytes});
    }

    Bytes32 hash() const;

private:
    std::vector<unsigned char> buffer;
};
}  // namespace txtrack::hashing
