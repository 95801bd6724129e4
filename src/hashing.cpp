#include "txtrack/hashing.hpp"

#include <oxenc/endian.h>

#include <cstring>

namespace txtrack::hashing
{
Bytes32 chainHash(const Bytes32& prev, const Bytes32& value) {
    std::array<unsigned char, 64> packed;
    std::memcpy(packed.data(), prev.data(), prev.size());
    std::memcpy(packed.data() + prev.size(), value.data(), value.size());
    return utils::hashBytes(packed);
}

Bytes32 valueHash(std::span<const unsigned char> raw) {
    return utils::hashBytes(raw);
}

PackedHasher& PackedHasher::add(std::span<const unsigned char> bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    return *this;
}

// uint64 is packed as 8 big-endian bytes
PackedHasher& PackedHasher::add(uint64_t value) {
    const uint64_t big = oxenc::host_to_big(value);
    const auto* p = reinterpret_cast<const unsigned char*>(&big);
    buffer.insert(buffer.end(), p, p + sizeof(big));
    return *this;
}

Bytes32 PackedHasher::hash() const {
    return utils::hashBytes(buffer);
}
}  // namespace txtrack::hashing
