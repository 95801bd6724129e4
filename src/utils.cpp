#include "txtrack/utils.hpp"

extern "C" {
#include "crypto/keccak.h"
}

namespace txtrack
{
std::string_view utils::trimPrefix(std::string_view src, std::string_view prefix) {
    if (src.starts_with(prefix))
        return src.substr(prefix.size());
    return src;
}

template std::array<char, 32> utils::fromHexString32Byte<char>(std::string_view);
template std::array<unsigned char, 32> utils::fromHexString32Byte<unsigned char>(std::string_view);

Bytes32 utils::hashBytesPtr(const void *bytes, size_t size) {
  Bytes32 result;
  keccak(reinterpret_cast<const uint8_t*>(bytes), size, result.data(), static_cast<int>(result.max_size()));
  return result;
}

Bytes32 utils::hashBytes(std::span<const unsigned char> bytes) {
    return hashBytesPtr(bytes.data(), bytes.size());
}
};  // namespace txtrack
