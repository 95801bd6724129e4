#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <oxenc/common.h>
#include <oxenc/hex.h>

namespace txtrack
{
using Bytes   = std::vector<unsigned char>;
using Bytes20 = std::array<unsigned char, 20>;
using Bytes32 = std::array<unsigned char, 32>;

/// Visitor built from a set of lambdas, for std::visit over the closed variants.
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

namespace utils
{
    template <typename Container>
    std::string toHexString(const Container& bytes) {
        return oxenc::to_hex(bytes.begin(), bytes.end());
    }

    /// Same as `toHexString` with a leading "0x".
    template <typename Container>
    std::string toPrefixedHexString(const Container& bytes) {
        return "0x" + toHexString(bytes);
    }

    std::string_view trimPrefix(std::string_view src, std::string_view prefix);

    using oxenc::basic_char;
    template <basic_char Char = unsigned char>
    std::array<Char, 32> fromHexString32Byte(std::string_view hexStr) {
        hexStr = trimPrefix(hexStr, "0x");

        if (!oxenc::is_hex(hexStr) || hexStr.size() != 64) {
            throw std::invalid_argument("Input string length should be 64 hex characters for 32 bytes");
        }

        std::array<Char, 32> bytesArr;
        oxenc::from_hex(hexStr.begin(), hexStr.end(), bytesArr.begin());

        return bytesArr;
    }
    extern template std::array<char, 32> fromHexString32Byte<char>(std::string_view);
    extern template std::array<unsigned char, 32> fromHexString32Byte<unsigned char>(std::string_view);

    /// The 20 byte address held in the low bytes of a 32 byte contract id.
    inline Bytes20 contractAddress(const Bytes32& contractId) {
        Bytes20 result;
        std::copy(contractId.end() - result.size(), contractId.end(), result.begin());
        return result;
    }

    /// Keccak-256 (the pre-standard padding Ethereum uses, not NIST SHA3-256).
    Bytes32 hashBytesPtr(const void* bytes, size_t size);
    Bytes32 hashBytes(std::span<const unsigned char> bytes);
}
}  // namespace txtrack
