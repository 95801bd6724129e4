#include "txtrack/hashing.hpp"
#include "txtrack/utils.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace txtrack;

namespace
{
Bytes bytesOf(std::string_view text) {
    return Bytes(text.begin(), text.end());
}
}

TEST_CASE( "HashTest", "[utils]" ) {
    std::string hash_hello_world = utils::toHexString(utils::hashBytes(bytesOf("hello world!")));
    REQUIRE( hash_hello_world == "57caa176af1ac0433c5df30e8dabcd2ec1af1e92a26eced5f719b88458777cd6" );

    std::string hash_empty = utils::toHexString(utils::hashBytes(bytesOf("")));
    REQUIRE( hash_empty == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470" );
}

TEST_CASE( "Chain hash matches keccak256 of two packed words", "[utils]" ) {
    // keccak256(abi.encodePacked(bytes32(0), bytes32(0)))
    REQUIRE( utils::toHexString(hashing::chainHash(hashing::ZERO_HASH, hashing::ZERO_HASH)) ==
             "ad3228b676f7d3cd4284a5443f17f1962b36e491b30a40b2405849e597ba5fb5" );

    Bytes32 prev = utils::fromHexString32Byte("0x290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563");
    Bytes32 value = utils::hashBytes(bytesOf("log value"));
    std::vector<unsigned char> packed(prev.begin(), prev.end());
    packed.insert(packed.end(), value.begin(), value.end());
    REQUIRE( hashing::chainHash(prev, value) == utils::hashBytes(packed) );
}

TEST_CASE( "Value hash is keccak256 of the raw bytes", "[utils]" ) {
    std::vector<unsigned char> zeros(32, 0);
    REQUIRE( utils::toHexString(hashing::valueHash(zeros)) ==
             "290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563" );
}

TEST_CASE( "Packed hasher writes integers as 8 big endian bytes", "[utils]" ) {
    std::vector<unsigned char> expected = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0xff};
    auto hash = hashing::PackedHasher{}.add(uint64_t{0x0102}).add(std::vector<unsigned char>{0xff}).hash();
    REQUIRE( hash == utils::hashBytes(expected) );
}

TEST_CASE( "32 byte hex values", "[utils]" ) {
    auto hash = utils::fromHexString32Byte("0x290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563");
    REQUIRE( utils::toPrefixedHexString(hash) == "0x290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563" );
    REQUIRE( utils::fromHexString32Byte("290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563") == hash );
    REQUIRE_THROWS_AS( utils::fromHexString32Byte("0x0aff"), std::invalid_argument );
    REQUIRE_THROWS_AS( utils::fromHexString32Byte("0x290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e56z"), std::invalid_argument );

    Bytes32 contractId = {};
    contractId[11] = 0x01;
    contractId[12] = 0xab;
    contractId[31] = 0xcd;
    auto address = utils::contractAddress(contractId);
    REQUIRE( address.front() == 0xab );
    REQUIRE( address.back() == 0xcd );
}
