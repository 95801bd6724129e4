#include "fixtures.hpp"

#include "txtrack/transaction_index.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace txtrack;
using namespace fixtures;

namespace
{
TransactionRecord recordAt(uint64_t assertionIndex, std::string_view raw) {
    TransactionRecord record;
    record.found = true;
    record.assertionIndex = assertionIndex;
    record.rawVal = rawValue(raw);
    return record;
}
}

TEST_CASE( "Unknown transaction is reported as not found", "[index]" ) {
    TransactionIndex index;
    auto record = index.lookup(filled32(0x99));
    REQUIRE_FALSE( record.found );
    REQUIRE( record.rawVal.empty() );
    REQUIRE( record.logsValHashes.empty() );

    index.upsert(filled32(0x01), recordAt(0, "a"));
    REQUIRE_FALSE( index.lookup(filled32(0x99)).found );
}

TEST_CASE( "Lookup returns the stored record", "[index]" ) {
    TransactionIndex index;
    REQUIRE_FALSE( index.upsert(filled32(0x01), recordAt(0, "a")) );
    REQUIRE_FALSE( index.upsert(filled32(0x02), recordAt(1, "b")) );
    REQUIRE( index.size() == 2 );

    auto record = index.lookup(filled32(0x02));
    REQUIRE( record.found );
    REQUIRE( record.assertionIndex == 1 );
    REQUIRE( record.rawVal == rawValue("b") );
}

// Message ids are unique as long as the protocol is followed. Should they
// repeat anyway, the newest record currently replaces the older one; this
// pins that behaviour so any change to it is deliberate.
TEST_CASE( "Duplicate message id replaces the earlier record", "[index]" ) {
    TransactionIndex index;
    REQUIRE_FALSE( index.upsert(filled32(0x01), recordAt(0, "first")) );
    REQUIRE( index.upsert(filled32(0x01), recordAt(4, "second")) );
    REQUIRE( index.size() == 1 );

    auto record = index.lookup(filled32(0x01));
    REQUIRE( record.assertionIndex == 4 );
    REQUIRE( record.rawVal == rawValue("second") );
}
