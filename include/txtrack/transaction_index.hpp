#pragma once

#include "assertion.hpp"
#include "utils.hpp"

#include <cstdint>
#include <cstring>
#include <unordered_map>
#include <vector>

namespace txtrack
{
/// Everything needed to prove a transaction's outcome against the on-chain
/// log accumulator of the assertion it was finalized in.
struct TransactionRecord {
    bool found = false;
    uint64_t assertionIndex = 0;
    RawValue rawVal;
    Bytes32 logsPreHash = {};
    Bytes32 logsPostHash = {};
    std::vector<Bytes32> logsValHashes;
    std::vector<Bytes> validatorSigs;
    Bytes32 partialHash = {};
    Bytes32 onChainTxHash = {};
};

struct Bytes32Hasher {
    // Keys are keccak outputs, so any 8 bytes of them are already uniformly distributed
    size_t operator()(const Bytes32& h) const noexcept {
        size_t result;
        std::memcpy(&result, h.data(), sizeof(result));
        return result;
    }
};

class TransactionIndex {
public:
    /// Inserts `record` under `id`. An existing record with the same id is
    /// replaced; returns true when that happened.
    bool upsert(const Bytes32& id, TransactionRecord record);

    /// Returns a copy of the record for `id`, or a record with `found ==
    /// false` if `id` was never ingested.
    TransactionRecord lookup(const Bytes32& id) const;

    size_t size() const { return transactions.size(); }

private:
    std::unordered_map<Bytes32, TransactionRecord, Bytes32Hasher> transactions;
};
}  // namespace txtrack
