#pragma once

#include "outcome.hpp"
#include "utils.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace txtrack
{
/// Decoded logs of one transaction whose outcome was a Stop or a Return.
struct TransactionLogBundle {
    Bytes32 txHash = {};
    Message msg;
    std::vector<EvmLog> logs;
};

struct AssertionRecord {
    std::vector<TransactionLogBundle> txLogs;

    // logsAccHashes[i] = chainHash(logsAccHashes[i-1], logsValHashes[i]), with
    // a zero hash standing in for logsAccHashes[-1]
    std::vector<Bytes32> logsAccHashes;
    std::vector<Bytes32> logsValHashes;
};

/// Append-only history of ingested assertions, indexed by height.
///
/// Nothing is ever evicted: memory use grows with the number of assertions
/// for the lifetime of the process.
class AssertionStore {
public:
    void append(AssertionRecord record);

    size_t size() const { return assertions.size(); }
    bool empty() const { return assertions.empty(); }

    /// Height of the newest assertion, -1 while the store is empty.
    int64_t latestHeight() const { return static_cast<int64_t>(assertions.size()) - 1; }

    const AssertionRecord& at(size_t height) const { return assertions.at(height); }
    std::span<const AssertionRecord> records() const { return assertions; }

private:
    std::vector<AssertionRecord> assertions;
};
}  // namespace txtrack
