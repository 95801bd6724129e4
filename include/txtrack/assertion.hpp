#pragma once

#include "utils.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace txtrack
{
/// Opaque outcome value as produced by the rollup VM. One value per
/// transaction outcome.
using RawValue = Bytes;

struct TimeBounds {
    uint64_t start = 0;
    uint64_t end = 0;
};

struct ExecutionAssertion {
    Bytes32 afterHash = {};
    uint64_t numSteps = 0;
    std::vector<RawValue> logs;

    /// Chain hash over the value hashes of every log value.
    Bytes32 logsAccHash() const;

    /// Commitment to the execution result; this is what a proposal asserts.
    Bytes32 digest() const;
};

/// Parameters of the unanimous proposal round the assertion was agreed in.
struct ProposalResults {
    uint64_t sequenceNum = 0;
    Bytes32 beforeHash = {};
    TimeBounds timeBounds;
    Bytes32 newInboxHash = {};
    Bytes32 originalInboxHash = {};
    ExecutionAssertion assertion;
};

/// A finalized assertion as delivered by the validator feed.
struct FinalizedAssertion {
    ExecutionAssertion assertion;
    ProposalResults proposal;

    /// Number of trailing entries in `assertion.logs` that were not already
    /// part of pending state.
    uint64_t newLogCount = 0;
    std::vector<Bytes> signatures;
    Bytes32 onChainTxHash = {};

    /// The trailing `newLogCount` log values (all of them if the count
    /// exceeds the number of logs).
    std::span<const RawValue> newLogs() const;
};

/// Recomputes the partial hash validators signed for this proposal.
Bytes32 unanimousAssertPartialHash(const Bytes32& rollupId, const ProposalResults& proposal);
}  // namespace txtrack
