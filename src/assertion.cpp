#include "txtrack/assertion.hpp"
#include "txtrack/hashing.hpp"

#include <algorithm>

namespace txtrack
{
Bytes32 ExecutionAssertion::logsAccHash() const {
    Bytes32 acc = hashing::ZERO_HASH;
    for (const auto& value : logs)
        acc = hashing::chainHash(acc, hashing::valueHash(value));
    return acc;
}

Bytes32 ExecutionAssertion::digest() const {
    return hashing::PackedHasher{}
            .add(afterHash)
            .add(numSteps)
            .add(logsAccHash())
            .hash();
}

std::span<const RawValue> FinalizedAssertion::newLogs() const {
    const auto& logs = assertion.logs;
    const auto count = std::min<uint64_t>(newLogCount, logs.size());
    return std::span<const RawValue>{logs}.last(static_cast<size_t>(count));
}

Bytes32 unanimousAssertPartialHash(const Bytes32& rollupId, const ProposalResults& proposal) {
    return hashing::PackedHasher{}
            .add(rollupId)
            .add(proposal.sequenceNum)
            .add(proposal.beforeHash)
            .add(proposal.timeBounds.start)
            .add(proposal.timeBounds.end)
            .add(proposal.newInboxHash)
            .add(proposal.originalInboxHash)
            .add(proposal.assertion.digest())
            .hash();
}
}  // namespace txtrack
