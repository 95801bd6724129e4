#pragma once

#include "assertion.hpp"
#include "assertion_store.hpp"
#include "outcome.hpp"
#include "transaction_index.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace txtrack
{
/// The validator feed delivered an assertion that contradicts its own
/// proposal. This is a bug upstream; ingestion must not continue.
struct ProtocolViolation : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct IngestedTransaction {
    Bytes32 id;
    TransactionRecord record;
};

struct IngestResult {
    AssertionRecord assertion;
    std::vector<IngestedTransaction> transactions;
};

/// Computes the log hash chain of a finalized assertion and the per
/// transaction windows into it. Pure: nothing is written anywhere, the
/// caller decides where the result goes.
class HashChainBuilder {
public:
    HashChainBuilder(const Bytes32& rollupId, std::shared_ptr<const OutcomeDecoder> decoder);

    /// Builds the records for `finalized`, which is to be stored at `height`.
    ///
    /// Throws ProtocolViolation if the assertion differs from the one its
    /// proposal results assert. Outcomes that fail to decode still produce a
    /// TransactionRecord (keyed by the outcome's value hash) but no log
    /// bundle.
    IngestResult build(const FinalizedAssertion& finalized, uint64_t height) const;

    const Bytes32& rollupId() const { return rollup_id; }

private:
    Bytes32 rollup_id;
    std::shared_ptr<const OutcomeDecoder> decoder;
};
}  // namespace txtrack
