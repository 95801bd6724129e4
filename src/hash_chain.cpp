#include "txtrack/hash_chain.hpp"
#include "txtrack/hashing.hpp"

#include <oxen/log.hpp>

#include <variant>

namespace
{
auto logcat = oxen::log::Cat("txtrack");
}

namespace txtrack
{
namespace log = oxen::log;

HashChainBuilder::HashChainBuilder(const Bytes32& rollupId, std::shared_ptr<const OutcomeDecoder> decoder)
    : rollup_id{rollupId}, decoder{std::move(decoder)}
{
    if (!this->decoder)
        throw std::invalid_argument{"HashChainBuilder requires an outcome decoder"};
}

IngestResult HashChainBuilder::build(const FinalizedAssertion& finalized, uint64_t height) const {
    const Bytes32 digest = finalized.assertion.digest();
    if (digest != finalized.proposal.assertion.digest())
        throw ProtocolViolation{"finalized assertion " + std::to_string(height) +
                                " differs from the assertion in its proposal results, execution digest " +
                                utils::toPrefixedHexString(digest)};

    const Bytes32 partialHash = unanimousAssertPartialHash(rollup_id, finalized.proposal);

    IngestResult result;
    AssertionRecord& info = result.assertion;

    const auto& logs = finalized.assertion.logs;
    info.logsValHashes.reserve(logs.size());
    info.logsAccHashes.reserve(logs.size());
    Bytes32 acc = hashing::ZERO_HASH;
    for (const auto& logsVal : logs) {
        const Bytes32 logsValHash = hashing::valueHash(logsVal);
        info.logsValHashes.push_back(logsValHash);
        acc = hashing::chainHash(acc, logsValHash);
        info.logsAccHashes.push_back(acc);
    }

    const Bytes32 logsPostHash = info.logsAccHashes.empty() ? hashing::ZERO_HASH : info.logsAccHashes.back();
    const auto newLogs = finalized.newLogs();
    const size_t firstNew = info.logsAccHashes.size() - newLogs.size();

    result.transactions.reserve(newLogs.size());
    for (size_t i = 0; i < newLogs.size(); i++) {
        const auto& res = newLogs[i];
        const size_t position = firstNew + i;

        // phi = M - N - (i + 1) is the accumulator the window starts after; a
        // negative phi starts the window at the zero hash. The window always
        // runs to the end of the assertion so that folding logsValHashes onto
        // logsPreHash reproduces logsPostHash.
        const size_t windowBegin = (i < firstNew) ? firstNew - i : 0;

        TransactionRecord record;
        record.found = true;
        record.assertionIndex = height;
        record.rawVal = res;
        record.logsPreHash = windowBegin == 0 ? hashing::ZERO_HASH : info.logsAccHashes[windowBegin - 1];
        record.logsPostHash = logsPostHash;
        record.logsValHashes.assign(info.logsValHashes.begin() + windowBegin, info.logsValHashes.end());
        record.validatorSigs = finalized.signatures;
        record.partialHash = partialHash;
        record.onChainTxHash = finalized.onChainTxHash;

        Bytes32 msgHash = info.logsValHashes[position];
        try {
            Outcome outcome = decoder->decode(res);
            msgHash = outcomeMessage(outcome).hash(rollup_id);
            std::visit(overloaded{
                    [&](Stop& stop) {
                        info.txLogs.push_back(TransactionLogBundle{msgHash, std::move(stop.msg), std::move(stop.logs)});
                    },
                    [&](Return& ret) {
                        info.txLogs.push_back(TransactionLogBundle{msgHash, std::move(ret.msg), std::move(ret.logs)});
                    },
                    [](Revert&) {},
                }, outcome);
        } catch (const DecodeError& e) {
            log::warning(logcat, "VM produced invalid evm result at assertion {} log {}: {}", height, position, e.what());
        }

        log::debug(logcat, "Got response for {}", utils::toPrefixedHexString(msgHash));
        result.transactions.push_back(IngestedTransaction{msgHash, std::move(record)});
    }
    return result;
}
}  // namespace txtrack
