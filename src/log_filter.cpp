#include "txtrack/log_filter.hpp"

#include <algorithm>

namespace txtrack
{
bool logMatches(const EvmLog& log, const std::optional<Bytes32>& address, std::span<const Bytes32> topics) {
    if (address && *address != log.contractId)
        return false;

    if (topics.size() > log.topics.size())
        return false;

    return std::equal(topics.begin(), topics.end(), log.topics.begin());
}

std::vector<LogEntry> findLogs(const AssertionStore& store, const LogQuery& query) {
    std::vector<LogEntry> logs;

    const auto storeLength = static_cast<int64_t>(store.size());
    int64_t startHeight = 0;
    int64_t endHeight = storeLength;
    if (query.fromHeight && *query.fromHeight > 0)
        startHeight = *query.fromHeight;
    if (query.toHeight && *query.toHeight < endHeight)
        endHeight = *query.toHeight + 1;

    if (startHeight >= storeLength)
        return logs;

    for (int64_t height = startHeight; height < endHeight; height++) {
        const auto& assertion = store.at(static_cast<size_t>(height));
        uint32_t logIndex = 0;
        for (size_t txIndex = 0; txIndex < assertion.txLogs.size(); txIndex++) {
            const auto& txLogs = assertion.txLogs[txIndex];
            for (const auto& evmLog : txLogs.logs) {
                if (logMatches(evmLog, query.address, query.topics)) {
                    logs.push_back(LogEntry{
                        .contractId = evmLog.contractId,
                        .topics = evmLog.topics,
                        .data = evmLog.data,
                        .blockNumber = static_cast<uint64_t>(height),
                        .transactionHash = txLogs.txHash,
                        .transactionIndex = static_cast<uint32_t>(txIndex),
                        .logIndex = logIndex,
                    });
                }
                logIndex++;
            }
        }
    }
    return logs;
}
}  // namespace txtrack
