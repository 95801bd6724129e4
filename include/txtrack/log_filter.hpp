#pragma once

#include "assertion_store.hpp"
#include "logs.hpp"
#include "outcome.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace txtrack
{
struct LogQuery {
    std::optional<int64_t> fromHeight; // First height to search, 0 if unset
    std::optional<int64_t> toHeight; // Last height to search (inclusive), the latest if unset
    std::optional<Bytes32> address; // Contract identifier the log must come from
    std::vector<Bytes32> topics; // Positional prefix of topics the log must start with
};

/// True if `log` was emitted by `address` (when given) and its leading topics
/// equal `topics`.
bool logMatches(const EvmLog& log, const std::optional<Bytes32>& address, std::span<const Bytes32> topics);

/// Collects every log in the height range of `query` that matches its address
/// and topic filters, ordered by height, then transaction, then log.
///
/// A range that starts past the newest assertion, or ends before it starts,
/// yields no logs.
std::vector<LogEntry> findLogs(const AssertionStore& store, const LogQuery& query);
}  // namespace txtrack
