// logs.hpp
#pragma once

#include "utils.hpp"

#include <cstdint>
#include <vector>

namespace txtrack
{
struct LogEntry {
    Bytes32 contractId; // Contract from which this log originated
    std::vector<Bytes32> topics; // Indexed log arguments
    Bytes data; // Non-indexed log arguments
    uint64_t blockNumber; // Height of the assertion the log was produced in
    Bytes32 transactionHash; // Message id of the transaction this log was created from
    uint32_t transactionIndex; // Index of the transaction among the assertion's log bundles
    uint32_t logIndex; // Index of the log among all logs of the assertion

    /// The contract address, i.e. the low 20 bytes of `contractId`.
    Bytes20 address() const { return utils::contractAddress(contractId); }
};
}  // namespace txtrack
