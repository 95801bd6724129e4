#pragma once

#include "assertion.hpp"
#include "utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>

namespace txtrack
{
/// The L2 message a transaction outcome answers.
struct Message {
    Bytes20 sender = {};
    uint64_t sequenceNum = 0;
    Bytes data;

    /// Identifier of the transaction within the rollup instance `rollupId`.
    Bytes32 hash(const Bytes32& rollupId) const;
};

struct EvmLog {
    Bytes32 contractId = {}; // Contract identifier, an address widened to 32 bytes
    std::vector<Bytes32> topics; // Indexed log arguments
    Bytes data; // Non-indexed log arguments

    /// The low 20 bytes of `contractId`.
    Bytes20 address() const;
};

struct Stop {
    Message msg;
    std::vector<EvmLog> logs;
};

struct Return {
    Message msg;
    std::vector<EvmLog> logs;
    Bytes returnData;
};

struct Revert {
    Message msg;
    Bytes returnData;
};

using Outcome = std::variant<Stop, Return, Revert>;

const Message& outcomeMessage(const Outcome& outcome);

struct DecodeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Turns a raw outcome value into its EVM-level result.
class OutcomeDecoder {
public:
    virtual ~OutcomeDecoder() = default;

    /// Throws DecodeError if `raw` is not a valid outcome.
    virtual Outcome decode(const RawValue& raw) const = 0;
};
}  // namespace txtrack
