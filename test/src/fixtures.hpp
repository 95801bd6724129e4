#pragma once

#include <map>
#include <string_view>

#include "txtrack/assertion.hpp"
#include "txtrack/outcome.hpp"
#include "txtrack/utils.hpp"

namespace fixtures
{
using namespace txtrack;

inline Bytes32 filled32(unsigned char fill) {
    Bytes32 result;
    result.fill(fill);
    return result;
}

inline RawValue rawValue(std::string_view text) {
    return RawValue(text.begin(), text.end());
}

inline Message message(uint64_t sequenceNum) {
    Message msg;
    msg.sender.fill(0x01);
    msg.sequenceNum = sequenceNum;
    msg.data = {0xde, 0xad, static_cast<unsigned char>(sequenceNum)};
    return msg;
}

inline EvmLog evmLog(unsigned char contract, std::vector<Bytes32> topics, Bytes data = {}) {
    EvmLog log;
    log.contractId[31] = contract;
    log.topics = std::move(topics);
    log.data = std::move(data);
    return log;
}

inline FinalizedAssertion finalizedAssertion(std::vector<RawValue> logs, uint64_t newLogCount, uint64_t sequenceNum = 0) {
    FinalizedAssertion result;
    result.assertion.afterHash = filled32(0xaa);
    result.assertion.numSteps = 1000;
    result.assertion.logs = std::move(logs);
    result.newLogCount = newLogCount;
    result.proposal.sequenceNum = sequenceNum;
    result.proposal.beforeHash = filled32(0xbb);
    result.proposal.timeBounds = TimeBounds{10, 20};
    result.proposal.newInboxHash = filled32(0xcc);
    result.proposal.originalInboxHash = filled32(0xdd);
    result.proposal.assertion = result.assertion;
    result.signatures = {Bytes(65, 0x11), Bytes(65, 0x22)};
    result.onChainTxHash = filled32(0x0c);
    return result;
}

/// Decodes only the raw values it was told about; anything else is an
/// invalid outcome. Must be fully populated before it is shared with a
/// dispatcher.
struct ScriptedDecoder : OutcomeDecoder {
    std::map<RawValue, Outcome> outcomes;

    void add(const RawValue& raw, Outcome outcome) {
        outcomes.insert_or_assign(raw, std::move(outcome));
    }

    Outcome decode(const RawValue& raw) const override {
        auto it = outcomes.find(raw);
        if (it == outcomes.end())
            throw DecodeError{"unknown outcome of " + std::to_string(raw.size()) + " bytes"};
        return it->second;
    }
};
}  // namespace fixtures
