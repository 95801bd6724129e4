#include "txtrack/outcome.hpp"
#include "txtrack/hashing.hpp"

namespace txtrack
{
Bytes32 Message::hash(const Bytes32& rollupId) const {
    return hashing::PackedHasher{}
            .add(rollupId)
            .add(sender)
            .add(sequenceNum)
            .add(utils::hashBytes(data))
            .hash();
}

Bytes20 EvmLog::address() const {
    return utils::contractAddress(contractId);
}

const Message& outcomeMessage(const Outcome& outcome) {
    return std::visit([](const auto& o) -> const Message& { return o.msg; }, outcome);
}
}  // namespace txtrack
