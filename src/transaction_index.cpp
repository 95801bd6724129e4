#include "txtrack/transaction_index.hpp"

namespace txtrack
{
bool TransactionIndex::upsert(const Bytes32& id, TransactionRecord record) {
    auto [it, inserted] = transactions.insert_or_assign(id, std::move(record));
    return !inserted;
}

TransactionRecord TransactionIndex::lookup(const Bytes32& id) const {
    if (auto it = transactions.find(id); it != transactions.end())
        return it->second;
    return TransactionRecord{};
}
}  // namespace txtrack
