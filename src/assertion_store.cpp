#include "txtrack/assertion_store.hpp"

#include <stdexcept>

namespace txtrack
{
void AssertionStore::append(AssertionRecord record) {
    if (record.logsAccHashes.size() != record.logsValHashes.size())
        throw std::invalid_argument{"assertion record has mismatched accumulator and value hash counts"};
    assertions.push_back(std::move(record));
}
}  // namespace txtrack
