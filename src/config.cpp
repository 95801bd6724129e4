#include "txtrack/config.hpp"

#pragma GCC diagnostic push
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#include <nlohmann/json.hpp>
#pragma GCC diagnostic pop

#include <stdexcept>

namespace txtrack
{
void TrackerConfig::setCreationTxHashTimeout(std::chrono::milliseconds timeout) {
    if (timeout < 0ms)
        throw std::invalid_argument{"creation tx hash timeout must not be negative"};
    creationTxHashTimeout = timeout;
}

TrackerConfig TrackerConfig::fromJson(const nlohmann::json& config) {
    if (!config.is_object())
        throw std::invalid_argument{"tracker config must be a json object"};

    auto it = config.find("rollup_id");
    if (it == config.end() || !it->is_string())
        throw std::invalid_argument{"tracker config is missing string field \"rollup_id\""};

    TrackerConfig result{utils::fromHexString32Byte(it->get<std::string>())};

    if (auto timeout = config.find("creation_tx_hash_timeout_ms"); timeout != config.end())
    {
        if (!timeout->is_number_integer())
            throw std::invalid_argument{"\"creation_tx_hash_timeout_ms\" must be an integer"};
        result.setCreationTxHashTimeout(std::chrono::milliseconds{timeout->get<int64_t>()});
    }
    return result;
}
}  // namespace txtrack
