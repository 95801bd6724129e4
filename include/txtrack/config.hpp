#pragma once

#include <chrono>

#include <nlohmann/json_fwd.hpp>

#include "utils.hpp"

using namespace std::literals;

namespace txtrack
{
struct TrackerConfig {
    // The default wait applied to instance creation hash requests (if
    // setCreationTxHashTimeout is not called)
    static constexpr auto DEFAULT_CREATION_TX_HASH_TIMEOUT = 3s;

    TrackerConfig() = default;
    explicit TrackerConfig(const Bytes32& rollupId) : rollupId{rollupId} {}

    /// Rollup instance the tracked assertions belong to; part of every
    /// partial hash and message id.
    Bytes32 rollupId = {};

    /// How long a single instance creation hash request may hold up the
    /// dispatcher while the upstream source has not produced the hash yet.
    std::chrono::milliseconds creationTxHashTimeout{DEFAULT_CREATION_TX_HASH_TIMEOUT};

    void setCreationTxHashTimeout(std::chrono::milliseconds timeout);

    /** Reads a config of the form
     *
     *     {"rollup_id": "0x<64 hex digits>", "creation_tx_hash_timeout_ms": 3000}
     *
     * `creation_tx_hash_timeout_ms` is optional.
     *
     * @throws std::invalid_argument if `rollup_id` is missing or malformed, or
     * the timeout is not a non-negative integer.
     */
    static TrackerConfig fromJson(const nlohmann::json& config);
};
}  // namespace txtrack
