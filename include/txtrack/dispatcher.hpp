// dispatcher.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

#include "assertion.hpp"
#include "assertion_store.hpp"
#include "config.hpp"
#include "hash_chain.hpp"
#include "log_filter.hpp"
#include "logs.hpp"
#include "outcome.hpp"
#include "transaction_index.hpp"

namespace txtrack
{
/** Owns the assertion history and transaction index of one rollup instance
 * and serialises every change and query to them on a single worker thread.
 *
 * Finalized assertions and queries are handled one at a time in the order
 * they were submitted, so a query submitted after `submitAssertion` returned
 * sees that assertion. Responses are handed to the caller's callback on the
 * worker thread; a slow callback holds up everything queued behind it.
 *
 * Nothing is ever evicted from the history.
 */
class RequestDispatcher {
public:
    template <typename Ret>
    using optional_callback = std::function<void(std::optional<Ret>)>;

    /** Starts the worker thread.
     *
     * @param creationTxHash Upstream source of the hash of the transaction
     * that created the rollup instance. It is read on demand and never
     * written to.
     */
    RequestDispatcher(TrackerConfig config,
                      std::shared_ptr<const OutcomeDecoder> decoder,
                      std::shared_future<Bytes32> creationTxHash);

    /// Calls `stop()`. The last owner must not destroy the dispatcher from
    /// inside one of its response callbacks: `stop()` refuses to run on the
    /// worker thread, and the resulting exception terminates the process.
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /// Queues a finalized assertion from the validator feed. Assertions must
    /// be submitted in sequence order without gaps.
    void submitAssertion(FinalizedAssertion assertion);

    // The async versions invoke the callback exactly once, with std::nullopt
    // if the dispatcher is stopped or halted before answering. Neither the
    // blocking versions nor `stop()` (nor the destructor) may be called from
    // inside a response callback.

    /// Height of the latest assertion; -1 if none has been ingested.
    void assertionCountAsync(optional_callback<int64_t> user_cb);
    int64_t assertionCount();

    /// Hash of the transaction that created the rollup instance. Gives up
    /// (std::nullopt) after `TrackerConfig::creationTxHashTimeout`.
    void instanceCreationTxHashAsync(optional_callback<Bytes32> user_cb);
    Bytes32 instanceCreationTxHash();

    /// Record for the transaction with message id `txHash`; `found` is false
    /// for unknown ids.
    void getTransactionByHashAsync(const Bytes32& txHash, optional_callback<TransactionRecord> user_cb);
    TransactionRecord getTransactionByHash(const Bytes32& txHash);

    void findLogsAsync(LogQuery query, optional_callback<std::vector<LogEntry>> user_cb);
    std::vector<LogEntry> findLogs(LogQuery query);

    /// Finishes the event in progress, answers queued requests with
    /// std::nullopt, drops queued assertions and joins the worker. Throws
    /// std::logic_error if called from the worker thread.
    void stop();

    /// True once an assertion failed to ingest. A halted dispatcher applies
    /// no further assertions and answers every request with std::nullopt.
    bool halted() const { return is_halted; }

    const TrackerConfig& getConfig() const { return config; }

private:
    struct AssertionCountRequest {
        optional_callback<int64_t> cb;
    };
    struct CreationTxHashRequest {
        optional_callback<Bytes32> cb;
    };
    struct TransactionRequest {
        Bytes32 txHash;
        optional_callback<TransactionRecord> cb;
    };
    struct FindLogsRequest {
        LogQuery query;
        optional_callback<std::vector<LogEntry>> cb;
    };
    using Request = std::variant<AssertionCountRequest, CreationTxHashRequest, TransactionRequest, FindLogsRequest>;
    using Event = std::variant<FinalizedAssertion, Request>;

    void enqueue(Event event);
    void run();
    void processFinalizedAssertion(const FinalizedAssertion& assertion);
    void processRequest(Request& request);
    static void abandon(Event& event);

    // Throws the error that halted the dispatcher if there is one, otherwise
    // a runtime_error carrying `what`.
    [[noreturn]] void throwFailure(const std::string& what);

    const TrackerConfig config;
    const HashChainBuilder builder;
    std::shared_future<Bytes32> creationTxHash;

    // Only ever touched by the worker thread
    AssertionStore store;
    TransactionIndex transactions;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Event> mailbox;
    bool stopping = false;
    std::exception_ptr failure;
    std::atomic<bool> is_halted{false};

    std::thread worker;
};
}; // namespace txtrack
