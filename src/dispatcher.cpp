// dispatcher.cpp
#include <chrono>
#include <stdexcept>
#include <string>

#include <oxen/log.hpp>

#include "txtrack/dispatcher.hpp"
#include "txtrack/utils.hpp"

namespace
{
auto logcat = oxen::log::Cat("txtrack");
}

namespace txtrack
{
namespace log = oxen::log;

template <typename T>
struct ResultWaiter
{
    std::promise<std::optional<T>> p;
    std::future<std::optional<T>> fut;
    ResultWaiter() : fut{p.get_future()} {}

    RequestDispatcher::optional_callback<T> cb() {
        return [this](std::optional<T> r) {
            p.set_value(std::move(r));
        };
    }

    auto get() { return fut.get(); }
};

// Hands a response to user code running on the worker thread. A callback that
// throws must not take the worker down with it.
template <typename T>
static void deliver(const RequestDispatcher::optional_callback<T>& cb, std::optional<T> response)
{
    try
    {
        cb(std::move(response));
    }
    catch (const std::exception& e)
    {
        log::error(logcat, "Response callback threw: {}", e.what());
    }
    catch (...)
    {
        log::error(logcat, "Response callback threw a non-standard exception");
    }
}

RequestDispatcher::RequestDispatcher(TrackerConfig config,
                                     std::shared_ptr<const OutcomeDecoder> decoder,
                                     std::shared_future<Bytes32> creationTxHash)
    : config{std::move(config)},
      builder{this->config.rollupId, std::move(decoder)},
      creationTxHash{std::move(creationTxHash)}
{
    log::debug(logcat, "Starting request dispatcher for rollup {}", utils::toPrefixedHexString(this->config.rollupId));
    worker = std::thread{[this] { run(); }};
}

RequestDispatcher::~RequestDispatcher()
{
    stop();
}

void RequestDispatcher::stop()
{
    if (worker.joinable() && std::this_thread::get_id() == worker.get_id())
        throw std::logic_error{"RequestDispatcher::stop called from its own worker thread"};

    {
        std::lock_guard lk{mutex};
        stopping = true;
    }
    cv.notify_all();
    if (worker.joinable())
        worker.join();

    std::deque<Event> leftover;
    {
        std::lock_guard lk{mutex};
        leftover.swap(mailbox);
    }
    for (auto& event : leftover)
        abandon(event);
}

void RequestDispatcher::enqueue(Event event)
{
    {
        std::lock_guard lk{mutex};
        if (!stopping)
        {
            mailbox.push_back(std::move(event));
            cv.notify_one();
            return;
        }
    }
    abandon(event);
}

void RequestDispatcher::abandon(Event& event)
{
    std::visit(overloaded{
            [](FinalizedAssertion& assertion) {
                log::warning(logcat, "Dropping finalized assertion with sequence number {}, dispatcher is stopped or halted",
                        assertion.proposal.sequenceNum);
            },
            [](Request& request) {
                std::visit([](auto& r) { deliver(r.cb, {}); }, request);
            },
        }, event);
}

void RequestDispatcher::run()
{
    for (;;)
    {
        Event event;
        {
            std::unique_lock lk{mutex};
            cv.wait(lk, [this] { return stopping || !mailbox.empty(); });
            if (stopping)
                return;
            event = std::move(mailbox.front());
            mailbox.pop_front();
        }

        if (is_halted)
        {
            abandon(event);
            continue;
        }

        if (auto* assertion = std::get_if<FinalizedAssertion>(&event))
        {
            try
            {
                processFinalizedAssertion(*assertion);
            }
            catch (const std::exception& e)
            {
                log::critical(logcat, "Failed to ingest finalized assertion {}, no further assertions will be applied: {}",
                        store.size(), e.what());
                std::lock_guard lk{mutex};
                failure = std::current_exception();
                is_halted = true;
            }
        }
        else
        {
            processRequest(std::get<Request>(event));
        }
    }
}

void RequestDispatcher::processFinalizedAssertion(const FinalizedAssertion& assertion)
{
    const uint64_t height = store.size();
    log::info(logcat, "Produced finalized assertion {} with {} logs ({} new)",
            height, assertion.assertion.logs.size(), assertion.newLogCount);

    // Everything is computed before anything is written, so a rejected
    // assertion leaves no trace in the store or the index.
    IngestResult result = builder.build(assertion, height);

    for (auto& tx : result.transactions)
    {
        if (transactions.upsert(tx.id, std::move(tx.record)))
            log::warning(logcat, "Transaction {} was already recorded, replaced by the record from assertion {}",
                    utils::toPrefixedHexString(tx.id), height);
    }
    store.append(std::move(result.assertion));
}

void RequestDispatcher::processRequest(Request& request)
{
    std::visit(overloaded{
            [this](AssertionCountRequest& r) {
                deliver<int64_t>(r.cb, store.latestHeight());
            },
            [this](CreationTxHashRequest& r) {
                if (!creationTxHash.valid())
                {
                    log::warning(logcat, "No instance creation transaction hash source configured");
                    deliver<Bytes32>(r.cb, std::nullopt);
                    return;
                }
                if (creationTxHash.wait_for(config.creationTxHashTimeout) != std::future_status::ready)
                {
                    log::warning(logcat, "Timed out waiting for the instance creation transaction hash");
                    deliver<Bytes32>(r.cb, std::nullopt);
                    return;
                }
                std::optional<Bytes32> txHash;
                try
                {
                    txHash = creationTxHash.get();
                }
                catch (const std::exception& e)
                {
                    log::warning(logcat, "Instance creation transaction hash source failed: {}", e.what());
                }
                deliver(r.cb, std::move(txHash));
            },
            [this](TransactionRequest& r) {
                deliver(r.cb, std::make_optional(transactions.lookup(r.txHash)));
            },
            [this](FindLogsRequest& r) {
                deliver(r.cb, std::make_optional(txtrack::findLogs(store, r.query)));
            },
        }, request);
}

void RequestDispatcher::throwFailure(const std::string& what)
{
    std::exception_ptr ex;
    {
        std::lock_guard lk{mutex};
        ex = failure;
    }
    if (ex)
        std::rethrow_exception(ex);
    throw std::runtime_error{what};
}

void RequestDispatcher::submitAssertion(FinalizedAssertion assertion)
{
    enqueue(Event{std::in_place_type<FinalizedAssertion>, std::move(assertion)});
}

void RequestDispatcher::assertionCountAsync(optional_callback<int64_t> user_cb)
{
    enqueue(Event{std::in_place_type<Request>, AssertionCountRequest{std::move(user_cb)}});
}

int64_t RequestDispatcher::assertionCount()
{
    ResultWaiter<int64_t> waiter;
    assertionCountAsync(waiter.cb());
    auto result = waiter.get();

    if (!result)
        throwFailure("Unable to get assertion count");
    return *result;
}

void RequestDispatcher::instanceCreationTxHashAsync(optional_callback<Bytes32> user_cb)
{
    enqueue(Event{std::in_place_type<Request>, CreationTxHashRequest{std::move(user_cb)}});
}

Bytes32 RequestDispatcher::instanceCreationTxHash()
{
    ResultWaiter<Bytes32> waiter;
    instanceCreationTxHashAsync(waiter.cb());
    auto result = waiter.get();

    if (!result)
        throwFailure("Unable to get instance creation transaction hash");
    return *result;
}

void RequestDispatcher::getTransactionByHashAsync(const Bytes32& txHash, optional_callback<TransactionRecord> user_cb)
{
    enqueue(Event{std::in_place_type<Request>, TransactionRequest{txHash, std::move(user_cb)}});
}

TransactionRecord RequestDispatcher::getTransactionByHash(const Bytes32& txHash)
{
    ResultWaiter<TransactionRecord> waiter;
    getTransactionByHashAsync(txHash, waiter.cb());
    auto result = waiter.get();

    if (!result)
        throwFailure("Unable to look up transaction " + utils::toPrefixedHexString(txHash));
    return std::move(*result);
}

void RequestDispatcher::findLogsAsync(LogQuery query, optional_callback<std::vector<LogEntry>> user_cb)
{
    enqueue(Event{std::in_place_type<Request>, FindLogsRequest{std::move(query), std::move(user_cb)}});
}

std::vector<LogEntry> RequestDispatcher::findLogs(LogQuery query)
{
    ResultWaiter<std::vector<LogEntry>> waiter;
    findLogsAsync(std::move(query), waiter.cb());
    auto result = waiter.get();

    if (!result)
        throwFailure("Unable to find logs");
    return std::move(*result);
}
}; // namespace txtrack
