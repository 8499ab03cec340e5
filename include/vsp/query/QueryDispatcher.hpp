/**
 * QueryDispatcher.hpp - Asynchronous, one-at-a-time query dispatch
 *
 * dispatch() returns immediately. The result (or the error the client
 * produced) is delivered at most once per utterance through the
 * completion callback, on the thread that ran the call. The callback is
 * never invoked from inside dispatch(), abandon() or shutdown().
 *
 * At most one live call is handed to the client at a time. A dispatch
 * that arrives while a call is live waits in a single pending slot; a
 * newer one replaces it and the replaced utterance is dropped without a
 * completion. abandon() gives up on the live call: its result is
 * discarded whenever the client returns, and the next call may start
 * right away.
 */

#pragma once

#include "vsp/core/Types.hpp"
#include "vsp/query/QueryClient.hpp"

#include <functional>
#include <memory>
#include <string>

namespace vsp::query {

class QueryDispatcher {
public:
    using CompletionCallback = std::function<void(const std::string& dispatch_id, const QueryResult& result)>;

    explicit QueryDispatcher(std::shared_ptr<QueryClient> client);
    ~QueryDispatcher();

    QueryDispatcher(const QueryDispatcher&) = delete;
    QueryDispatcher& operator=(const QueryDispatcher&) = delete;

    void setCompletionCallback(CompletionCallback callback);

    void start();
    void dispatch(const Utterance& utterance, const SessionContext& context);

    /// Stops waiting for dispatch_id if it is the live call.
    void abandon(const std::string& dispatch_id);

    /// Drops the pending call and stops all delivery. Does not wait for a
    /// call stuck inside the client; it finishes on its own thread and
    /// its result is thrown away. Returns once no callback is running.
    void shutdown();

    bool isBusy() const;
    uint64_t completed() const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace vsp::query
