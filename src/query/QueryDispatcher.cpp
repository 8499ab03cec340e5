/**
 * QueryDispatcher.cpp - Call threads in front of a QueryClient
 *
 * Each call runs on its own detached thread that shares ownership of the
 * dispatcher state, so a client that never returns cannot hold up the
 * session that gave up on it.
 */

#include "vsp/query/QueryDispatcher.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace vsp::query {

namespace {

struct Job {
    Utterance utterance;
    SessionContext context;
};

} // anonymous namespace

struct QueryDispatcher::State {
    std::shared_ptr<QueryClient> client;

    mutable std::mutex mutex;
    CompletionCallback on_complete;
    std::string live_id;             // empty when no call is live
    std::optional<Job> pending;
    bool started = false;
    bool stopping = false;
    std::atomic<uint64_t> completed{0};

    // Held while a completion callback runs
    std::mutex delivery_mutex;

    QueryResult call(const Job& job) {
        try {
            return client->query(job.utterance, job.context);
        } catch (const std::exception& e) {
            std::cerr << "[QueryDispatcher] Query client threw: " << e.what() << std::endl;
            return QueryResult::failure(e.what());
        }
    }

    static void launchNext(const std::shared_ptr<State>& state) {
        Job job;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stopping || !state->started || !state->live_id.empty() || !state->pending) return;
            job = std::move(*state->pending);
            state->pending.reset();
            state->live_id = job.utterance.dispatch_id;
        }

        try {
            std::thread([state, job = std::move(job)]() { run(state, job); }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[QueryDispatcher] Cannot start call thread: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(state->mutex);
            state->live_id.clear();
        }
    }

    static void run(const std::shared_ptr<State>& state, const Job& job) {
        const std::string& id = job.utterance.dispatch_id;

        auto start = std::chrono::steady_clock::now();
        QueryResult result = state->call(job);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (result.ok()) {
            std::cout << "[QueryDispatcher] " << id << " answered in " << elapsed << "ms" << std::endl;
        } else {
            std::cerr << "[QueryDispatcher] " << id << " failed after " << elapsed << "ms: "
                      << *result.error << std::endl;
        }

        {
            std::lock_guard<std::mutex> delivery(state->delivery_mutex);
            CompletionCallback callback;
            bool live = false;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                live = !state->stopping && state->live_id == id;
                if (live) {
                    state->live_id.clear();
                    callback = state->on_complete;
                }
            }

            if (live) {
                state->completed++;
                if (callback) callback(id, result);
            } else {
                std::cout << "[QueryDispatcher] Discarding result of abandoned " << id << std::endl;
            }
        }

        launchNext(state);
    }
};

QueryDispatcher::QueryDispatcher(std::shared_ptr<QueryClient> client)
    : state_(std::make_shared<State>()) {
    state_->client = std::move(client);
}

QueryDispatcher::~QueryDispatcher() {
    shutdown();
}

void QueryDispatcher::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_complete = std::move(callback);
}

void QueryDispatcher::start() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->started || state_->stopping) return;
        state_->started = true;
    }
    State::launchNext(state_);
}

void QueryDispatcher::dispatch(const Utterance& utterance, const SessionContext& context) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) return;
        if (state_->pending) {
            std::cout << "[QueryDispatcher] " << state_->pending->utterance.dispatch_id
                      << " superseded by " << utterance.dispatch_id << std::endl;
        }
        state_->pending = Job{utterance, context};
    }
    State::launchNext(state_);
}

void QueryDispatcher::abandon(const std::string& dispatch_id) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (dispatch_id.empty() || state_->live_id != dispatch_id) return;
        std::cerr << "[QueryDispatcher] Abandoning " << dispatch_id << std::endl;
        state_->live_id.clear();
    }
    State::launchNext(state_);
}

void QueryDispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) return;
        state_->stopping = true;
        state_->pending.reset();
        state_->live_id.clear();
        state_->on_complete = nullptr;
    }

    // Wait out a callback that was already running
    std::lock_guard<std::mutex> delivery(state_->delivery_mutex);
}

bool QueryDispatcher::isBusy() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->live_id.empty() || state_->pending.has_value();
}

uint64_t QueryDispatcher::completed() const {
    return state_->completed.load();
}

} // namespace vsp::query
