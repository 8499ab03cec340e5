/**
 * SessionManager.cpp - Session registry and housekeeping
 */

#include "vsp/SessionManager.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>

namespace vsp {

namespace {

constexpr auto HOUSEKEEPING_INTERVAL = std::chrono::milliseconds(200);

} // anonymous namespace

struct SessionManager::Impl {
    core::PipelineConfig config;
    session::Providers providers;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<std::string, std::shared_ptr<session::ConversationSession>> sessions;
    std::vector<std::string> ended;
    bool stopping = false;

    std::atomic<uint64_t> next_id{1};
    uint32_t id_salt = 0;
    std::thread housekeeper;

    Impl(core::PipelineConfig cfg, session::Providers prov)
        : config(std::move(cfg))
        , providers(std::move(prov)) {
        std::random_device rd;
        id_salt = rd();
    }

    std::string makeId() {
        std::ostringstream id;
        id << "sess-" << std::hex << std::setw(8) << std::setfill('0') << id_salt
           << "-" << std::dec << next_id++;
        return id.str();
    }

    std::shared_ptr<session::ConversationSession> find(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(session_id);
        return it == sessions.end() ? nullptr : it->second;
    }

    void onEnded(const std::string& session_id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ended.push_back(session_id);
        }
        cv.notify_one();
    }

    void housekeeping() {
        const auto idle_timeout = std::chrono::milliseconds(config.session.idle_timeout_ms);

        while (true) {
            std::vector<std::shared_ptr<session::ConversationSession>> reap;
            std::vector<std::shared_ptr<session::ConversationSession>> idle;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, HOUSEKEEPING_INTERVAL, [this]() { return stopping || !ended.empty(); });
                if (stopping) break;

                for (const auto& session_id : ended) {
                    auto it = sessions.find(session_id);
                    if (it == sessions.end()) continue;
                    reap.push_back(it->second);
                    sessions.erase(it);
                }
                ended.clear();

                auto now = std::chrono::steady_clock::now();
                for (const auto& [session_id, session] : sessions) {
                    if (!session->hasEnded() && now - session->lastAudioAt() >= idle_timeout) {
                        idle.push_back(session);
                    }
                }
            }

            for (auto& session : idle) {
                std::cout << "[SessionManager] " << session->id() << " idle for "
                          << config.session.idle_timeout_ms << "ms" << std::endl;
                session->end(session::EndReason::IdleTimeout, "session timed out");
            }
            for (auto& session : reap) {
                session->shutdown();
            }
        }
    }
};

SessionManager::SessionManager(core::PipelineConfig config, session::Providers providers)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(providers))) {
    impl_->housekeeper = std::thread([this]() { impl_->housekeeping(); });
}

SessionManager::~SessionManager() {
    shutdown();
}

std::optional<std::string> SessionManager::open(std::shared_ptr<session::ClientSink> sink,
                                                std::optional<std::string> user_id) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return std::nullopt;
    }

    std::string session_id = impl_->makeId();
    std::shared_ptr<session::ConversationSession> session;

    try {
        session = std::make_shared<session::ConversationSession>(
            session_id, user_id, impl_->config, impl_->providers, sink);
    } catch (const core::ConfigError& e) {
        std::cerr << "[SessionManager] Cannot create session: " << e.what() << std::endl;
        session::ClientEventBus bus(sink);
        bus.sendError(e.what());
        bus.close();
        return std::nullopt;
    }

    session->setEndedCallback([impl = impl_.get()](const std::string& id, session::EndReason) {
        impl->onEnded(id);
    });

    if (!session->start()) {
        session::ClientEventBus bus(sink);
        bus.sendError(session->lastError());
        session->shutdown();
        return std::nullopt;
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->sessions[session_id] = session;
        count = impl_->sessions.size();
        // Ended while starting: its notice may have found nothing to reap
        if (session->hasEnded()) {
            impl_->ended.push_back(session_id);
        }
    }
    impl_->cv.notify_one();
    std::cout << "[SessionManager] Opened " << session_id << " (" << count << " active)" << std::endl;
    return session_id;
}

audio::IngestStatus SessionManager::onAudio(const std::string& session_id, std::vector<uint8_t> frame) {
    auto session = impl_->find(session_id);
    if (!session) return audio::IngestStatus::Closed;
    return session->onAudio(std::move(frame));
}

void SessionManager::onControl(const std::string& session_id, const std::string& message) {
    auto session = impl_->find(session_id);
    if (session) session->onControl(message);
}

void SessionManager::close(const std::string& session_id) {
    std::shared_ptr<session::ConversationSession> session;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) return;
        session = it->second;
        impl_->sessions.erase(it);
    }
    std::cout << "[SessionManager] Transport closed for " << session_id << std::endl;
    session->shutdown();
}

size_t SessionManager::activeSessions() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sessions.size();
}

std::optional<session::SessionStats> SessionManager::stats(const std::string& session_id) const {
    auto session = impl_->find(session_id);
    if (!session) return std::nullopt;
    return session->stats();
}

std::optional<TurnState> SessionManager::state(const std::string& session_id) const {
    auto session = impl_->find(session_id);
    if (!session) return std::nullopt;
    return session->state();
}

void SessionManager::shutdown() {
    std::map<std::string, std::shared_ptr<session::ConversationSession>> remaining;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->stopping = true;
        remaining.swap(impl_->sessions);
    }
    impl_->cv.notify_all();

    if (impl_->housekeeper.joinable()) {
        impl_->housekeeper.join();
    }

    for (auto& [session_id, session] : remaining) {
        session->shutdown();
    }
    std::cout << "[SessionManager] Shut down (" << remaining.size() << " sessions closed)" << std::endl;
}

} // namespace vsp
