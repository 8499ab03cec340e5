/**
 * LocalServer.hpp - httplib::Server on an ephemeral loopback port
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>

namespace vsp::testing {

class LocalServer {
public:
    httplib::Server server;

    /// Binds, starts listening on a background thread and waits for it.
    bool start() {
        port_ = server.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) return false;

        thread_ = std::thread([this]() { server.listen_after_bind(); });
        for (int i = 0; i < 200 && !server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return server.is_running();
    }

    void stop() {
        server.stop();
        if (thread_.joinable()) thread_.join();
    }

    ~LocalServer() { stop(); }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int port() const { return port_; }

private:
    int port_ = 0;
    std::thread thread_;
};

} // namespace vsp::testing
