/**
 * HttpQueryClient.cpp - HTTP client for the query service
 */

#include "vsp/query/HttpQueryClient.hpp"

#include <iostream>

#include <httplib.h>

using json = nlohmann::json;

namespace vsp::query {

struct HttpQueryClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string path;

    Impl(const core::QueryConfig& config, int timeout_ms) : path(config.path) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }
};

HttpQueryClient::HttpQueryClient(const core::QueryConfig& config, int timeout_ms)
    : impl_(std::make_unique<Impl>(config, timeout_ms)) {
}

HttpQueryClient::~HttpQueryClient() = default;

bool HttpQueryClient::isHealthy() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

json HttpQueryClient::buildRequest(const Utterance& utterance, const SessionContext& context) {
    json history = json::array();
    for (const auto& entry : context.history) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            entry.timestamp.time_since_epoch()).count();
        history.push_back({
            {"role", toString(entry.role)},
            {"text", entry.text},
            {"timestamp", seconds}
        });
    }

    json req_json = {
        {"utterance", utterance.text},
        {"dispatch_id", utterance.dispatch_id},
        {"session_id", context.session_id},
        {"user_id", context.user_id ? json(*context.user_id) : json(nullptr)},
        {"history", history}
    };
    return req_json;
}

QueryResult HttpQueryClient::parseResponse(const std::string& body) {
    QueryResult result;
    try {
        json res_json = json::parse(body);
        if (!res_json.is_object()) {
            return QueryResult::failure("query response is not an object");
        }

        if (res_json.contains("error") && !res_json["error"].is_null()) {
            const auto& error = res_json["error"];
            return QueryResult::failure(error.is_string() ? error.get<std::string>() : error.dump());
        }

        result.reply_text = res_json.value("reply_text", "");
        if (res_json.contains("structured_payload")) {
            result.structured_payload = res_json["structured_payload"];
        }
    } catch (const json::exception& e) {
        std::cerr << "[HttpQueryClient] JSON parse error: " << e.what() << std::endl;
        return QueryResult::failure(std::string("malformed query response: ") + e.what());
    }
    return result;
}

QueryResult HttpQueryClient::query(const Utterance& utterance, const SessionContext& context) {
    auto res = impl_->client->Post(
        impl_->path,
        buildRequest(utterance, context).dump(),
        "application/json"
    );

    if (!res) {
        std::string reason = httplib::to_string(res.error());
        std::cerr << "[HttpQueryClient] Request failed: " << reason << std::endl;
        return QueryResult::failure(reason);
    }

    if (res->status != 200) {
        std::cerr << "[HttpQueryClient] Query service returned " << res->status << std::endl;
        return QueryResult::failure("status " + std::to_string(res->status));
    }

    return parseResponse(res->body);
}

} // namespace vsp::query
