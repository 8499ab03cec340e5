/**
 * HttpQueryClient.hpp - JSON over HTTP query client
 *
 * Request:  POST <path> {utterance, session_id, user_id, history}
 * Response: {reply_text, structured_payload?, error?}
 */

#pragma once

#include "vsp/core/Config.hpp"
#include "vsp/query/QueryClient.hpp"

#include <memory>

#include <nlohmann/json.hpp>

namespace vsp::query {

class HttpQueryClient : public QueryClient {
public:
    HttpQueryClient(const core::QueryConfig& config, int timeout_ms);
    ~HttpQueryClient() override;

    QueryResult query(const Utterance& utterance, const SessionContext& context) override;

    bool isHealthy();

    static nlohmann::json buildRequest(const Utterance& utterance, const SessionContext& context);
    static QueryResult parseResponse(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vsp::query
