/**
 * QueryClient.hpp - Interface to the downstream query subsystem
 */

#pragma once

#include "vsp/core/Types.hpp"

namespace vsp::query {

class QueryClient {
public:
    virtual ~QueryClient() = default;

    /// Blocking call. Implementations report transport and protocol faults
    /// through QueryResult::error; they may also throw, the dispatcher
    /// converts exceptions into errors.
    virtual QueryResult query(const Utterance& utterance, const SessionContext& context) = 0;
};

} // namespace vsp::query
