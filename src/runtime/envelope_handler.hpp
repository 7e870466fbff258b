#pragma once

#include <atomic>
#include <memory>
#include "protocol/envelope.hpp"

namespace facetmcp::runtime {

// Answers one decoded envelope with one response envelope. Called from every
// connection thread at once.
class EnvelopeHandler {
public:
    virtual ~EnvelopeHandler() = default;

    virtual protocol::Envelope handle(
        const protocol::Envelope& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const = 0;
};

}  // namespace facetmcp::runtime
