#pragma once

#include <expected>

#include "HttpMessage.hpp"
#include "Error.hpp"

// Sends one request and returns one response. Implementations must be safe to
// call from several threads at once.
class ITransport {
  public:
    virtual ~ITransport() = default;

    virtual std::expected<SHttpResponse, SError> roundTrip(const SHttpRequest& req) = 0;
};
