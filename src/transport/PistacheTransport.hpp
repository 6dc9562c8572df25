#pragma once

#include <chrono>

#include "../core/Transport.hpp"

#include <pistache/client.h>

struct SPistacheTransportOptions {
    int                  threads               = 4;
    int                  maxConnectionsPerHost = 32;
    size_t               maxResponseSize       = 10000000;
    std::chrono::seconds timeout               = std::chrono::seconds(120);

    static SPistacheTransportOptions fromConfig();
};

// Plain-http transport on top of the Pistache client. https is not something
// the Pistache client speaks, such requests fail with ERROR_TRANSPORT.
class CPistacheTransport : public ITransport {
  public:
    CPistacheTransport(SPistacheTransportOptions options = SPistacheTransportOptions::fromConfig());
    ~CPistacheTransport();

    std::expected<SHttpResponse, SError> roundTrip(const SHttpRequest& req) override;

  private:
    SPistacheTransportOptions            m_options;
    Pistache::Http::Experimental::Client m_client;
};
