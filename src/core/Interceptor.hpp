#pragma once

#include <memory>
#include <chrono>
#include <expected>
#include <string>
#include <functional>

#include "Transport.hpp"
#include "ChallengeExtractor.hpp"
#include "SessionStore.hpp"
#include "HttpMessage.hpp"
#include "Error.hpp"

struct SInterceptorOptions {
    std::string               userAgent                = "";
    std::chrono::milliseconds challengeDelay           = std::chrono::seconds(5);
    std::chrono::milliseconds evaluationTimeout        = std::chrono::seconds(5);
    bool                      requireVerificationToken = true;

    static SInterceptorOptions fromConfig();
};

// Wraps a transport. Requests that come back as a cloudflare IUAM challenge are
// solved and replayed once; everything else passes through untouched.
class CInterceptor : public ITransport {
  public:
    CInterceptor(std::shared_ptr<ITransport> upstream, SInterceptorOptions options = SInterceptorOptions::fromConfig(),
                 std::unique_ptr<IChallengeExtractor> extractor = std::make_unique<CIUAMExtractor>());

    std::expected<SHttpResponse, SError> handle(SHttpRequest req);

    std::expected<SHttpResponse, SError> roundTrip(const SHttpRequest& req) override;

    static bool                          isChallenge(const SHttpResponse& resp);

    const CSessionStore&                 session() const;

    // swaps the pre-submission sleep, for tests
    void setSleepFunction(std::function<void(std::chrono::milliseconds)> fn);

  private:
    std::expected<SHttpResponse, SError>           solve(const SHttpResponse& challengeResponse);

    std::shared_ptr<ITransport>                     m_upstream;
    std::unique_ptr<IChallengeExtractor>            m_extractor;
    SInterceptorOptions                             m_options;
    CSessionStore                                   m_session;
    std::function<void(std::chrono::milliseconds)> m_sleep;
};
