#pragma once

#include <expected>

#include "HttpMessage.hpp"
#include "ChallengeExtractor.hpp"
#include "Error.hpp"

class CAnswerBuilder {
  public:
    CAnswerBuilder(bool requireVerificationToken = true);

    // Builds the GET to the verification endpoint of the host that served
    // originalResponse. Fails with ERROR_MALFORMED when the page had no
    // jschl_vc and the token is required.
    std::expected<SHttpRequest, SError> build(const SExtractedChallenge& challenge, double answer, const SHttpResponse& originalResponse) const;

    static std::string                  formatAnswer(double answer);

  private:
    bool m_requireVerificationToken = true;
};
