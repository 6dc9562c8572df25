#pragma once

#include <string>
#include <optional>
#include <expected>

#include "Error.hpp"

struct SExtractedChallenge {
    std::string                script = "";
    std::optional<std::string> verificationToken;
    std::optional<std::string> passToken;
};

// Pulls the arithmetic program and the form tokens out of an interstitial page.
// Failing with ERROR_NOT_FOUND means the page is not a challenge we can solve.
class IChallengeExtractor {
  public:
    virtual ~IChallengeExtractor() = default;

    virtual std::expected<SExtractedChallenge, SError> extract(const std::string& body, const std::string& destinationHost) const = 0;
};

// Cloudflare "I'm Under Attack Mode" setTimeout() variant.
class CIUAMExtractor : public IChallengeExtractor {
  public:
    std::expected<SExtractedChallenge, SError> extract(const std::string& body, const std::string& destinationHost) const override;

    static std::string                         sanitize(std::string script, const std::string& destinationHost);
};
