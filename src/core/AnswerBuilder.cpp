#include "AnswerBuilder.hpp"

#include <fmt/format.h>

#include "../helpers/UrlUtils.hpp"
#include "../debug/log.hpp"

constexpr const char* VERIFICATION_PATH = "/cdn-cgi/l/chk_jschl";

CAnswerBuilder::CAnswerBuilder(bool requireVerificationToken) : m_requireVerificationToken(requireVerificationToken) {
    ;
}

std::string CAnswerBuilder::formatAnswer(double answer) {
    // the endpoint compares the text, not the number
    return fmt::format("{:.10f}", answer);
}

std::expected<SHttpRequest, SError> CAnswerBuilder::build(const SExtractedChallenge& challenge, double answer, const SHttpResponse& originalResponse) const {
    const auto& ORIGINAL = originalResponse.request;
    const auto  BASE     = NUrlUtils::parse(ORIGINAL.url);

    if (!BASE)
        return std::unexpected(SError{ERROR_INVALID_REQUEST, fmt::format("Cannot resolve the verification endpoint against \"{}\"", ORIGINAL.url)});

    if (!challenge.verificationToken && m_requireVerificationToken)
        return std::unexpected(SError{ERROR_MALFORMED, "The challenge page carried no jschl_vc token"});

    auto                                             target = NUrlUtils::resolvePath(*BASE, VERIFICATION_PATH);

    std::vector<std::pair<std::string, std::string>> params;
    if (challenge.verificationToken)
        params.emplace_back("jschl_vc", *challenge.verificationToken);
    if (challenge.passToken)
        params.emplace_back("pass", *challenge.passToken);
    params.emplace_back("jschl_answer", formatAnswer(answer));

    target.query = NUrlUtils::encodeQuery(std::move(params));

    SHttpRequest req;
    req.method = "GET";
    req.url    = NUrlUtils::toString(target);

    for (const auto& [name, value] : ORIGINAL.headers.list()) {
        req.headers.add(name, value);
    }

    req.headers.set("Referer", ORIGINAL.url);

    Debug::log(TRACE, "Answer request: {}", req.url);

    return req;
}
