#include "ChallengeExtractor.hpp"

#include <string_view>

#include <re2/re2.h>

#include "../debug/log.hpp"

constexpr const char* DOMAIN_LENGTH_PLACEHOLDER = "t.length";

static const re2::RE2& scriptRegex() {
    static const re2::RE2 RE(R"(setTimeout\(function\(\)\{\s+(var s,t,o,p,b,r,e,a,k,i,n,g,f.+?\r?\n[\s\S]+?a\.value =.+?)\r?\n)");
    return RE;
}

static const re2::RE2& answerLineRegex() {
    static const re2::RE2 RE(R"(a\.value = (.+ \+ t\.length).+)");
    return RE;
}

static const re2::RE2& mutationLineRegex() {
    static const re2::RE2 RE(R"(\s{3,}[a-z](?: = |\.).+)");
    return RE;
}

static const re2::RE2& unsafeCharsRegex() {
    static const re2::RE2 RE(R"([\n\\'])");
    return RE;
}

static const re2::RE2& verificationTokenRegex() {
    static const re2::RE2 RE(R"re(name="jschl_vc" value="(\w+)")re");
    return RE;
}

static const re2::RE2& passTokenRegex() {
    static const re2::RE2 RE(R"re(name="pass" value="(.+?)")re");
    return RE;
}

std::string CIUAMExtractor::sanitize(std::string script, const std::string& destinationHost) {
    // keep only the arithmetic on the answer line
    re2::RE2::GlobalReplace(&script, answerLineRegex(), R"(\1)");

    re2::RE2::GlobalReplace(&script, mutationLineRegex(), "");

    const auto LENGTH = std::to_string(destinationHost.length());
    size_t     pos    = 0;
    while ((pos = script.find(DOMAIN_LENGTH_PLACEHOLDER, pos)) != std::string::npos) {
        script.replace(pos, std::string_view{DOMAIN_LENGTH_PLACEHOLDER}.length(), LENGTH);
        pos += LENGTH.length();
    }

    // nothing in the arithmetic uses these, and they are how one would leave a string context
    re2::RE2::GlobalReplace(&script, unsafeCharsRegex(), "");

    return script;
}

std::expected<SExtractedChallenge, SError> CIUAMExtractor::extract(const std::string& body, const std::string& destinationHost) const {
    std::string raw;
    if (!re2::RE2::PartialMatch(body, scriptRegex(), &raw))
        return std::unexpected(SError{ERROR_NOT_FOUND, "Unable to identify the IUAM challenge script on the page"});

    SExtractedChallenge challenge;
    challenge.script = sanitize(std::move(raw), destinationHost);

    std::string token;
    if (re2::RE2::PartialMatch(body, verificationTokenRegex(), &token))
        challenge.verificationToken = token;
    else
        Debug::log(WARN, "Challenge page for {} has no jschl_vc field", destinationHost);

    if (re2::RE2::PartialMatch(body, passTokenRegex(), &token))
        challenge.passToken = token;

    Debug::log(TRACE, "Extracted challenge script for {}: {}", destinationHost, challenge.script);

    return challenge;
}
