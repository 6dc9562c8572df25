#include "Interceptor.hpp"
#include "AnswerBuilder.hpp"
#include "../sandbox/SandboxEvaluator.hpp"
#include "../helpers/UrlUtils.hpp"
#include "../logging/TrafficLogger.hpp"
#include "../config/Config.hpp"
#include "../debug/log.hpp"

#include <thread>
#include <stdexcept>

constexpr const int   CHALLENGE_STATUS_CODE  = 503;
constexpr const char* CHALLENGE_SERVER_VENDOR = "cloudflare";

static void logTraffic(const SHttpRequest& req, int status, eTrafficAction action) {
    if (g_pTrafficLogger)
        g_pTrafficLogger->logTraffic(req, status, action);
}

SInterceptorOptions SInterceptorOptions::fromConfig() {
    SInterceptorOptions opts;
    opts.userAgent = DEFAULT_USER_AGENT;

    if (!g_pConfig)
        return opts;

    const auto& CFG               = g_pConfig->m_config;
    opts.userAgent                = CFG.user_agent.empty() ? DEFAULT_USER_AGENT : CFG.user_agent;
    opts.challengeDelay           = std::chrono::milliseconds(CFG.challenge_delay_ms);
    opts.evaluationTimeout        = std::chrono::milliseconds(CFG.evaluation_timeout_ms);
    opts.requireVerificationToken = CFG.strict_verification_token;
    return opts;
}

CInterceptor::CInterceptor(std::shared_ptr<ITransport> upstream, SInterceptorOptions options, std::unique_ptr<IChallengeExtractor> extractor) :
    m_upstream(std::move(upstream)), m_extractor(std::move(extractor)), m_options(std::move(options)) {
    if (!m_upstream)
        throw std::invalid_argument("CInterceptor needs an upstream transport");
    if (!m_extractor)
        throw std::invalid_argument("CInterceptor needs a challenge extractor");

    if (m_options.userAgent.empty())
        m_options.userAgent = DEFAULT_USER_AGENT;

    m_sleep = [](std::chrono::milliseconds ms) { std::this_thread::sleep_for(ms); };
}

bool CInterceptor::isChallenge(const SHttpResponse& resp) {
    if (resp.code != CHALLENGE_STATUS_CODE)
        return false;

    const auto SERVER = resp.headers.get("Server");
    return SERVER && SERVER->starts_with(CHALLENGE_SERVER_VENDOR);
}

const CSessionStore& CInterceptor::session() const {
    return m_session;
}

void CInterceptor::setSleepFunction(std::function<void(std::chrono::milliseconds)> fn) {
    m_sleep = std::move(fn);
}

std::expected<SHttpResponse, SError> CInterceptor::roundTrip(const SHttpRequest& req) {
    return handle(req);
}

std::expected<SHttpResponse, SError> CInterceptor::handle(SHttpRequest req) {
    if (!NUrlUtils::parse(req.url))
        return std::unexpected(SError{ERROR_INVALID_REQUEST, fmt::format("Invalid url \"{}\"", req.url)});

    if (req.headers.get("User-Agent").value_or("").empty())
        req.headers.set("User-Agent", m_options.userAgent);

    // cookies from a previously solved challenge
    if (const auto CACHED = m_session.cookieHeaderFor(req.url); !CACHED.empty()) {
        const auto EXISTING = req.headers.get("Cookie");
        req.headers.set("Cookie", EXISTING && !EXISTING->empty() ? *EXISTING + "; " + CACHED : CACHED);
        Debug::log(TRACE, " | Attaching cached cookies: {}", CACHED);
    }

    Debug::log(LOG, "New request: {} {}", req.method, req.url);

    auto resp = m_upstream->roundTrip(req);
    if (!resp) {
        Debug::log(ERR, " | Transport failed: {}", resp.error().message);
        logTraffic(req, 0, TRAFFIC_ACTION_FAILED);
        return resp;
    }

    resp->request = req;

    if (!isChallenge(*resp)) {
        Debug::log(TRACE, " | Action: PASS ({})", resp->code);
        logTraffic(req, resp->code, TRAFFIC_ACTION_PASS);
        return resp;
    }

    Debug::log(LOG, " | Action: CHALLENGE (server: {})", resp->headers.get("Server").value_or(""));
    logTraffic(req, resp->code, TRAFFIC_ACTION_CHALLENGE);

    auto solved = solve(*resp);
    if (!solved) {
        Debug::log(ERR, " | Challenge failed ({}): {}", errorKindToString(solved.error().kind), solved.error().message);
        logTraffic(req, resp->code, TRAFFIC_ACTION_FAILED);
        return solved;
    }

    Debug::log(LOG, " | Action: SOLVED ({})", solved->code);
    logTraffic(req, solved->code, TRAFFIC_ACTION_SOLVED);

    return solved;
}

std::expected<SHttpResponse, SError> CInterceptor::solve(const SHttpResponse& challengeResponse) {
    const auto URL = NUrlUtils::parse(challengeResponse.request.url);
    if (!URL)
        return std::unexpected(SError{ERROR_INVALID_REQUEST, fmt::format("Invalid url \"{}\"", challengeResponse.request.url)});

    const auto CHALLENGE = m_extractor->extract(challengeResponse.body, URL->host);
    if (!CHALLENGE)
        return std::unexpected(CHALLENGE.error());

    const auto ANSWER = CSandboxEvaluator::evaluate(CHALLENGE->script, m_options.evaluationTimeout);
    if (!ANSWER)
        return std::unexpected(ANSWER.error());

    const auto ANSWER_REQUEST = CAnswerBuilder(m_options.requireVerificationToken).build(*CHALLENGE, *ANSWER, challengeResponse);
    if (!ANSWER_REQUEST)
        return std::unexpected(ANSWER_REQUEST.error());

    Debug::log(LOG, " | Answer {}, submitting in {}ms", CAnswerBuilder::formatAnswer(*ANSWER), m_options.challengeDelay.count());

    m_sleep(m_options.challengeDelay);

    auto resp = m_upstream->roundTrip(*ANSWER_REQUEST);
    if (!resp)
        return resp;

    resp->request = *ANSWER_REQUEST;

    if (const auto COOKIES = resp->headers.getAll("Set-Cookie"); !COOKIES.empty())
        m_session.store(ANSWER_REQUEST->url, COOKIES);

    return resp;
}
