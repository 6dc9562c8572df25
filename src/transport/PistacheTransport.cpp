#include "PistacheTransport.hpp"

#include <mutex>
#include <algorithm>
#include <condition_variable>
#include <memory>
#include <optional>
#include <sstream>

#include <pistache/http.h>
#include <pistache/cookie.h>

#include "../headers/genericHeader.hpp"
#include "../helpers/UrlUtils.hpp"
#include "../config/Config.hpp"
#include "../debug/log.hpp"

static std::optional<Pistache::Http::Method> methodFromString(const std::string& m) {
    if (m == "GET")
        return Pistache::Http::Method::Get;
    if (m == "POST")
        return Pistache::Http::Method::Post;
    if (m == "PUT")
        return Pistache::Http::Method::Put;
    if (m == "PATCH")
        return Pistache::Http::Method::Patch;
    if (m == "DELETE")
        return Pistache::Http::Method::Delete;
    if (m == "HEAD")
        return Pistache::Http::Method::Head;
    if (m == "OPTIONS")
        return Pistache::Http::Method::Options;
    return std::nullopt;
}

// "a=b; c=d" -> cookies
static std::vector<Pistache::Http::Cookie> splitCookieHeader(const std::string& header) {
    std::vector<Pistache::Http::Cookie> cookies;

    size_t                              begin = 0;
    while (begin < header.size()) {
        auto end = header.find(';', begin);
        if (end == std::string::npos)
            end = header.size();

        std::string pair = header.substr(begin, end - begin);
        begin            = end + 1;

        const auto FIRST = pair.find_first_not_of(' ');
        if (FIRST == std::string::npos)
            continue;
        pair = pair.substr(FIRST);

        const auto EQ = pair.find('=');
        if (EQ == std::string::npos || EQ == 0)
            continue;

        cookies.emplace_back(pair.substr(0, EQ), pair.substr(EQ + 1));
    }

    return cookies;
}

SPistacheTransportOptions SPistacheTransportOptions::fromConfig() {
    SPistacheTransportOptions opts;

    if (!g_pConfig)
        return opts;

    opts.threads         = g_pConfig->m_config.client_threads;
    opts.maxResponseSize = g_pConfig->m_config.max_response_size;
    opts.timeout         = std::chrono::seconds(g_pConfig->m_config.transport_timeout_sec);
    return opts;
}

CPistacheTransport::CPistacheTransport(SPistacheTransportOptions options) : m_options(options) {
    m_client.init(Pistache::Http::Experimental::Client::options()
                      .maxConnectionsPerHost(m_options.maxConnectionsPerHost)
                      .maxResponseSize(m_options.maxResponseSize)
                      .threads(m_options.threads));
}

CPistacheTransport::~CPistacheTransport() {
    m_client.shutdown();
}

std::expected<SHttpResponse, SError> CPistacheTransport::roundTrip(const SHttpRequest& req) {
    const auto URL = NUrlUtils::parse(req.url);
    if (!URL)
        return std::unexpected(SError{ERROR_INVALID_REQUEST, fmt::format("Invalid url \"{}\"", req.url)});

    if (URL->scheme != "http")
        return std::unexpected(SError{ERROR_TRANSPORT, fmt::format("Scheme {} is not supported by the pistache transport", URL->scheme)});

    const auto METHOD = methodFromString(req.method);
    if (!METHOD)
        return std::unexpected(SError{ERROR_INVALID_REQUEST, fmt::format("Unsupported method {}", req.method)});

    // fragments never go on the wire
    auto wireUrl     = *URL;
    wireUrl.fragment = "";

    Debug::log(TRACE, "Method ({}): Sending to {}", req.method, NUrlUtils::toString(wireUrl));

    auto builder = m_client.prepareRequest(NUrlUtils::toString(wireUrl), *METHOD);
    builder.body(req.body);

    for (const auto& [name, value] : req.headers.list()) {
        std::string lowerName = name;
        std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(), ::tolower);

        if (lowerName == "host" || lowerName == "content-length" || lowerName == "connection") {
            Debug::log(TRACE, "Header out: {}: {} (DROPPED)", name, value);
            continue;
        }

        if (lowerName == "cookie") {
            for (const auto& c : splitCookieHeader(value)) {
                builder.cookie(c);
            }
            Debug::log(TRACE, "Header out: Cookie: {}", value);
            continue;
        }

        Debug::log(TRACE, "Header out: {}: {}", name, value);

        if (lowerName == "user-agent")
            builder.header(std::make_shared<Pistache::Http::Header::UserAgent>(value));
        else
            builder.header(std::make_shared<CGenericHeader>(name, value));
    }
    builder.header(std::make_shared<Pistache::Http::Header::Connection>(Pistache::Http::ConnectionControl::KeepAlive));

    builder.timeout(m_options.timeout);

    struct SRoundTripState {
        std::mutex                                          mtx;
        std::condition_variable                             cv;
        std::optional<std::expected<SHttpResponse, SError>> result;
    };

    // the callbacks can outlive this frame when the wait times out
    auto state = std::make_shared<SRoundTripState>();

    auto resp  = builder.send();
    resp.then(
        [state, req](Pistache::Http::Response resp) {
            SHttpResponse result;
            result.code    = (int)resp.code();
            result.body    = resp.body();
            result.request = req;

            for (const auto& h : resp.headers().list()) {
                std::stringstream ss;
                h->write(ss);
                Debug::log(TRACE, "Header in: {}: {}", h->name(), ss.str());
                result.headers.add(h->name(), ss.str());
            }

            for (const auto& [name, raw] : resp.headers().rawList()) {
                Debug::log(TRACE, "Header in: {}: {}", raw.name(), raw.value());
                result.headers.add(raw.name(), raw.value());
            }

            for (auto it = resp.cookies().begin(); it != resp.cookies().end(); ++it) {
                std::stringstream ss;
                ss << *it;
                Debug::log(TRACE, "Header in: Set-Cookie: {}", ss.str());
                result.headers.add("Set-Cookie", ss.str());
            }

            {
                std::lock_guard<std::mutex> lg(state->mtx);
                state->result = std::move(result);
            }
            state->cv.notify_all();
        },
        [state](std::exception_ptr eptr) {
            std::string what;
            try {
                std::rethrow_exception(eptr);
            } catch (std::exception& e) { what = e.what(); } catch (const std::string& e) {
                what = e;
            } catch (const char* e) { what = e; } catch (...) {
                what = "unknown exception";
            }

            {
                std::lock_guard<std::mutex> lg(state->mtx);
                state->result = std::unexpected(SError{ERROR_TRANSPORT, fmt::format("Request failed: {}", what)});
            }
            state->cv.notify_all();
        });

    std::unique_lock<std::mutex> lk(state->mtx);
    if (!state->cv.wait_for(lk, m_options.timeout, [&state]() { return state->result.has_value(); }))
        return std::unexpected(SError{ERROR_TRANSPORT, fmt::format("Request to {} timed out after {}s", NUrlUtils::destination(*URL), m_options.timeout.count())});

    return std::move(*state->result);
}
