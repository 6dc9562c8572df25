#include "SessionStore.hpp"

#include <mutex>

#include "../helpers/UrlUtils.hpp"
#include "../debug/log.hpp"

static std::string destinationFor(const std::string& url) {
    const auto PARSED = NUrlUtils::parse(url);
    return PARSED ? NUrlUtils::destination(*PARSED) : "";
}

std::vector<Pistache::Http::Cookie> CSessionStore::cookiesFor(const std::string& url) const {
    const auto                          DEST = destinationFor(url);

    std::shared_lock<std::shared_mutex> lk(m_mutex);

    const auto                          IT = m_cookies.find(DEST);
    if (IT == m_cookies.end())
        return {};

    return IT->second;
}

std::string CSessionStore::cookieHeaderFor(const std::string& url) const {
    std::string result;

    for (const auto& c : cookiesFor(url)) {
        if (!result.empty())
            result += "; ";
        result += c.name + "=" + c.value;
    }

    return result;
}

size_t CSessionStore::store(const std::string& url, const std::vector<std::string>& setCookieValues) {
    const auto DEST = destinationFor(url);
    if (DEST.empty()) {
        Debug::log(WARN, "Not storing cookies for unparseable url {}", url);
        return 0;
    }

    std::vector<Pistache::Http::Cookie> parsed;
    for (const auto& raw : setCookieValues) {
        try {
            auto cookie = Pistache::Http::Cookie::fromString(raw);

            if (cookie.maxAge.has_value() && *cookie.maxAge <= 0) {
                Debug::log(TRACE, "Cookie {} for {} is already expired, skipping", cookie.name, DEST);
                continue;
            }

            parsed.emplace_back(std::move(cookie));
        } catch (std::exception& e) { Debug::log(WARN, "Ignoring malformed Set-Cookie from {}: {} ({})", DEST, raw, e.what()); }
    }

    if (parsed.empty())
        return 0;

    const size_t STORED = parsed.size();

    {
        std::unique_lock<std::shared_mutex> lk(m_mutex);
        m_cookies[DEST] = std::move(parsed);
    }

    Debug::log(LOG, "Stored {} cookie(s) for {}", STORED, DEST);

    return STORED;
}

void CSessionStore::clear() {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    m_cookies.clear();
}

size_t CSessionStore::size() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_cookies.size();
}
