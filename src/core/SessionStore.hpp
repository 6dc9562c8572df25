#pragma once

#include <string>
#include <vector>
#include <shared_mutex>
#include <unordered_map>

#include <pistache/cookie.h>

// Cookies that each destination (scheme://host[:port]) handed out after a
// solved challenge. Lookups share a lock, updates take it exclusively.
class CSessionStore {
  public:
    std::vector<Pistache::Http::Cookie> cookiesFor(const std::string& url) const;

    // "a=b; c=d", empty if nothing is cached
    std::string cookieHeaderFor(const std::string& url) const;

    // Replaces the destination's cookies with the parsed Set-Cookie values.
    // Returns how many were stored, the cache is untouched when that is 0.
    size_t store(const std::string& url, const std::vector<std::string>& setCookieValues);

    void   clear();
    size_t size() const;

  private:
    mutable std::shared_mutex                                            m_mutex;
    std::unordered_map<std::string, std::vector<Pistache::Http::Cookie>> m_cookies;
};
