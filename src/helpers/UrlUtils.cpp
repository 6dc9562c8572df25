#include "UrlUtils.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include <fmt/format.h>

std::optional<NUrlUtils::SUrl> NUrlUtils::parse(const std::string& url) {
    SUrl       result;

    const auto SCHEME_END = url.find("://");
    if (SCHEME_END == std::string::npos || SCHEME_END == 0)
        return std::nullopt;

    result.scheme = url.substr(0, SCHEME_END);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), ::tolower);

    if (!std::all_of(result.scheme.begin(), result.scheme.end(), [](const char& c) { return std::isalnum((unsigned char)c) || c == '+' || c == '-' || c == '.'; }))
        return std::nullopt;

    std::string_view rest      = std::string_view{url}.substr(SCHEME_END + 3);
    const auto       AUTH_END  = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, AUTH_END);

    // userinfo is not something we forward anywhere
    if (authority.contains('@'))
        authority = authority.substr(authority.find_last_of('@') + 1);

    if (authority.empty())
        return std::nullopt;

    result.host = std::string{authority};

    if (AUTH_END == std::string_view::npos)
        return result;

    rest = rest.substr(AUTH_END);

    if (const auto HASH = rest.find('#'); HASH != std::string_view::npos) {
        result.fragment = std::string{rest.substr(HASH + 1)};
        rest            = rest.substr(0, HASH);
    }

    if (const auto Q = rest.find('?'); Q != std::string_view::npos) {
        result.query = std::string{rest.substr(Q + 1)};
        rest         = rest.substr(0, Q);
    }

    result.path = std::string{rest};

    return result;
}

std::string NUrlUtils::toString(const SUrl& url) {
    std::string result = fmt::format("{}://{}{}", url.scheme, url.host, url.path);

    if (!url.query.empty())
        result += "?" + url.query;
    if (!url.fragment.empty())
        result += "#" + url.fragment;

    return result;
}

std::string NUrlUtils::destination(const SUrl& url) {
    std::string dest = fmt::format("{}://{}", url.scheme, url.host);
    std::transform(dest.begin(), dest.end(), dest.begin(), ::tolower);
    return dest;
}

NUrlUtils::SUrl NUrlUtils::resolvePath(const SUrl& base, const std::string& absolutePath) {
    SUrl       result = base;

    const auto Q = absolutePath.find('?');

    result.path     = absolutePath.substr(0, Q);
    result.query    = Q == std::string::npos ? "" : absolutePath.substr(Q + 1);
    result.fragment = "";

    return result;
}

static bool shouldEscape(const char& c) {
    return !(std::isalnum((unsigned char)c) || c == '-' || c == '_' || c == '.' || c == '~');
}

std::string NUrlUtils::queryEscape(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    for (const auto& c : s) {
        if (c == ' ')
            result += '+';
        else if (shouldEscape(c))
            result += fmt::format("%{:02X}", (unsigned char)c);
        else
            result += c;
    }

    return result;
}

std::string NUrlUtils::encodeQuery(std::vector<std::pair<std::string, std::string>> params) {
    std::stable_sort(params.begin(), params.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string result;
    for (const auto& [k, v] : params) {
        if (!result.empty())
            result += '&';
        result += queryEscape(k) + "=" + queryEscape(v);
    }

    return result;
}
