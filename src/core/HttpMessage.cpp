#include "HttpMessage.hpp"

#include <algorithm>
#include <cctype>

static bool nameEquals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return std::tolower((unsigned char)x) == std::tolower((unsigned char)y); });
}

void CHeaders::add(const std::string& name, const std::string& value) {
    m_headers.emplace_back(name, value);
}

void CHeaders::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&](const SHeader& h) { return nameEquals(h.first, name); });
    if (it == m_headers.end()) {
        add(name, value);
        return;
    }

    it->second = value;

    // drop any later duplicates, set() means a single value
    m_headers.erase(std::remove_if(it + 1, m_headers.end(), [&](const SHeader& h) { return nameEquals(h.first, name); }), m_headers.end());
}

bool CHeaders::remove(const std::string& name) {
    return std::erase_if(m_headers, [&](const SHeader& h) { return nameEquals(h.first, name); }) > 0;
}

bool CHeaders::has(const std::string& name) const {
    return std::any_of(m_headers.begin(), m_headers.end(), [&](const SHeader& h) { return nameEquals(h.first, name); });
}

std::optional<std::string> CHeaders::get(const std::string& name) const {
    for (const auto& h : m_headers) {
        if (nameEquals(h.first, name))
            return h.second;
    }

    return std::nullopt;
}

std::vector<std::string> CHeaders::getAll(const std::string& name) const {
    std::vector<std::string> result;
    for (const auto& h : m_headers) {
        if (nameEquals(h.first, name))
            result.emplace_back(h.second);
    }

    return result;
}

const std::vector<CHeaders::SHeader>& CHeaders::list() const {
    return m_headers;
}

size_t CHeaders::size() const {
    return m_headers.size();
}

bool CHeaders::empty() const {
    return m_headers.empty();
}
