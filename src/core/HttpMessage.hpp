#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

// Ordered, case-insensitive header list. Duplicates are kept (Set-Cookie).
class CHeaders {
  public:
    using SHeader = std::pair<std::string, std::string>;

    void                       add(const std::string& name, const std::string& value);
    void                       set(const std::string& name, const std::string& value);
    bool                       remove(const std::string& name);
    bool                       has(const std::string& name) const;

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string>   getAll(const std::string& name) const;

    const std::vector<SHeader>& list() const;
    size_t                      size() const;
    bool                        empty() const;

  private:
    std::vector<SHeader> m_headers;
};

struct SHttpRequest {
    std::string method = "GET";
    std::string url    = "";
    CHeaders    headers;
    std::string body = "";
};

struct SHttpResponse {
    int          code = 0;
    CHeaders     headers;
    std::string  body = "";

    // what was actually sent, after the middleware touched it
    SHttpRequest request;
};
