#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace NUrlUtils {
    struct SUrl {
        std::string scheme   = "";
        std::string host     = ""; // authority, port included when present
        std::string path     = "";
        std::string query    = "";
        std::string fragment = "";
    };

    std::optional<SUrl> parse(const std::string& url);
    std::string         toString(const SUrl& url);

    // scheme://host[:port], lowercased. Used as the session key.
    std::string destination(const SUrl& url);

    // resolves an absolute-path reference ("/a/b") against base
    SUrl        resolvePath(const SUrl& base, const std::string& absolutePath);

    std::string queryEscape(const std::string& s);
    std::string encodeQuery(std::vector<std::pair<std::string, std::string>> params);
};
