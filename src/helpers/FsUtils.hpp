#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    bool                                    isAbsolute(const std::string& path);
    std::expected<std::string, std::string> readFileAsString(const std::string& path);
    std::expected<void, std::string>        writeFile(const std::string& path, const std::string& content);
};
