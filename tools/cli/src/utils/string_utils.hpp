/**
 * @file string_utils.hpp
 * @brief String helpers for argument parsing
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace agentwatch::cli::utils {

inline std::string to_lower(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

/**
 * @brief Strip spaces, tabs and line breaks at both ends
 */
inline std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    size_t first = text.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(blanks) - first + 1);
}

/**
 * @brief Tokens between delimiters, trimmed; blank tokens are skipped
 *
 * "4096, ,4097" -> {"4096", "4097"}
 */
inline std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> tokens;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = std::min(text.find(delimiter, begin), text.size());
        std::string token = trim(text.substr(begin, end - begin));
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
        begin = end + 1;
    }
    return tokens;
}

/**
 * @brief "--name=value" -> {"--name", "value"}; anything else -> {arg, ""}
 */
inline std::pair<std::string, std::string> split_option(const std::string& arg) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos || arg.rfind("--", 0) != 0) {
        return {arg, ""};
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

} // namespace agentwatch::cli::utils
