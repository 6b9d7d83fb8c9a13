#pragma once

#include "common.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace parley {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (modified in place)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

/**
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Keep only the ASCII letters of a word, lowercased
 *
 * "What's" -> "whats", "PM2.5" -> "pm", "42" -> "".
 */
inline std::string to_letters(const std::string& word) {
    std::string result;
    result.reserve(word.size());
    for (unsigned char c : word) {
        char lower = static_cast<char>(std::tolower(c));
        if (lower >= 'a' && lower <= 'z') {
            result += lower;
        }
    }
    return result;
}

/**
 * @brief Letters-only, lowercase projection of each token's element
 */
inline std::vector<std::string> words_of(const Tokens& tokens) {
    std::vector<std::string> words;
    words.reserve(tokens.size());
    for (const auto& token : tokens) {
        words.push_back(to_letters(token.element));
    }
    return words;
}

/**
 * @brief Split a line on whitespace into tokens (empty line gives no tokens)
 */
inline Tokens tokenize(const std::string& line) {
    Tokens tokens;
    std::istringstream iss(line);
    std::string element;
    while (iss >> element) {
        tokens.emplace_back(element);
    }
    return tokens;
}

/**
 * @brief Join strings with a separator
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

/**
 * @brief Join the original text of a token range with single spaces
 */
inline std::string join_elements(Tokens::const_iterator begin, Tokens::const_iterator end) {
    std::string result;
    for (auto it = begin; it != end; ++it) {
        if (!result.empty()) result += ' ';
        result += it->element;
    }
    return result;
}

/**
 * @brief Render words for log messages, e.g. [hey, computer, lights]
 */
inline std::string describe(const std::vector<std::string>& words) {
    return "[" + join(words, ", ") + "]";
}

} // namespace utils

} // namespace parley
