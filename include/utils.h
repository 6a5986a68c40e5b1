#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace interview_coach {

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
 * @brief Normalize string to lowercase (ASCII only; UTF-8 bytes pass through)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

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
 * @brief Replace ASCII punctuation with spaces so words can be matched on boundaries
 */
inline std::string strip_punctuation(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        if (std::ispunct(static_cast<unsigned char>(c)) && c != '\'') {
            c = ' ';
        }
    }
    return result;
}

/**
 * @brief Split on whitespace, dropping empty tokens
 */
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::string current;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

/**
 * @brief Whole-word match of a (possibly multi-word) phrase inside already-normalized text
 */
inline bool contains_phrase(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return false;
    size_t pos = text.find(phrase);
    while (pos != std::string::npos) {
        bool word_start = (pos == 0 || std::isspace(static_cast<unsigned char>(text[pos - 1])));
        size_t end = pos + phrase.length();
        bool word_end = (end == text.length() || std::isspace(static_cast<unsigned char>(text[end])));
        if (word_start && word_end) return true;
        pos = text.find(phrase, pos + 1);
    }
    return false;
}

/**
 * @brief Truncate to at most max_chars UTF-8 code points
 */
inline std::string truncate_utf8(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) return str.substr(0, i);
            ++chars;
        }
    }
    return str;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace utils

} // namespace interview_coach
