#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace spiral {

// ASCII-only case helpers. Identifiers outside ASCII are not case-folded.

inline bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

inline bool is_lower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

inline bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

inline bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

inline std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

// Join tokens for log messages: [a, b, c]
template<typename Container>
std::string format_tokens(const Container& tokens) {
    std::string out = "[";
    bool first = true;
    for (const auto& token : tokens) {
        if (!first) out += ", ";
        out += '"';
        out += token;
        out += '"';
        first = false;
    }
    out += "]";
    return out;
}

}  // namespace spiral
