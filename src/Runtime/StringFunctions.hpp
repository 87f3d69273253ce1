// Line-level string helpers shared by the loader, dispatcher and evaluator
#pragma once

#include <cctype>
#include <string>

namespace minibasic {

// Any control character or space counts as trimmable (covers \r and \t)
inline bool isTrimChar(char c) {
    return static_cast<unsigned char>(c) <= ' ';
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && isTrimChar(s[start])) ++start;
    size_t end = s.size();
    while (end > start && isTrimChar(s[end - 1])) --end;
    return s.substr(start, end - start);
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

inline std::string removeWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

// Leading run of ASCII digits ("30 print 1" -> "30")
inline std::string leadingDigits(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && s[n] >= '0' && s[n] <= '9') ++n;
    return s.substr(0, n);
}

// Drop the line-number label and trim what remains
inline std::string stripLabel(const std::string& line) {
    return trim(line.substr(leadingDigits(line).size()));
}

// Keep only the text before a "//" comment, trimmed
inline std::string stripComment(const std::string& line) {
    size_t idx = line.find("//");
    if (idx == std::string::npos) return line;
    return trim(line.substr(0, idx));
}

} // namespace minibasic
