#ifndef MLCLI_UTILS_HPP
#define MLCLI_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace mlcli::utils {

inline std::string_view trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

// Candidates sharing the input as a prefix score 0; the rest score by edit distance.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxResults = 3,
                                        std::size_t maxDistance = 2) {
    struct Scored {
        std::string value;
        std::size_t score;
    };

    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        if (!input.empty() && c.rfind(input, 0) == 0) {
            scored.push_back({c, 0});
            continue;
        }
        scored.push_back({c, levenshteinDistance(input, c)});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.value < b.value;
    });

    std::vector<std::string> out;
    out.reserve(maxResults);
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (s.score <= maxDistance) out.push_back(s.value);
    }
    return out;
}

inline std::string formatSuggestions(const std::vector<std::string>& suggestions) {
    if (suggestions.empty()) return {};
    std::string out = "\n\nDid you mean this?\n";
    for (const auto& s : suggestions) out += "  " + s + "\n";
    return out;
}

inline std::vector<std::string> splitPath(std::string_view path, char sep = '.') {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto pos = path.find(sep, start);
        out.emplace_back(pos == std::string_view::npos ? path.substr(start) : path.substr(start, pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

inline std::string joinPath(const std::vector<std::string>& parts, char sep = '.') {
    std::string out;
    for (const auto& p : parts) {
        if (p.empty()) continue;
        if (!out.empty()) out.push_back(sep);
        out += p;
    }
    return out;
}

// "-5", "-0.25", "-1e3": tokens that read as option markers but are plain numbers.
inline bool isNegativeNumber(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool digit = false;
    bool dot = false;
    bool exp = false;
    for (std::size_t i = 1; i < s.size(); ++i) {
        const char ch = s[i];
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            digit = true;
        } else if (ch == '.' && !dot && !exp) {
            dot = true;
        } else if ((ch == 'e' || ch == 'E') && digit && !exp) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            if (i + 1 >= s.size()) return false;
        } else {
            return false;
        }
    }
    return digit;
}

// Splits a full command line into raw tokens.
//
// Whitespace separates tokens except inside quotes ('...' or "...") and inside [ ] / { } groups, which always
// stay one token (nested groups included). A backslash keeps the next character literal. Quotes and
// backslashes are preserved in the token text; the literal parser interprets them.
// Unbalanced groups or quotes yield a MalformedLiteral error.
std::variant<std::vector<std::string>, ParseError> tokenize(std::string_view line);

} // namespace mlcli::utils

#endif // MLCLI_UTILS_HPP
