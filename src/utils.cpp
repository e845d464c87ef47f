#include "mlcli/utils.hpp"

namespace mlcli::utils {

std::variant<std::vector<std::string>, ParseError> tokenize(std::string_view line) {
    struct Open {
        char closer;
        std::size_t pos;
    };

    std::vector<std::string> tokens;
    std::vector<Open> groups;
    std::string cur;
    bool inToken = false;
    bool escape = false;
    char quote = 0;
    std::size_t quotePos = 0;
    std::size_t tokenStart = 0;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!inToken) {
            if (space) continue;
            inToken = true;
            tokenStart = i;
        }

        if (escape) {
            cur.push_back(c);
            escape = false;
            continue;
        }
        if (c == '\\') {
            cur.push_back(c);
            escape = true;
            continue;
        }
        if (quote != 0) {
            cur.push_back(c);
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            quotePos = i;
            cur.push_back(c);
            continue;
        }
        if (c == '[' || c == '{') {
            groups.push_back(Open{c == '[' ? ']' : '}', i});
            cur.push_back(c);
            continue;
        }
        if (!groups.empty() && c == groups.back().closer) {
            groups.pop_back();
            cur.push_back(c);
            continue;
        }
        if (space && groups.empty()) {
            tokens.push_back(std::move(cur));
            cur.clear();
            inToken = false;
            continue;
        }
        cur.push_back(c);
    }

    if (quote != 0) {
        ParseError err;
        err.code = ErrorCode::MalformedLiteral;
        err.message = std::string("unterminated quote ") + quote;
        err.tokenIndex = tokens.size();
        err.offset = quotePos - tokenStart;
        err.expected = std::string("'") + quote + "'";
        return err;
    }
    if (!groups.empty()) {
        const auto& open = groups.back();
        ParseError err;
        err.code = ErrorCode::MalformedLiteral;
        err.message = std::string("unterminated '") + (open.closer == ']' ? '[' : '{') + "'";
        err.tokenIndex = tokens.size();
        err.offset = open.pos - tokenStart;
        err.expected = std::string("'") + open.closer + "'";
        return err;
    }
    if (inToken) tokens.push_back(std::move(cur));
    return tokens;
}

} // namespace mlcli::utils
