#ifndef MLCLI_LITERAL_PARSER_HPP
#define MLCLI_LITERAL_PARSER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"
#include "type_spec.hpp"
#include "value.hpp"

namespace mlcli {

struct LiteralMatch {
    Value value;
    // Raw tokens the literal touched, the starting token included.
    std::size_t tokensConsumed{1};
};

// Parses literal text against a TypeSpec.
//
// Grammar:
//   value  := scalar | array | struct
//   array  := '[' [ value (',' value)* ] ']'
//   struct := '{' [ field (',' field)* ] '}'
//   field  := identifier ('=' | ':') value
//
// Compound literals are read as one character stream across raw tokens while a bracket or brace is
// open (each token boundary reads as a single space), so `[1,` `2]` is the same literal as `[1, 2]`.
// A top-level scalar always covers exactly one token. Nesting is handled with an explicit frame stack,
// so depth is limited by input size only.
class LiteralParser {
public:
    explicit LiteralParser(const TypeSpec& spec) : spec_(spec) {}

    // Parses starting at `tokens[tokenIndex]`, `offset` characters in. Error positions are absolute
    // token indexes into `tokens`.
    [[nodiscard]] std::variant<LiteralMatch, ParseError> parse(const std::vector<std::string>& tokens,
                                                               std::size_t tokenIndex,
                                                               std::size_t offset = 0) const;

    // Parses a single piece of text (which may itself contain whitespace).
    [[nodiscard]] std::variant<Value, ParseError> parseText(std::string_view text) const;

private:
    const TypeSpec& spec_;
};

inline std::variant<Value, ParseError> parseLiteral(std::string_view text, const TypeSpec& spec) {
    return LiteralParser(spec).parseText(text);
}

} // namespace mlcli

#endif // MLCLI_LITERAL_PARSER_HPP
