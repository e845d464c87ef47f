#include "mlcli/literal_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

#include "mlcli/utils.hpp"

namespace mlcli {

namespace {

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool isKeyChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-'; }

std::string quoted(char c) { return std::string("'") + c + "'"; }

// Walks the characters of consecutive tokens; the gap between two tokens reads as one space.
class Cursor {
public:
    Cursor(const std::vector<std::string>& tokens, std::size_t token, std::size_t offset)
        : tokens_(tokens), token_(token), offset_(offset) {}

    [[nodiscard]] bool atTokenEnd() const { return offset_ >= tokens_[token_].size(); }
    [[nodiscard]] bool atEnd() const { return atTokenEnd() && token_ + 1 >= tokens_.size(); }
    [[nodiscard]] char peek() const { return atTokenEnd() ? ' ' : tokens_[token_][offset_]; }
    [[nodiscard]] std::size_t token() const { return token_; }
    [[nodiscard]] std::size_t offset() const { return offset_; }

    void advance() {
        if (atTokenEnd()) {
            ++token_;
            offset_ = 0;
            return;
        }
        ++offset_;
    }

    void skipSpace() {
        while (!atEnd() && isSpace(peek())) advance();
    }

    void skipSpaceInToken() {
        while (!atTokenEnd() && isSpace(peek())) advance();
    }

private:
    const std::vector<std::string>& tokens_;
    std::size_t token_;
    std::size_t offset_;
};

class Reader {
public:
    Reader(const TypeSpec& spec, const std::vector<std::string>& tokens, std::size_t token, std::size_t offset)
        : spec_(spec), tokens_(tokens), cur_(tokens, token, offset) {}

    std::variant<LiteralMatch, ParseError> run();

private:
    struct Frame {
        const TypeSpec* spec;
        char closer;
        std::size_t openToken;
        std::size_t openOffset;
        Array items;
        Struct fields;
        std::string key;
    };

    static ParseError error(ErrorCode code, std::string message, std::size_t token, std::size_t offset, std::string expected) {
        ParseError err;
        err.code = code;
        err.message = std::move(message);
        err.tokenIndex = token;
        err.offset = offset;
        err.expected = std::move(expected);
        return err;
    }

    ParseError errorHere(ErrorCode code, std::string message, std::string expected) const {
        return error(code, std::move(message), cur_.token(), cur_.offset(), std::move(expected));
    }

    static ParseError unterminated(const Frame& f) {
        const char opener = f.closer == ']' ? '[' : '{';
        return error(ErrorCode::MalformedLiteral,
                     "unterminated " + quoted(opener) + " in " + f.spec->name() + " literal",
                     f.openToken,
                     f.openOffset,
                     quoted(f.closer));
    }

    std::variant<Value, ParseError> coerce(const TypeSpec& spec, std::string_view text, std::size_t token, std::size_t offset) const;
    std::optional<ParseError> readScalar(const TypeSpec& spec, Value& out);
    std::variant<LiteralMatch, ParseError> readLoneScalar() const;
    std::optional<ParseError> readKey(const TypeSpec*& want);
    std::optional<ParseError> closeFrame(Value& out);

    const TypeSpec& spec_;
    const std::vector<std::string>& tokens_;
    Cursor cur_;
    std::vector<Frame> stack_;
};

std::variant<Value, ParseError> Reader::coerce(const TypeSpec& spec,
                                               std::string_view text,
                                               std::size_t token,
                                               std::size_t offset) const {
    const Coercion* c = spec.coercion() ? &spec.coercion() : builtinScalars().find(spec.scalarKind());
    if (!c) {
        return error(ErrorCode::InvalidValue, "unknown scalar kind \"" + spec.scalarKind() + "\"", token, offset, spec.name());
    }
    auto result = (*c)(text);
    if (auto* reason = std::get_if<std::string>(&result)) {
        return error(ErrorCode::InvalidValue,
                     "invalid value \"" + std::string(text) + "\" for " + spec.name() + ": " + *reason,
                     token,
                     offset,
                     spec.name());
    }
    return std::get<Value>(std::move(result));
}

std::optional<ParseError> Reader::readScalar(const TypeSpec& spec, Value& out) {
    const std::size_t token = cur_.token();
    const std::size_t offset = cur_.offset();
    const char first = cur_.peek();
    if (first == '[' || first == '{') {
        return errorHere(ErrorCode::InvalidValue, "expected " + spec.name() + ", found " + quoted(first), spec.name());
    }

    std::string raw;
    const bool isQuoted = first == '"' || first == '\'';
    if (isQuoted) {
        cur_.advance();
        bool closed = false;
        while (!cur_.atEnd()) {
            const char c = cur_.peek();
            if (c == '\\') {
                cur_.advance();
                if (cur_.atEnd()) break;
                raw.push_back(cur_.peek());
                cur_.advance();
                continue;
            }
            if (c == first) {
                cur_.advance();
                closed = true;
                break;
            }
            raw.push_back(c);
            cur_.advance();
        }
        if (!closed) return error(ErrorCode::MalformedLiteral, "unterminated quote", token, offset, quoted(first));
    } else {
        while (!cur_.atEnd()) {
            const char c = cur_.peek();
            if (c == ',' || c == '[' || c == ']' || c == '{' || c == '}') break;
            if (c == '\\') {
                cur_.advance();
                if (cur_.atEnd()) break;
                raw.push_back(cur_.peek());
                cur_.advance();
                continue;
            }
            raw.push_back(c);
            cur_.advance();
        }
        if (utils::trim(raw).empty()) return error(ErrorCode::MalformedLiteral, "expected a value", token, offset, spec.name());
    }

    // Quoted text is taken verbatim.
    auto value = coerce(spec, isQuoted ? std::string_view(raw) : utils::trim(raw), token, offset);
    if (auto* err = std::get_if<ParseError>(&value)) return std::move(*err);
    out = std::get<Value>(std::move(value));
    return std::nullopt;
}

// A scalar standing alone owns the rest of its token. Quoted text runs to the closing quote and is kept as
// written; bare text is trimmed. Backslash escapes are resolved in both.
std::variant<LiteralMatch, ParseError> Reader::readLoneScalar() const {
    const std::size_t token = cur_.token();
    const std::string& tok = tokens_[token];
    std::size_t i = std::min(cur_.offset(), tok.size());
    while (i < tok.size() && isSpace(tok[i])) ++i;
    const std::size_t start = i;

    std::string text;
    if (i < tok.size() && (tok[i] == '"' || tok[i] == '\'')) {
        const char quote = tok[i++];
        bool closed = false;
        for (; i < tok.size(); ++i) {
            if (tok[i] == '\\' && i + 1 < tok.size()) {
                text.push_back(tok[++i]);
                continue;
            }
            if (tok[i] == quote) {
                closed = true;
                ++i;
                break;
            }
            text.push_back(tok[i]);
        }
        if (!closed) return error(ErrorCode::MalformedLiteral, "unterminated quote", token, start, quoted(quote));
        while (i < tok.size() && isSpace(tok[i])) ++i;
        if (i < tok.size()) {
            return error(ErrorCode::MalformedLiteral,
                         "unexpected characters after quoted " + spec_.name(),
                         token,
                         i,
                         "end of value");
        }
    } else {
        // Escaped characters survive trimming.
        std::size_t keep = 0;
        for (; i < tok.size(); ++i) {
            if (tok[i] == '\\' && i + 1 < tok.size()) {
                text.push_back(tok[++i]);
                keep = text.size();
                continue;
            }
            text.push_back(tok[i]);
            if (!isSpace(tok[i])) keep = text.size();
        }
        text.resize(keep);
    }

    auto value = coerce(spec_, text, token, start);
    if (auto* err = std::get_if<ParseError>(&value)) return std::move(*err);
    return LiteralMatch{std::get<Value>(std::move(value)), 1};
}

std::optional<ParseError> Reader::readKey(const TypeSpec*& want) {
    Frame& f = stack_.back();
    cur_.skipSpace();
    if (cur_.atEnd()) return unterminated(f);

    const std::size_t token = cur_.token();
    const std::size_t offset = cur_.offset();
    std::string key;
    while (!cur_.atTokenEnd() && isKeyChar(cur_.peek())) {
        key.push_back(cur_.peek());
        cur_.advance();
    }
    if (key.empty()) return errorHere(ErrorCode::MalformedLiteral, "expected a field name", "field name");

    cur_.skipSpace();
    if (cur_.atEnd()) return unterminated(f);
    if (cur_.peek() != '=' && cur_.peek() != ':') {
        return errorHere(ErrorCode::MalformedLiteral, "expected '=' or ':' after field \"" + key + "\"", "'='");
    }
    cur_.advance();

    const auto* field = f.spec->findField(key);
    if (!field) {
        std::vector<std::string> names;
        for (const auto& fs : f.spec->fields()) names.push_back(fs.name);
        return error(ErrorCode::UnknownField,
                     "unknown field \"" + key + "\" for " + f.spec->name() + utils::formatSuggestions(utils::suggest(key, names)),
                     token,
                     offset,
                     f.spec->name());
    }
    for (const auto& existing : f.fields) {
        if (existing.name == key) {
            return error(ErrorCode::DuplicateField, "field \"" + key + "\" given more than once", token, offset, field->type.name());
        }
    }
    f.key = std::move(key);
    want = &field->type;
    return std::nullopt;
}

std::optional<ParseError> Reader::closeFrame(Value& out) {
    Frame f = std::move(stack_.back());
    stack_.pop_back();
    if (f.spec->isArray()) {
        out = Value(std::move(f.items));
        return std::nullopt;
    }
    // Declaration order, whatever order the literal used.
    Struct ordered;
    ordered.reserve(f.fields.size());
    for (const auto& fs : f.spec->fields()) {
        auto given = std::find_if(f.fields.begin(), f.fields.end(), [&](const Field& x) { return x.name == fs.name; });
        if (given != f.fields.end()) {
            ordered.push_back(std::move(*given));
            continue;
        }
        if (fs.optional) continue;
        return error(ErrorCode::MissingField,
                     "missing field \"" + fs.name + "\" in " + f.spec->name() + " literal",
                     f.openToken,
                     f.openOffset,
                     fs.name + ": " + fs.type.name());
    }
    out = Value(std::move(ordered));
    return std::nullopt;
}

std::variant<LiteralMatch, ParseError> Reader::run() {
    const std::size_t start = cur_.token();

    if (spec_.isScalar()) return readLoneScalar();

    // The opening delimiter has to be in the starting token.
    cur_.skipSpaceInToken();
    const TypeSpec* want = &spec_;
    std::optional<Value> produced;

    while (true) {
        if (!produced) {
            if (stack_.empty()) {
                if (cur_.atTokenEnd()) {
                    return errorHere(ErrorCode::InvalidValue, "expected " + want->name() + ", found end of input", want->name());
                }
            } else {
                cur_.skipSpace();
                if (cur_.atEnd()) return unterminated(stack_.back());
            }

            const char c = cur_.peek();
            if (!stack_.empty() && (c == ',' || c == ']' || c == '}')) {
                return errorHere(ErrorCode::MalformedLiteral, "expected a value, found " + quoted(c), want->name());
            }
            if (want->isScalar()) {
                Value v;
                if (auto err = readScalar(*want, v)) return std::move(*err);
                produced = std::move(v);
                continue;
            }

            const char opener = want->isArray() ? '[' : '{';
            if (c != opener) {
                return errorHere(ErrorCode::InvalidValue, "expected " + want->name() + ", found " + quoted(c), want->name());
            }
            stack_.push_back(Frame{want, want->isArray() ? ']' : '}', cur_.token(), cur_.offset(), {}, {}, {}});
            cur_.advance();
            cur_.skipSpace();
            if (cur_.atEnd()) return unterminated(stack_.back());
            if (cur_.peek() == stack_.back().closer) {
                cur_.advance();
                Value v;
                if (auto err = closeFrame(v)) return std::move(*err);
                produced = std::move(v);
                continue;
            }
            if (want->isStruct()) {
                if (auto err = readKey(want)) return std::move(*err);
            } else {
                want = &want->element();
            }
            continue;
        }

        if (stack_.empty()) break;

        Frame& f = stack_.back();
        if (f.spec->isArray()) {
            f.items.push_back(std::move(*produced));
        } else {
            f.fields.push_back(Field{f.key, std::move(*produced)});
        }
        produced.reset();

        cur_.skipSpace();
        if (cur_.atEnd()) return unterminated(f);
        const char c = cur_.peek();
        if (c == ',') {
            cur_.advance();
            if (f.spec->isArray()) {
                want = &f.spec->element();
            } else if (auto err = readKey(want)) {
                return std::move(*err);
            }
            continue;
        }
        if (c == f.closer) {
            cur_.advance();
            Value v;
            if (auto err = closeFrame(v)) return std::move(*err);
            produced = std::move(v);
            continue;
        }
        if (c == ']' || c == '}') {
            return errorHere(ErrorCode::MalformedLiteral, "mismatched " + quoted(c) + ", expected " + quoted(f.closer), quoted(f.closer));
        }
        return errorHere(ErrorCode::MalformedLiteral,
                         "expected ',' or " + quoted(f.closer) + ", found " + quoted(c),
                         "',' or " + quoted(f.closer));
    }

    cur_.skipSpaceInToken();
    if (!cur_.atTokenEnd()) {
        return errorHere(ErrorCode::MalformedLiteral, "unexpected characters after " + spec_.name() + " literal", "end of value");
    }
    return LiteralMatch{std::move(*produced), cur_.token() - start + 1};
}

} // namespace

std::variant<LiteralMatch, ParseError> LiteralParser::parse(const std::vector<std::string>& tokens,
                                                            std::size_t tokenIndex,
                                                            std::size_t offset) const {
    if (tokenIndex >= tokens.size()) {
        ParseError err;
        err.code = ErrorCode::MissingValue;
        err.message = "expected " + spec_.name() + ", found end of input";
        err.expected = spec_.name();
        return err;
    }
    return Reader(spec_, tokens, tokenIndex, offset).run();
}

std::variant<Value, ParseError> LiteralParser::parseText(std::string_view text) const {
    const std::vector<std::string> tokens{std::string(text)};
    auto result = parse(tokens, 0, 0);
    if (auto* err = std::get_if<ParseError>(&result)) return std::move(*err);
    return std::get<LiteralMatch>(std::move(result)).value;
}

} // namespace mlcli
