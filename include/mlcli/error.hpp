#ifndef MLCLI_ERROR_HPP
#define MLCLI_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mlcli {

enum class ErrorCode {
    // Definition time.
    DuplicateName,
    InvalidDefinition,
    // Parse time.
    UnknownOption,
    UnknownCommand,
    MissingArgument,
    TooManyArguments,
    MissingValue,
    MalformedLiteral,
    InvalidValue,
    UnknownField,
    MissingField,
    DuplicateField,
    // Control signals, never reported as ParseError.
    NoCommandSignaled,
    HelpSignaled,
};

[[nodiscard]] std::string_view errorCodeName(ErrorCode code);

// Thrown while the command tree is being defined. Construction must not continue after one.
class DefinitionError : public std::logic_error {
public:
    DefinitionError(ErrorCode code, const std::string& message)
        : std::logic_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

struct ParseError {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    ErrorCode code{ErrorCode::InvalidValue};
    std::string message;
    // Index of the offending raw token, npos when the input ended first.
    std::size_t tokenIndex{npos};
    // Character offset inside that token.
    std::size_t offset{0};
    // Expected name or type ("int", "']'", "argument <age>", ...).
    std::string expected;
    // Dotted name of the argument/option being parsed, empty for tree-level errors.
    std::string subject;

    // "<message> (at token N, offset M)" plus the subject when known.
    [[nodiscard]] std::string describe() const;
};

} // namespace mlcli

#endif // MLCLI_ERROR_HPP
