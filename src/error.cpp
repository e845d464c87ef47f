#include "mlcli/error.hpp"

namespace mlcli {

std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::DuplicateName: return "DuplicateName";
        case ErrorCode::InvalidDefinition: return "InvalidDefinition";
        case ErrorCode::UnknownOption: return "UnknownOption";
        case ErrorCode::UnknownCommand: return "UnknownCommand";
        case ErrorCode::MissingArgument: return "MissingArgument";
        case ErrorCode::TooManyArguments: return "TooManyArguments";
        case ErrorCode::MissingValue: return "MissingValue";
        case ErrorCode::MalformedLiteral: return "MalformedLiteral";
        case ErrorCode::InvalidValue: return "InvalidValue";
        case ErrorCode::UnknownField: return "UnknownField";
        case ErrorCode::MissingField: return "MissingField";
        case ErrorCode::DuplicateField: return "DuplicateField";
        case ErrorCode::NoCommandSignaled: return "NoCommandSignaled";
        case ErrorCode::HelpSignaled: return "HelpSignaled";
    }
    return "Unknown";
}

std::string ParseError::describe() const {
    std::string out = message;
    if (!subject.empty()) out += " [" + subject + "]";
    if (tokenIndex == npos) {
        out += " (at end of input)";
    } else {
        out += " (at token " + std::to_string(tokenIndex) + ", offset " + std::to_string(offset) + ")";
    }
    return out;
}

} // namespace mlcli
