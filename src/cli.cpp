#include "mlcli/cli.hpp"

#include <utility>

#include "mlcli/utils.hpp"

namespace mlcli {

Cli::Cli(std::string name, std::string description) : Cli(std::move(name), std::move(description), Settings{}) {}

Cli::Cli(std::string name, std::string description, Settings settings)
    : Group(std::move(name), std::move(description), nullptr), settings_(settings) {}

Cli& Cli::registerScalar(std::string kind, Coercion coercion) {
    scalars_.add(std::move(kind), std::move(coercion));
    return *this;
}

ParseOutcome Cli::parse(const std::vector<std::string>& tokens, ParseMode mode) const {
    return Resolver(*this, mode).run(tokens);
}

ParseOutcome Cli::parse(int argc, char** argv, ParseMode mode) const {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return parse(tokens, mode);
}

ParseOutcome Cli::parseLine(std::string_view line, ParseMode mode) const {
    auto tokens = utils::tokenize(line);
    if (auto* err = std::get_if<ParseError>(&tokens)) return std::move(*err);
    return parse(std::get<std::vector<std::string>>(tokens), mode);
}

} // namespace mlcli
