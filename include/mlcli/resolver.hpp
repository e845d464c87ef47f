#ifndef MLCLI_RESOLVER_HPP
#define MLCLI_RESOLVER_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "error.hpp"
#include "node.hpp"
#include "result.hpp"
#include "value.hpp"

namespace mlcli {

class Cli;

enum class ParseMode {
    Strict,
    // Unknown options, unknown commands and surplus positionals end resolution; the rest is returned as leftover.
    Partial,
};

// Raw material collected by the token walk, turned into namespaces by mergeNamespaces().
struct Resolution {
    // Root first; the last node is the selected command or the group where resolution stopped.
    std::vector<const Node*> path;
    // Explicit option values per path entry, keyed by option target name.
    std::vector<std::vector<Field>> explicitOptions;
    // Argument values in declaration order.
    std::vector<Value> arguments;
    std::vector<std::string> leftover;
};

Result mergeNamespaces(const Resolution& resolution);

// Walks raw tokens through the command tree.
//
// States: AtGroup -> (AtGroup | AtCommand) -> Resolved, or a handler-driven NoCommand/Help/Exit signal.
// One Resolver per parse call.
class Resolver {
public:
    Resolver(const Cli& cli, ParseMode mode);

    [[nodiscard]] ParseOutcome run(const std::vector<std::string>& tokens);

private:
    enum class Step {
        Consumed,
        // A negative number where a positional may go.
        Positional,
        // Partial mode ran into an unknown option.
        Stop,
        Help,
    };

    struct Hit {
        std::size_t level;
        const Option* option;
    };

    using StepResult = std::variant<Step, ParseError>;

    ParseOutcome atGroup(const Group& group);
    ParseOutcome atCommand(const Command& command);

    StepResult consumeOption(const Node& node, bool positionalAllowed);
    StepResult consumeShortGroup(const Node& node, bool positionalAllowed);
    StepResult unknownOption(const Node& node, const std::string& shown, bool positionalAllowed);
    std::optional<ParseError> consumeValue(const Hit& hit, std::size_t tokenIndex, std::size_t offset);
    std::optional<ParseError> takeNextValue(const Hit& hit, const std::string& shown);

    std::optional<Hit> findLong(const Node& node, std::string_view name) const;
    std::optional<Hit> findShort(const Node& node, char name) const;
    void record(const Hit& hit, Value value);

    ParseOutcome noCommand(const Group& group);
    ParseOutcome help(const Node& node);
    ParseOutcome signal(SignalKind kind, const Node& node);
    ParseOutcome resolved();
    void stop();

    [[nodiscard]] bool isOptionToken(const std::string& token) const;
    [[nodiscard]] std::string subjectOf(const Hit& hit) const;
    ParseError error(ErrorCode code, std::string message, std::size_t tokenIndex, std::string expected) const;
    void trace(const std::string& line) const;

    const Cli& cli_;
    ParseMode mode_;
    const std::vector<std::string>* tokens_{nullptr};
    std::size_t pos_{0};
    bool endOfOptions_{false};
    Resolution resolution_;
};

} // namespace mlcli

#endif // MLCLI_RESOLVER_HPP
