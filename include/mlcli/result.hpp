#ifndef MLCLI_RESULT_HPP
#define MLCLI_RESULT_HPP

#include <any>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"
#include "namespace.hpp"
#include "node.hpp"

namespace mlcli {

struct Resolution;

// Options of one traversed level (root, each group, the command), explicit values over declared defaults.
struct LevelNamespace {
    const Node* node{nullptr};
    Namespace options;
};

// Outcome of a successful resolution. Built fresh per parse and never mutated afterwards.
class Result {
public:
    // nullptr when a default handler let resolution stop at a group.
    [[nodiscard]] const Command* command() const { return command_; }
    // The command's parent group, or the group where resolution stopped.
    [[nodiscard]] const Group* group() const { return group_; }
    [[nodiscard]] bool hasCommand() const { return command_ != nullptr; }

    // Dotted path of the selected command (or stopping group) without the root, e.g. "vms.instances.list".
    [[nodiscard]] std::string commandPath() const;

    [[nodiscard]] const Namespace& arguments() const { return arguments_; }
    // Root first.
    [[nodiscard]] const std::vector<LevelNamespace>& levels() const { return levels_; }
    // Options namespace of the deepest traversed level.
    [[nodiscard]] const Namespace& options() const { return levels_.back().options; }
    [[nodiscard]] const Namespace* levelOptions(const Node& node) const;
    // Every argument and option keyed by its dotted path ("vms.instances.list.long", "user.name", "verbose").
    [[nodiscard]] const Namespace& global() const { return global_; }

    // Context of the selected node, inherited from parents; nullptr when none was set.
    [[nodiscard]] const std::any* context() const { return context_; }

    template <typename T>
    const T* contextAs() const {
        if (!context_) return nullptr;
        return std::any_cast<T>(context_);
    }

    // Unconsumed input in partial mode.
    [[nodiscard]] const std::vector<std::string>& leftover() const { return leftover_; }

private:
    friend Result mergeNamespaces(const Resolution& resolution);

    Result() = default;

    const Command* command_{nullptr};
    const Group* group_{nullptr};
    Namespace arguments_;
    std::vector<LevelNamespace> levels_;
    Namespace global_;
    const std::any* context_{nullptr};
    std::vector<std::string> leftover_;
};

enum class SignalKind {
    NoCommand,
    Help,
    Exit,
};

// A control signal raised by a default or help handler. Not an error.
struct Signal {
    SignalKind kind{SignalKind::NoCommand};
    // Node the handler was invoked for.
    const Node* node{nullptr};
    std::vector<std::string> leftover;

    [[nodiscard]] std::string_view name() const;
};

using ParseOutcome = std::variant<Result, Signal, ParseError>;

} // namespace mlcli

#endif // MLCLI_RESULT_HPP
