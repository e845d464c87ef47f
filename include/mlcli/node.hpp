#ifndef MLCLI_NODE_HPP
#define MLCLI_NODE_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "argument.hpp"
#include "option.hpp"
#include "type_spec.hpp"

namespace mlcli {

// What the resolver does after a default or help handler returns.
enum class HandlerAction {
    Continue,
    Exit,
    RaiseNoCommand,
    RaiseHelp,
};

class Node;
class Group;
class Command;

// Receives the node where resolution stopped (default handler) or where help was requested (help handler).
using Handler = std::function<HandlerAction(const Node&)>;

// Common part of groups and commands: name, own options, handlers and user context.
//
// Nodes are created by their parent group only and never move, so raw parent pointers stay valid for the
// lifetime of the root.
class Node {
public:
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const Group* parent() const { return parent_; }
    [[nodiscard]] bool isRoot() const { return parent_ == nullptr; }
    [[nodiscard]] virtual bool isCommand() const = 0;

    // Root is level 0.
    [[nodiscard]] std::size_t level() const;
    // Names from the first level below the root down to this node, e.g. "vms.instances.list". Empty for the root.
    [[nodiscard]] std::string fullName(char sep = '.') const;
    // Space separated, root included: "prog vms instances list".
    [[nodiscard]] std::string commandPath() const;
    // Root first, this node last.
    [[nodiscard]] std::vector<const Node*> chain() const;

    [[nodiscard]] const std::vector<Option>& options() const { return options_; }
    [[nodiscard]] const Option* findLongOption(std::string_view name) const;
    [[nodiscard]] const Option* findShortOption(char name) const;

    // -h / --help are recognized at this node.
    [[nodiscard]] bool helpEnabled() const { return helpEnabled_; }

    // Nearest handler on the path to the root, nullptr when none is set.
    [[nodiscard]] const Handler* defaultHandler() const;
    [[nodiscard]] const Handler* helpHandler() const;

    // Context is inherited from parents.
    [[nodiscard]] const std::any* context() const;

    template <typename T>
    const T* contextAs() const {
        const auto* a = context();
        if (!a) return nullptr;
        return std::any_cast<T>(a);
    }

    // Scalar kinds TypeSpecs of this tree are bound against. The root decides.
    [[nodiscard]] virtual const ScalarRegistry& scalars() const;

protected:
    // Only a group can make one, so children are created through Group::addGroup / addCommand alone.
    class Key {
        friend class Group;
        explicit Key() = default;
    };

    Node(std::string name, std::string description, Group* parent);

    void defineOption(Option option);
    void setDefaultHandler(Handler handler) { defaultHandler_ = std::move(handler); }
    void setHelpHandler(Handler handler) { helpHandler_ = std::move(handler); }
    void setHelpEnabled(bool v) { helpEnabled_ = v; }
    void storeContext(std::any ctx) { context_ = std::move(ctx); }

    // Binds every scalar of `type`; throws DefinitionError(InvalidDefinition) on an unknown kind.
    void bindType(TypeSpec& type) const { scalars().bind(type); }

    // Throws DefinitionError(InvalidDefinition) when `name` cannot be used as a tree or namespace name.
    static void checkName(std::string_view name, std::string_view what);

    // Names in this node's scope that an option target must not shadow (child names, argument names).
    [[nodiscard]] virtual bool reservesName(std::string_view name) const;
    virtual void collectDescendantOptions(std::vector<const Option*>& out) const;

    [[nodiscard]] bool hasOptionTarget(std::string_view target) const;

private:
    friend class Group;

    std::string name_;
    std::string description_;
    Group* parent_;
    std::vector<Option> options_;
    Handler defaultHandler_;
    Handler helpHandler_;
    bool helpEnabled_{true};
    std::any context_;
};

class Group : public Node {
public:
    Group(Key, std::string name, std::string description, Group* parent);

    [[nodiscard]] bool isCommand() const override { return false; }

    // Throws DefinitionError(DuplicateName) when a sibling group or command already uses `name`.
    Group& addGroup(std::string name, std::string description = {});
    Command& addCommand(std::string name, std::string description = {});

    // Names may be given with or without leading dashes ("--long" or "long", "-l" or "l").
    Group& withFlag(std::string longName, std::string shortName, std::string description) {
        defineOption(Option(std::move(longName), std::move(shortName), std::move(description)));
        return *this;
    }

    Group& withOption(std::string longName,
                      std::string shortName,
                      std::string description,
                      TypeSpec type,
                      std::optional<std::string> defaultLiteral = std::nullopt) {
        defineOption(Option(std::move(longName),
                            std::move(shortName),
                            std::move(description),
                            std::move(type),
                            std::move(defaultLiteral)));
        return *this;
    }

    Group& addOption(Option option) {
        defineOption(std::move(option));
        return *this;
    }

    Group& onDefault(Handler handler) {
        setDefaultHandler(std::move(handler));
        return *this;
    }

    Group& onHelp(Handler handler) {
        setHelpHandler(std::move(handler));
        return *this;
    }

    Group& disableHelp() {
        setHelpEnabled(false);
        return *this;
    }

    Group& setContext(std::any ctx) {
        storeContext(std::move(ctx));
        return *this;
    }

    // Insertion order.
    [[nodiscard]] const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
    [[nodiscard]] std::vector<const Group*> groups() const;
    [[nodiscard]] std::vector<const Command*> commands() const;
    [[nodiscard]] std::vector<std::string> childNames() const;
    [[nodiscard]] const Node* find(std::string_view name) const;

protected:
    Group(std::string name, std::string description, Group* parent);

    [[nodiscard]] bool reservesName(std::string_view name) const override;
    void collectDescendantOptions(std::vector<const Option*>& out) const override;

private:
    void checkChildName(const std::string& name) const;

    std::vector<std::unique_ptr<Node>> children_;
};

class Command : public Node {
public:
    Command(Key, std::string name, std::string description, Group* parent);

    [[nodiscard]] bool isCommand() const override { return true; }

    // Appends a positional argument. Throws DefinitionError(DuplicateName) when the name is already used by an
    // argument or an option of this command.
    Command& withArgument(std::string name, TypeSpec type = TypeSpec{}, std::string description = {});

    Command& withFlag(std::string longName, std::string shortName, std::string description) {
        defineOption(Option(std::move(longName), std::move(shortName), std::move(description)));
        return *this;
    }

    Command& withOption(std::string longName,
                        std::string shortName,
                        std::string description,
                        TypeSpec type,
                        std::optional<std::string> defaultLiteral = std::nullopt) {
        defineOption(Option(std::move(longName),
                            std::move(shortName),
                            std::move(description),
                            std::move(type),
                            std::move(defaultLiteral)));
        return *this;
    }

    Command& addOption(Option option) {
        defineOption(std::move(option));
        return *this;
    }

    Command& onHelp(Handler handler) {
        setHelpHandler(std::move(handler));
        return *this;
    }

    Command& disableHelp() {
        setHelpEnabled(false);
        return *this;
    }

    Command& setContext(std::any ctx) {
        storeContext(std::move(ctx));
        return *this;
    }

    [[nodiscard]] const std::vector<Argument>& arguments() const { return arguments_; }
    [[nodiscard]] const Argument* findArgument(std::string_view name) const;

protected:
    [[nodiscard]] bool reservesName(std::string_view name) const override { return findArgument(name) != nullptr; }

private:
    std::vector<Argument> arguments_;
};

} // namespace mlcli

#endif // MLCLI_NODE_HPP
