#include "mlcli/node.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include "mlcli/error.hpp"
#include "mlcli/literal_parser.hpp"

namespace mlcli {

namespace {

std::string stripDashes(std::string name) {
    std::size_t n = 0;
    while (n < name.size() && name[n] == '-') ++n;
    return name.substr(n);
}

} // namespace

Node::Node(std::string name, std::string description, Group* parent)
    : name_(std::move(name)), description_(std::move(description)), parent_(parent) {}

std::size_t Node::level() const {
    std::size_t n = 0;
    for (const Node* p = parent_; p; p = p->parent_) ++n;
    return n;
}

std::vector<const Node*> Node::chain() const {
    std::vector<const Node*> tmp;
    for (const Node* n = this; n; n = n->parent_) tmp.push_back(n);
    return {tmp.rbegin(), tmp.rend()};
}

std::string Node::fullName(char sep) const {
    std::string out;
    for (const Node* n : chain()) {
        if (n->isRoot()) continue;
        if (!out.empty()) out.push_back(sep);
        out += n->name_;
    }
    return out;
}

std::string Node::commandPath() const {
    std::string out;
    for (const Node* n : chain()) {
        if (!out.empty()) out += " ";
        out += n->name_;
    }
    return out;
}

const Option* Node::findLongOption(std::string_view name) const {
    for (const auto& o : options_) {
        if (!o.longName().empty() && o.longName() == name) return &o;
    }
    return nullptr;
}

const Option* Node::findShortOption(char name) const {
    for (const auto& o : options_) {
        if (o.shortName().size() == 1 && o.shortName()[0] == name) return &o;
    }
    return nullptr;
}

const Handler* Node::defaultHandler() const {
    for (const Node* n = this; n; n = n->parent_) {
        if (n->defaultHandler_) return &n->defaultHandler_;
    }
    return nullptr;
}

const Handler* Node::helpHandler() const {
    for (const Node* n = this; n; n = n->parent_) {
        if (n->helpHandler_) return &n->helpHandler_;
    }
    return nullptr;
}

const std::any* Node::context() const {
    for (const Node* n = this; n; n = n->parent_) {
        if (n->context_.has_value()) return &n->context_;
    }
    return nullptr;
}

const ScalarRegistry& Node::scalars() const {
    if (parent_) return parent_->scalars();
    return builtinScalars();
}

void Node::checkName(std::string_view name, std::string_view what) {
    if (name.empty()) throw DefinitionError(ErrorCode::InvalidDefinition, std::string(what) + " must not be empty");
    if (name.front() == '-') {
        throw DefinitionError(ErrorCode::InvalidDefinition,
                              std::string(what) + " \"" + std::string(name) + "\" must not start with '-'");
    }
    for (const char c : name) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '.' || c == '=') {
            throw DefinitionError(ErrorCode::InvalidDefinition,
                                  std::string(what) + " \"" + std::string(name) +
                                      "\" must not contain whitespace, '.' or '='");
        }
    }
}

bool Node::reservesName(std::string_view) const { return false; }

void Node::collectDescendantOptions(std::vector<const Option*>&) const {}

bool Node::hasOptionTarget(std::string_view target) const {
    return std::any_of(options_.begin(), options_.end(), [&](const Option& o) { return o.targetName() == target; });
}

void Node::defineOption(Option option) {
    option.longName_ = stripDashes(std::move(option.longName_));
    option.shortName_ = stripDashes(std::move(option.shortName_));

    if (option.longName_.empty() && option.shortName_.empty()) {
        throw DefinitionError(ErrorCode::InvalidDefinition, "option needs a long or a short name");
    }
    if (!option.longName_.empty()) checkName(option.longName_, "option name");
    if (!option.shortName_.empty()) {
        if (option.shortName_.size() != 1) {
            throw DefinitionError(ErrorCode::InvalidDefinition,
                                  "short option name \"" + option.shortName_ + "\" must be a single character");
        }
        checkName(option.shortName_, "option name");
    }
    if (!option.target_.empty()) checkName(option.target_, "option target");

    const std::string display = option.display();
    if (helpEnabled_ && (option.longName_ == "help" || option.shortName_ == "h")) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "option " + display + " is reserved for help on \"" + commandPath() + "\"");
    }

    std::vector<const Option*> taken;
    for (const Node* n = this; n; n = n->parent_) {
        for (const auto& o : n->options_) taken.push_back(&o);
    }
    collectDescendantOptions(taken);
    for (const Option* o : taken) {
        const bool sameLong = !option.longName_.empty() && o->longName_ == option.longName_;
        const bool sameShort = !option.shortName_.empty() && o->shortName_ == option.shortName_;
        if (sameLong || sameShort) {
            throw DefinitionError(ErrorCode::DuplicateName,
                                  "option " + display + " on \"" + commandPath() + "\" collides with " + o->display());
        }
    }

    const std::string& target = option.targetName();
    if (hasOptionTarget(target)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "option " + display + " on \"" + commandPath() + "\" reuses the name \"" + target + "\"");
    }
    if (reservesName(target)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "option " + display + " on \"" + commandPath() + "\" shadows \"" + target + "\"");
    }

    bindType(option.type_);
    if (option.flag_) {
        option.defaultValue_ = Value(false);
    } else if (option.defaultLiteral_) {
        auto parsed = LiteralParser(option.type_).parseText(*option.defaultLiteral_);
        if (auto* err = std::get_if<ParseError>(&parsed)) {
            throw DefinitionError(ErrorCode::InvalidDefinition,
                                  "invalid default for option " + display + ": " + err->message);
        }
        option.defaultValue_ = std::get<Value>(std::move(parsed));
    }
    options_.push_back(std::move(option));
}

Group::Group(std::string name, std::string description, Group* parent)
    : Node(std::move(name), std::move(description), parent) {}

Group::Group(Key, std::string name, std::string description, Group* parent)
    : Group(std::move(name), std::move(description), parent) {}

void Group::checkChildName(const std::string& name) const {
    checkName(name, "command name");
    if (find(name)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "\"" + name + "\" is already defined under \"" + commandPath() + "\"");
    }
    if (hasOptionTarget(name)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "\"" + name + "\" is already an option of \"" + commandPath() + "\"");
    }
}

Group& Group::addGroup(std::string name, std::string description) {
    checkChildName(name);
    auto child = std::make_unique<Group>(Key(), std::move(name), std::move(description), this);
    Group& ref = *child;
    children_.push_back(std::move(child));
    return ref;
}

Command& Group::addCommand(std::string name, std::string description) {
    checkChildName(name);
    auto child = std::make_unique<Command>(Key(), std::move(name), std::move(description), this);
    Command& ref = *child;
    children_.push_back(std::move(child));
    return ref;
}

std::vector<const Group*> Group::groups() const {
    std::vector<const Group*> out;
    for (const auto& c : children_) {
        if (!c->isCommand()) out.push_back(static_cast<const Group*>(c.get()));
    }
    return out;
}

std::vector<const Command*> Group::commands() const {
    std::vector<const Command*> out;
    for (const auto& c : children_) {
        if (c->isCommand()) out.push_back(static_cast<const Command*>(c.get()));
    }
    return out;
}

std::vector<std::string> Group::childNames() const {
    std::vector<std::string> out;
    out.reserve(children_.size());
    for (const auto& c : children_) out.push_back(c->name());
    return out;
}

const Node* Group::find(std::string_view name) const {
    for (const auto& c : children_) {
        if (c->name() == name) return c.get();
    }
    return nullptr;
}

bool Group::reservesName(std::string_view name) const { return find(name) != nullptr; }

void Group::collectDescendantOptions(std::vector<const Option*>& out) const {
    for (const auto& c : children_) {
        for (const auto& o : c->options_) out.push_back(&o);
        if (!c->isCommand()) static_cast<const Group*>(c.get())->collectDescendantOptions(out);
    }
}

Command::Command(Key, std::string name, std::string description, Group* parent)
    : Node(std::move(name), std::move(description), parent) {}

Command& Command::withArgument(std::string name, TypeSpec type, std::string description) {
    checkName(name, "argument name");
    if (findArgument(name)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "argument \"" + name + "\" is already defined on \"" + commandPath() + "\"");
    }
    if (hasOptionTarget(name)) {
        throw DefinitionError(ErrorCode::DuplicateName,
                              "argument \"" + name + "\" clashes with an option of \"" + commandPath() + "\"");
    }
    bindType(type);
    const std::size_t position = arguments_.size();
    arguments_.emplace_back(std::move(name), std::move(type), std::move(description), position);
    return *this;
}

const Argument* Command::findArgument(std::string_view name) const {
    for (const auto& a : arguments_) {
        if (a.name() == name) return &a;
    }
    return nullptr;
}

} // namespace mlcli
