#include "mlcli/resolver.hpp"

#include <utility>

#include "mlcli/cli.hpp"
#include "mlcli/literal_parser.hpp"
#include "mlcli/utils.hpp"

namespace mlcli {

namespace {

std::string quote(const std::string& s) { return "\"" + s + "\""; }

bool flagDefault(const Option& option) {
    const auto& def = option.defaultValue();
    if (!def) return false;
    const bool* b = def->getIf<bool>();
    return b && *b;
}

} // namespace

Resolver::Resolver(const Cli& cli, ParseMode mode) : cli_(cli), mode_(mode) {}

ParseOutcome Resolver::run(const std::vector<std::string>& tokens) {
    tokens_ = &tokens;
    pos_ = 0;
    endOfOptions_ = false;
    resolution_ = Resolution{};
    resolution_.path.push_back(&cli_);
    resolution_.explicitOptions.emplace_back();
    trace("parsing " + std::to_string(tokens.size()) + " token(s) in " +
          (mode_ == ParseMode::Partial ? "partial" : "strict") + " mode");
    return atGroup(cli_);
}

ParseOutcome Resolver::atGroup(const Group& start) {
    const auto& tokens = *tokens_;
    const Group* group = &start;
    while (true) {
        trace("at group " + quote(group->commandPath()));
        while (pos_ < tokens.size() && isOptionToken(tokens[pos_])) {
            if (cli_.settings().endOfOptionsMarker && tokens[pos_] == "--") {
                trace("end of options");
                endOfOptions_ = true;
                ++pos_;
                break;
            }
            auto step = consumeOption(*group, /*positionalAllowed=*/false);
            if (auto* err = std::get_if<ParseError>(&step)) return std::move(*err);
            const Step s = std::get<Step>(step);
            if (s == Step::Help) return help(*group);
            if (s == Step::Stop) return noCommand(*group);
        }

        if (pos_ >= tokens.size()) return noCommand(*group);

        const std::string& token = tokens[pos_];
        const Node* child = group->find(token);
        if (!child) {
            if (mode_ == ParseMode::Partial) {
                trace("unknown command " + quote(token) + ", stopping");
                stop();
                return noCommand(*group);
            }
            std::string msg = "unknown command " + quote(token) + " for " + quote(group->commandPath());
            if (cli_.settings().suggestions) {
                msg += utils::formatSuggestions(
                    utils::suggest(token, group->childNames(), 3, cli_.settings().suggestionsMinimumDistance));
            }
            auto err = error(ErrorCode::UnknownCommand, std::move(msg), pos_, "command");
            err.subject = group->fullName();
            return err;
        }

        ++pos_;
        resolution_.path.push_back(child);
        resolution_.explicitOptions.emplace_back();
        if (child->isCommand()) return atCommand(static_cast<const Command&>(*child));
        group = static_cast<const Group*>(child);
    }
}

ParseOutcome Resolver::atCommand(const Command& command) {
    const auto& tokens = *tokens_;
    const auto& args = command.arguments();
    trace("at command " + quote(command.commandPath()));

    while (pos_ < tokens.size()) {
        const std::string& token = tokens[pos_];
        if (isOptionToken(token)) {
            if (cli_.settings().endOfOptionsMarker && token == "--") {
                trace("end of options");
                endOfOptions_ = true;
                ++pos_;
                continue;
            }
            auto step = consumeOption(command, /*positionalAllowed=*/true);
            if (auto* err = std::get_if<ParseError>(&step)) return std::move(*err);
            const Step s = std::get<Step>(step);
            if (s == Step::Help) return help(command);
            if (s == Step::Stop) break;
            if (s == Step::Consumed) continue;
        }

        const std::size_t index = resolution_.arguments.size();
        if (index >= args.size()) {
            if (mode_ == ParseMode::Partial) {
                trace("surplus token " + quote(token) + ", stopping");
                stop();
                break;
            }
            auto err = error(ErrorCode::TooManyArguments,
                             "too many arguments for " + quote(command.commandPath()) + ": accepts " +
                                 std::to_string(args.size()) + ", got extra " + quote(token),
                             pos_,
                             "end of input");
            err.subject = command.fullName();
            return err;
        }

        const Argument& arg = args[index];
        auto parsed = LiteralParser(arg.type()).parse(tokens, pos_);
        if (auto* err = std::get_if<ParseError>(&parsed)) {
            err->subject = utils::joinPath({command.fullName(), arg.name()});
            return std::move(*err);
        }
        auto& match = std::get<LiteralMatch>(parsed);
        trace("argument <" + arg.name() + "> = " + match.value.toString());
        resolution_.arguments.push_back(std::move(match.value));
        pos_ += match.tokensConsumed;
    }

    if (resolution_.arguments.size() < args.size()) {
        const Argument& missing = args[resolution_.arguments.size()];
        auto err = error(ErrorCode::MissingArgument,
                         "missing argument <" + missing.name() + "> (" + missing.type().name() + ") for " +
                             quote(command.commandPath()),
                         ParseError::npos,
                         "argument <" + missing.name() + ">");
        err.subject = utils::joinPath({command.fullName(), missing.name()});
        return err;
    }
    return resolved();
}

Resolver::StepResult Resolver::consumeOption(const Node& node, bool positionalAllowed) {
    const std::string& token = (*tokens_)[pos_];
    if (node.helpEnabled() && (token == "-h" || token == "--help")) return Step::Help;

    if (token.rfind("--", 0) == 0) {
        const auto eq = token.find('=');
        const std::string name = token.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        const std::string shown = "--" + name;
        const auto hit = findLong(node, name);
        if (!hit) return unknownOption(node, shown, positionalAllowed);
        if (eq != std::string::npos) {
            if (auto err = consumeValue(*hit, pos_, eq + 1)) return std::move(*err);
            return Step::Consumed;
        }
        if (hit->option->isFlag()) {
            record(*hit, Value(!flagDefault(*hit->option)));
            ++pos_;
            return Step::Consumed;
        }
        if (auto err = takeNextValue(*hit, shown)) return std::move(*err);
        return Step::Consumed;
    }

    if (token.size() == 2 || token[2] == '=') {
        const std::string shown = token.substr(0, 2);
        const auto hit = findShort(node, token[1]);
        if (!hit) return unknownOption(node, shown, positionalAllowed);
        if (token.size() > 2) {
            if (auto err = consumeValue(*hit, pos_, 3)) return std::move(*err);
            return Step::Consumed;
        }
        if (hit->option->isFlag()) {
            record(*hit, Value(!flagDefault(*hit->option)));
            ++pos_;
            return Step::Consumed;
        }
        if (auto err = takeNextValue(*hit, shown)) return std::move(*err);
        return Step::Consumed;
    }

    if (!cli_.settings().shortFlagGrouping) return unknownOption(node, token, positionalAllowed);
    return consumeShortGroup(node, positionalAllowed);
}

// -abc: every character must be a visible short option. A value option ends the group and takes the rest of
// the token, or the next token when it is the last character.
Resolver::StepResult Resolver::consumeShortGroup(const Node& node, bool positionalAllowed) {
    const std::string& token = (*tokens_)[pos_];
    std::vector<Hit> hits;
    for (std::size_t i = 1; i < token.size(); ++i) {
        const char c = token[i];
        if (node.helpEnabled() && c == 'h') return Step::Help;
        const auto hit = findShort(node, c);
        if (!hit) return unknownOption(node, std::string("-") + c, positionalAllowed);
        hits.push_back(*hit);
        if (!hit->option->isFlag()) break;
    }

    for (std::size_t i = 0; i < hits.size(); ++i) {
        const Hit& hit = hits[i];
        if (hit.option->isFlag()) {
            record(hit, Value(!flagDefault(*hit.option)));
            continue;
        }
        const std::size_t rest = i + 2;
        if (rest < token.size()) {
            if (auto err = consumeValue(hit, pos_, rest)) return std::move(*err);
        } else if (auto err = takeNextValue(hit, std::string("-") + token[i + 1])) {
            return std::move(*err);
        }
        return Step::Consumed;
    }
    ++pos_;
    return Step::Consumed;
}

Resolver::StepResult Resolver::unknownOption(const Node& node, const std::string& shown, bool positionalAllowed) {
    const std::string& token = (*tokens_)[pos_];
    if (positionalAllowed && cli_.settings().negativeNumbersAsValues && utils::isNegativeNumber(token)) {
        return Step::Positional;
    }
    if (mode_ == ParseMode::Partial) {
        trace("unknown option " + shown + ", stopping");
        stop();
        return Step::Stop;
    }

    std::string msg = "unknown option " + shown + " for " + quote(node.commandPath());
    if (cli_.settings().suggestions) {
        std::vector<std::string> known;
        for (const Node* n : node.chain()) {
            for (const auto& o : n->options()) {
                if (!o.longName().empty()) known.push_back("--" + o.longName());
                if (!o.shortName().empty()) known.push_back("-" + o.shortName());
            }
        }
        msg += utils::formatSuggestions(utils::suggest(shown, known, 3, cli_.settings().suggestionsMinimumDistance));
    }
    auto err = error(ErrorCode::UnknownOption, std::move(msg), pos_, "option");
    err.subject = node.fullName();
    return err;
}

std::optional<ParseError> Resolver::consumeValue(const Hit& hit, std::size_t tokenIndex, std::size_t offset) {
    auto parsed = LiteralParser(hit.option->type()).parse(*tokens_, tokenIndex, offset);
    if (auto* err = std::get_if<ParseError>(&parsed)) {
        err->subject = subjectOf(hit);
        return std::move(*err);
    }
    auto& match = std::get<LiteralMatch>(parsed);
    record(hit, std::move(match.value));
    pos_ = tokenIndex + match.tokensConsumed;
    return std::nullopt;
}

std::optional<ParseError> Resolver::takeNextValue(const Hit& hit, const std::string& shown) {
    if (pos_ + 1 >= tokens_->size()) {
        auto err = error(ErrorCode::MissingValue,
                         "option " + shown + " needs a value (" + hit.option->type().name() + ")",
                         ParseError::npos,
                         hit.option->type().name());
        err.subject = subjectOf(hit);
        return err;
    }
    return consumeValue(hit, pos_ + 1, 0);
}

std::optional<Resolver::Hit> Resolver::findLong(const Node& node, std::string_view name) const {
    for (const Node* n = &node; n; n = n->parent()) {
        if (const Option* o = n->findLongOption(name)) return Hit{n->level(), o};
    }
    return std::nullopt;
}

std::optional<Resolver::Hit> Resolver::findShort(const Node& node, char name) const {
    for (const Node* n = &node; n; n = n->parent()) {
        if (const Option* o = n->findShortOption(name)) return Hit{n->level(), o};
    }
    return std::nullopt;
}

void Resolver::record(const Hit& hit, Value value) {
    const std::string& target = hit.option->targetName();
    trace("option " + subjectOf(hit) + " = " + value.toString());
    auto& given = resolution_.explicitOptions[hit.level];
    for (auto& f : given) {
        if (f.name == target) {
            f.value = std::move(value);
            return;
        }
    }
    given.push_back(Field{target, std::move(value)});
}

ParseOutcome Resolver::noCommand(const Group& group) {
    const Handler* handler = group.defaultHandler();
    trace(std::string("no command at ") + quote(group.commandPath()) + (handler ? ", calling default handler" : ""));
    const HandlerAction action = handler ? (*handler)(group) : HandlerAction::RaiseNoCommand;
    switch (action) {
        case HandlerAction::Continue:
            return resolved();
        case HandlerAction::RaiseHelp:
            return signal(SignalKind::Help, group);
        case HandlerAction::Exit:
            return signal(SignalKind::Exit, group);
        case HandlerAction::RaiseNoCommand:
            break;
    }
    return signal(SignalKind::NoCommand, group);
}

ParseOutcome Resolver::help(const Node& node) {
    const Handler* handler = node.helpHandler();
    trace("help requested at " + quote(node.commandPath()) + (handler ? ", calling help handler" : ""));
    const HandlerAction action = handler ? (*handler)(node) : HandlerAction::RaiseHelp;
    switch (action) {
        case HandlerAction::RaiseNoCommand:
            return signal(SignalKind::NoCommand, node);
        case HandlerAction::Exit:
            return signal(SignalKind::Exit, node);
        case HandlerAction::Continue:
        case HandlerAction::RaiseHelp:
            break;
    }
    return signal(SignalKind::Help, node);
}

ParseOutcome Resolver::signal(SignalKind kind, const Node& node) {
    Signal s;
    s.kind = kind;
    s.node = &node;
    s.leftover = std::move(resolution_.leftover);
    trace("signal: " + std::string(s.name()));
    return s;
}

ParseOutcome Resolver::resolved() {
    trace("resolved " + quote(resolution_.path.back()->commandPath()) +
          (resolution_.leftover.empty() ? "" : " with " + std::to_string(resolution_.leftover.size()) + " leftover"));
    return mergeNamespaces(resolution_);
}

void Resolver::stop() {
    const auto& tokens = *tokens_;
    resolution_.leftover.assign(tokens.begin() + static_cast<std::ptrdiff_t>(pos_), tokens.end());
    pos_ = tokens.size();
}

bool Resolver::isOptionToken(const std::string& token) const {
    return !endOfOptions_ && token.size() > 1 && token[0] == '-';
}

std::string Resolver::subjectOf(const Hit& hit) const {
    return utils::joinPath({resolution_.path[hit.level]->fullName(), hit.option->targetName()});
}

ParseError Resolver::error(ErrorCode code, std::string message, std::size_t tokenIndex, std::string expected) const {
    ParseError err;
    err.code = code;
    err.message = std::move(message);
    err.tokenIndex = tokenIndex;
    err.expected = std::move(expected);
    return err;
}

void Resolver::trace(const std::string& line) const {
    if (auto* os = cli_.trace()) *os << "mlcli: " << line << "\n";
}

} // namespace mlcli
