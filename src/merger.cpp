#include "mlcli/resolver.hpp"

#include "mlcli/utils.hpp"

namespace mlcli {

namespace {

const Value* explicitValue(const std::vector<Field>& given, const std::string& target) {
    for (const auto& f : given) {
        if (f.name == target) return &f.value;
    }
    return nullptr;
}

} // namespace

Result mergeNamespaces(const Resolution& resolution) {
    Result result;
    const Node* last = resolution.path.back();
    if (last->isCommand()) {
        result.command_ = static_cast<const Command*>(last);
        result.group_ = last->parent();
    } else {
        result.group_ = static_cast<const Group*>(last);
    }
    result.context_ = last->context();
    result.leftover_ = resolution.leftover;

    // Per level: explicit values over defaults, in declaration order. Value options without a default stay absent.
    for (std::size_t i = 0; i < resolution.path.size(); ++i) {
        const Node* node = resolution.path[i];
        const std::string prefix = node->fullName();
        LevelNamespace level{node, {}};
        for (const auto& option : node->options()) {
            const std::string& key = option.targetName();
            const Value* v = explicitValue(resolution.explicitOptions[i], key);
            if (!v && option.defaultValue()) v = &*option.defaultValue();
            if (!v) continue;
            level.options.set(key, *v);
            result.global_.set(utils::joinPath({prefix, key}), *v);
        }
        result.levels_.push_back(std::move(level));
    }

    if (result.command_) {
        const std::string prefix = result.command_->fullName();
        const auto& args = result.command_->arguments();
        for (std::size_t i = 0; i < resolution.arguments.size() && i < args.size(); ++i) {
            result.arguments_.set(args[i].name(), resolution.arguments[i]);
            result.global_.set(utils::joinPath({prefix, args[i].name()}), resolution.arguments[i]);
        }
    }
    return result;
}

} // namespace mlcli
