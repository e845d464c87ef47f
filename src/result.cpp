#include "mlcli/result.hpp"

namespace mlcli {

std::string Result::commandPath() const {
    if (command_) return command_->fullName();
    if (group_) return group_->fullName();
    return {};
}

const Namespace* Result::levelOptions(const Node& node) const {
    for (const auto& level : levels_) {
        if (level.node == &node) return &level.options;
    }
    return nullptr;
}

std::string_view Signal::name() const {
    switch (kind) {
        case SignalKind::NoCommand:
            return "no command";
        case SignalKind::Help:
            return "help";
        case SignalKind::Exit:
            return "exit";
    }
    return "unknown";
}

} // namespace mlcli
