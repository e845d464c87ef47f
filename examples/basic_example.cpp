#include <iostream>
#include <string>
#include <variant>

#include "mlcli/mlcli.hpp"

namespace {

void printUsage(const mlcli::Node& node) {
    std::cout << "Usage: " << node.commandPath();
    if (!node.isCommand()) std::cout << " <command>";
    std::cout << " [options]\n";
    if (!node.description().empty()) std::cout << "\n" << node.description() << "\n";
    if (!node.isCommand()) {
        std::cout << "\nCommands:\n";
        for (const auto& child : static_cast<const mlcli::Group&>(node).children()) {
            std::cout << "  " << child->name() << "\t" << child->description() << "\n";
        }
    }
    std::cout << "\nOptions:\n";
    for (const mlcli::Node* n : node.chain()) {
        for (const auto& o : n->options()) {
            std::cout << "  " << o.display() << "\t" << o.description() << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    mlcli::Cli cli("clitest1", "Manage virtual machines and networks");
    cli.withFlag("verbose", "v", "Enable verbose output");
    cli.onHelp([](const mlcli::Node& node) {
        printUsage(node);
        return mlcli::HandlerAction::Exit;
    });

    auto& vms = cli.addGroup("vms", "Virtual machines");
    vms.addGroup("instances", "Commands on vm instances")
        .addCommand("list", "List instances")
        .withFlag("long", "l", "Use long listing");
    cli.addGroup("networks", "Networks").addCommand("list", "List networks");

    const auto outcome = cli.parse(argc, argv);
    if (const auto* err = std::get_if<mlcli::ParseError>(&outcome)) {
        std::cerr << "Error: " << err->describe() << "\n";
        return 1;
    }
    if (const auto* signal = std::get_if<mlcli::Signal>(&outcome)) {
        if (signal->kind == mlcli::SignalKind::NoCommand) printUsage(*signal->node);
        return signal->kind == mlcli::SignalKind::NoCommand ? 1 : 0;
    }

    const auto& result = std::get<mlcli::Result>(outcome);
    if (result.global().get<bool>("verbose")) std::cout << "running " << result.commandPath() << "\n";
    std::cout << result.commandPath() << " " << result.options().toString() << "\n";
    return 0;
}
