#include <iostream>
#include <sstream>
#include <string>
#include <variant>

#include "mlcli/mlcli.hpp"

int main(int argc, char** argv) {
    mlcli::Cli cli("wrap", "Forwards unknown input to another tool");
    cli.withFlag("verbose", "v", "Trace the resolver");
    cli.onDefault([](const mlcli::Node&) { return mlcli::HandlerAction::Continue; });
    cli.addCommand("run", "Run a program").withArgument("program");

    std::ostringstream trace;
    cli.setTrace(trace);

    // wrap run make -j8 all  ->  leftover: -j8 all
    const auto outcome = cli.parse(argc, argv, mlcli::ParseMode::Partial);
    if (const auto* err = std::get_if<mlcli::ParseError>(&outcome)) {
        std::cerr << "Error: " << err->describe() << "\n";
        return 1;
    }
    if (std::holds_alternative<mlcli::Signal>(outcome)) return 0;

    const auto& result = std::get<mlcli::Result>(outcome);
    if (result.global().get<bool>("verbose")) std::cerr << trace.str();
    if (result.hasCommand()) std::cout << "program: " << result.arguments().get<std::string>("program") << "\n";
    std::cout << "leftover:";
    for (const auto& token : result.leftover()) std::cout << " " << token;
    std::cout << "\n";
    return 0;
}
