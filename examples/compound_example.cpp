#include <iostream>
#include <string>
#include <variant>

#include "mlcli/mlcli.hpp"

int main(int argc, char** argv) {
    using mlcli::TypeSpec;

    mlcli::Cli cli("testcli2", "Compound argument example");
    cli.withOption("treelevels", "t", "Max tree levels to process", TypeSpec::integer(), "7");

    cli.addCommand("user", "Add user using parameters")
        .withArgument("name")
        .withArgument("age", TypeSpec::integer(), "in years")
        .withArgument("weight", TypeSpec::scalar("float"), "in KG")
        .withFlag("married", "m", "Is married")
        .withOption("spouse", "", "Spouse name", TypeSpec::text());

    cli.addCommand("children", "Add children using array parameters")
        .withArgument("number", TypeSpec::integer())
        .withArgument("ages", TypeSpec::array(TypeSpec::integer()))
        .withOption("names", "", "Name list of children", TypeSpec::array(TypeSpec::text()));

    const auto person = TypeSpec::structOf({{"name", TypeSpec::text()}, {"age", TypeSpec::integer()}});
    cli.addCommand("family", "Add a family using a compound parameter")
        .withArgument("members",
                      TypeSpec::array(TypeSpec::structOf({
                          {"name", TypeSpec::text()},
                          {"age", TypeSpec::integer()},
                          {"children", TypeSpec::array(person), true},
                      })));

    // e.g. testcli2 family '[{name=Joe, age=33, children=[{name=Mike, age=3}]}]'
    const auto outcome = cli.parse(argc, argv);
    if (const auto* err = std::get_if<mlcli::ParseError>(&outcome)) {
        std::cerr << "Error: " << err->describe() << "\n";
        return 1;
    }
    if (const auto* signal = std::get_if<mlcli::Signal>(&outcome)) {
        std::cerr << signal->name() << " at " << signal->node->commandPath() << "\n";
        return 1;
    }

    const auto& result = std::get<mlcli::Result>(outcome);
    for (const auto& entry : result.global()) {
        std::cout << entry.key << " = " << entry.value.toString() << "\n";
    }
    return 0;
}
