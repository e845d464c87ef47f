#ifndef MLCLI_CLI_HPP
#define MLCLI_CLI_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "node.hpp"
#include "resolver.hpp"
#include "result.hpp"
#include "type_spec.hpp"

namespace mlcli {

// Root of a command tree and the entry point for parsing.
//
// The tree is build-then-freeze: define groups, commands, options and scalar kinds first, then parse. parse()
// is const and keeps no state between calls, so several threads may parse against the same finished tree.
// Changing the tree (or the settings) while a parse is running is not allowed.
//
// Example:
//   mlcli::Cli cli("clitest1", "multi-level demo");
//   cli.withFlag("verbose", "v", "chatty output");
//   cli.addGroup("vms").addGroup("instances").addCommand("list").withFlag("long", "l", "long listing");
//   auto outcome = cli.parse(argc, argv);
//   if (auto* r = std::get_if<mlcli::Result>(&outcome)) { ... }
class Cli : public Group {
public:
    struct Settings {
        // Append "Did you mean this?" to unknown option/command errors.
        bool suggestions{true};
        std::size_t suggestionsMinimumDistance{2};
        bool shortFlagGrouping{true}; // -abc
        bool endOfOptionsMarker{true}; // --
        // "-5" is a positional value when no option matches it.
        bool negativeNumbersAsValues{true};
    };

    explicit Cli(std::string name, std::string description = {});
    Cli(std::string name, std::string description, Settings settings);

    // Adds a scalar kind. Register kinds before any TypeSpec using them is attached to the tree.
    Cli& registerScalar(std::string kind, Coercion coercion);
    [[nodiscard]] const ScalarRegistry& scalars() const override { return scalars_; }

    Cli& setSettings(Settings settings) {
        settings_ = settings;
        return *this;
    }
    [[nodiscard]] const Settings& settings() const { return settings_; }

    // Writes one line per resolver step. Off by default.
    Cli& setTrace(std::ostream& os) {
        trace_ = &os;
        return *this;
    }
    [[nodiscard]] std::ostream* trace() const { return trace_; }

    [[nodiscard]] ParseOutcome parse(const std::vector<std::string>& tokens, ParseMode mode = ParseMode::Strict) const;
    // Skips argv[0].
    [[nodiscard]] ParseOutcome parse(int argc, char** argv, ParseMode mode = ParseMode::Strict) const;
    // Splits a whole command line with utils::tokenize first.
    [[nodiscard]] ParseOutcome parseLine(std::string_view line, ParseMode mode = ParseMode::Strict) const;

private:
    ScalarRegistry scalars_;
    Settings settings_;
    std::ostream* trace_{nullptr};
};

} // namespace mlcli

#endif // MLCLI_CLI_HPP
