// tests/resolver/test_resolver.cpp
#define BOOST_TEST_MODULE ResolverTests
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "demo_tree.hpp"

using namespace mlcli;

using Tokens = std::vector<std::string>;

BOOST_FIXTURE_TEST_SUITE(TokenWalkTestSuite, DemoTree)

BOOST_AUTO_TEST_CASE(test_nested_groups_select_command) {
    const auto outcome = cli.parse(Tokens{"vms", "instances", "list", "--long"});
    const auto& r = result(outcome);

    BOOST_REQUIRE(r.hasCommand());
    BOOST_CHECK_EQUAL(r.command()->name(), "list");
    BOOST_CHECK_EQUAL(r.group()->name(), "instances");
    BOOST_CHECK_EQUAL(r.commandPath(), "vms.instances.list");
    BOOST_CHECK_EQUAL(r.options().size(), 1u);
    BOOST_CHECK_EQUAL(r.options().get<bool>("long"), true);
    BOOST_CHECK_EQUAL(r.global().get<bool>("vms.instances.list.long"), true);
    BOOST_CHECK(r.arguments().empty());
    BOOST_CHECK(r.leftover().empty());
}

BOOST_AUTO_TEST_CASE(test_every_level_gets_a_namespace) {
    const auto outcome = cli.parse(Tokens{"vms", "instances", "list"});
    const auto& r = result(outcome);

    BOOST_REQUIRE_EQUAL(r.levels().size(), 4u);
    BOOST_CHECK(r.levels()[0].node == &cli);
    BOOST_CHECK_EQUAL(r.levels()[1].node->name(), "vms");
    BOOST_CHECK_EQUAL(r.levels()[0].options.get<int>("treelevels"), 7);
    BOOST_CHECK_EQUAL(r.levels()[0].options.get<bool>("quiet"), false);
    BOOST_CHECK(r.levels()[1].options.empty());
    BOOST_CHECK_EQUAL(r.options().get<bool>("long"), false);
    BOOST_REQUIRE(r.levelOptions(cli) != nullptr);
    BOOST_CHECK_EQUAL(r.global().get<int>("treelevels"), 7);
}

BOOST_AUTO_TEST_CASE(test_global_options_before_groups) {
    const auto outcome = cli.parse(Tokens{"-q", "-t", "3", "networks", "list"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.commandPath(), "networks.list");
    BOOST_CHECK_EQUAL(r.global().get<bool>("quiet"), true);
    BOOST_CHECK_EQUAL(r.global().get<int>("treelevels"), 3);
}

BOOST_AUTO_TEST_CASE(test_inherited_options_after_command) {
    const auto outcome = cli.parse(Tokens{"vms", "instances", "list", "-l", "--quiet", "--treelevels=2"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.options().get<bool>("long"), true);
    BOOST_CHECK_EQUAL(r.levels()[0].options.get<bool>("quiet"), true);
    BOOST_CHECK_EQUAL(r.global().get<int>("treelevels"), 2);
}

BOOST_AUTO_TEST_CASE(test_inline_values_and_last_one_wins) {
    const auto outcome = cli.parse(Tokens{"-t=5", "--treelevels", "9", "tree"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.commandPath(), "tree");
    BOOST_CHECK_EQUAL(r.global().get<int>("treelevels"), 9);
}

BOOST_AUTO_TEST_CASE(test_short_flag_group_mixes_levels) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "28", "72.8", "-mq"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.options().get<bool>("married"), true);
    BOOST_CHECK_EQUAL(r.global().get<bool>("quiet"), true);
}

BOOST_AUTO_TEST_CASE(test_short_group_value_takes_rest_of_token) {
    const auto outcome = cli.parse(Tokens{"-qt12", "tree"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.global().get<bool>("quiet"), true);
    BOOST_CHECK_EQUAL(r.global().get<int>("treelevels"), 12);
}

BOOST_AUTO_TEST_CASE(test_arguments_in_declaration_order) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "28", "72.8", "--spouse", "Maria"});
    const auto& r = result(outcome);
    const auto keys = r.arguments().keys();
    BOOST_REQUIRE_EQUAL(keys.size(), 3u);
    BOOST_CHECK_EQUAL(keys[0], "name");
    BOOST_CHECK_EQUAL(keys[2], "weight");
    BOOST_CHECK_EQUAL(r.arguments().get<std::string>("name"), "Jack");
    BOOST_CHECK_EQUAL(r.arguments().get<int>("age"), 28);
    BOOST_CHECK_EQUAL(r.arguments().get<float>("weight"), 72.8f);
    BOOST_CHECK_EQUAL(r.global().get<std::string>("user.name"), "Jack");
    BOOST_CHECK_EQUAL(r.global().get<std::string>("user.spouse"), "Maria");
    BOOST_CHECK_EQUAL(r.options().get<bool>("married"), false);
}

BOOST_AUTO_TEST_CASE(test_compound_values_span_tokens) {
    const auto outcome = cli.parse(Tokens{"children", "3", "[1,", "2,", "3]", "--names", "[a,", "b,", "c]"});
    const auto& r = result(outcome);
    BOOST_CHECK(r.arguments()["ages"] == Value(Array{Value(1), Value(2), Value(3)}));
    BOOST_CHECK(r.options()["names"] == Value(Array{Value("a"), Value("b"), Value("c")}));
    BOOST_CHECK_EQUAL(r.global().get<int>("children.ages.2"), 3);
}

BOOST_AUTO_TEST_CASE(test_option_value_inline_compound) {
    const auto outcome = cli.parse(Tokens{"children", "1", "[4]", "--names=[solo]"});
    const auto& r = result(outcome);
    BOOST_CHECK(r.options()["names"] == Value(Array{Value("solo")}));
}

BOOST_AUTO_TEST_CASE(test_struct_argument) {
    const auto outcome = cli.parse(Tokens{"person", "{age=27,", "name=joe}"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.global().get<std::string>("person.record.name"), "joe");
    BOOST_CHECK_EQUAL(r.arguments()["record"].field("age")->as<int>(), 27);
}

BOOST_AUTO_TEST_CASE(test_parse_line_family) {
    const auto outcome = cli.parseLine("-q family [{name=Sara, age=34}, {name=Joe, age=33, children=[{name=Mike, age=3}]}]");
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.commandPath(), "family");
    BOOST_CHECK_EQUAL(r.global().get<std::string>("family.members.0.name"), "Sara");
    BOOST_CHECK_EQUAL(r.global().get<std::string>("family.members.1.children.0.name"), "Mike");
    BOOST_CHECK_EQUAL(r.global().get<int>("family.members.1.children.0.age"), 3);
}

BOOST_AUTO_TEST_CASE(test_parse_line_resolves_escapes_and_quotes) {
    const auto outcome = cli.parseLine(R"(user Jack\ Smith 28 72.8 --spouse "Mary \"M\" Jane")");
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.arguments().get<std::string>("name"), "Jack Smith");
    BOOST_CHECK_EQUAL(r.options().get<std::string>("spouse"), "Mary \"M\" Jane");
}

BOOST_AUTO_TEST_CASE(test_parse_argv_skips_program_name) {
    std::vector<std::string> storage{"testcli2", "vms", "instances", "list", "-l"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());
    const auto outcome = cli.parse(static_cast<int>(argv.size()), argv.data());
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.commandPath(), "vms.instances.list");
}

BOOST_AUTO_TEST_CASE(test_negative_numbers_are_positional) {
    cli.addCommand("move").withArgument("dx", TypeSpec::integer()).withArgument("dy", TypeSpec::scalar("double"));
    const auto outcome = cli.parse(Tokens{"move", "-5", "-0.25"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.arguments().get<int>("dx"), -5);
    BOOST_CHECK_EQUAL(r.arguments().get<double>("dy"), -0.25);
}

BOOST_AUTO_TEST_CASE(test_end_of_options_marker) {
    cli.addCommand("echo").withArgument("text");
    const auto outcome = cli.parse(Tokens{"echo", "--", "--quiet"});
    const auto& r = result(outcome);
    BOOST_CHECK_EQUAL(r.arguments().get<std::string>("text"), "--quiet");
    BOOST_CHECK_EQUAL(r.global().get<bool>("quiet"), false);
}

BOOST_AUTO_TEST_CASE(test_context_comes_from_nearest_node) {
    cli.setContext(std::string("root"));
    auto outcome = cli.parse(Tokens{"tree"});
    BOOST_CHECK_EQUAL(*result(outcome).contextAs<std::string>(), "root");

    cli.addCommand("stats").setContext(11);
    outcome = cli.parse(Tokens{"stats"});
    BOOST_REQUIRE(result(outcome).contextAs<int>() != nullptr);
    BOOST_CHECK_EQUAL(*result(outcome).contextAs<int>(), 11);
}

BOOST_AUTO_TEST_CASE(test_trace_output) {
    std::ostringstream trace;
    cli.setTrace(trace);
    const auto outcome = cli.parse(Tokens{"vms", "instances", "list", "-l"});
    (void)result(outcome);
    const std::string text = trace.str();
    BOOST_CHECK(text.find("at command \"testcli2 vms instances list\"") != std::string::npos);
    BOOST_CHECK(text.find("option vms.instances.list.long = true") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(StrictErrorTestSuite, DemoTree)

BOOST_AUTO_TEST_CASE(test_unknown_command_with_suggestion) {
    const auto outcome = cli.parse(Tokens{"vms", "instnces", "list"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::UnknownCommand);
    BOOST_CHECK_EQUAL(err.tokenIndex, 1u);
    BOOST_CHECK_EQUAL(err.subject, "vms");
    BOOST_CHECK(err.message.find("Did you mean this?\n  instances") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_unknown_option) {
    const auto outcome = cli.parse(Tokens{"vms", "instances", "list", "--lnog"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::UnknownOption);
    BOOST_CHECK_EQUAL(err.tokenIndex, 3u);
    BOOST_CHECK(err.message.find("unknown option --lnog") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_suggestions_can_be_disabled) {
    auto settings = cli.settings();
    settings.suggestions = false;
    cli.setSettings(settings);
    const auto outcome = cli.parse(Tokens{"vms", "instnces"});
    BOOST_CHECK(error(outcome).message.find("Did you mean") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_short_grouping_can_be_disabled) {
    auto settings = cli.settings();
    settings.shortFlagGrouping = false;
    cli.setSettings(settings);
    const auto outcome = cli.parse(Tokens{"-qt3", "tree"});
    BOOST_CHECK(error(outcome).code == ErrorCode::UnknownOption);
}

BOOST_AUTO_TEST_CASE(test_option_of_other_branch_is_unknown) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "28", "72.8", "--long"});
    BOOST_CHECK(error(outcome).code == ErrorCode::UnknownOption);
}

BOOST_AUTO_TEST_CASE(test_too_many_arguments) {
    const auto outcome = cli.parse(Tokens{"person", "{name=joe,age=27}", "extra"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::TooManyArguments);
    BOOST_CHECK_EQUAL(err.tokenIndex, 2u);
}

BOOST_AUTO_TEST_CASE(test_missing_argument) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "28"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::MissingArgument);
    BOOST_CHECK_EQUAL(err.tokenIndex, ParseError::npos);
    BOOST_CHECK_EQUAL(err.expected, "argument <weight>");
    BOOST_CHECK_EQUAL(err.subject, "user.weight");
}

BOOST_AUTO_TEST_CASE(test_missing_option_value) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "28", "72.8", "--spouse"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::MissingValue);
    BOOST_CHECK_EQUAL(err.subject, "user.spouse");
}

BOOST_AUTO_TEST_CASE(test_invalid_argument_value) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "old", "72.8"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::InvalidValue);
    BOOST_CHECK_EQUAL(err.tokenIndex, 2u);
    BOOST_CHECK_EQUAL(err.subject, "user.age");
    BOOST_CHECK_EQUAL(err.expected, "int");
}

BOOST_AUTO_TEST_CASE(test_invalid_option_value) {
    const auto outcome = cli.parse(Tokens{"--treelevels", "deep", "tree"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::InvalidValue);
    BOOST_CHECK_EQUAL(err.tokenIndex, 1u);
    BOOST_CHECK_EQUAL(err.subject, "treelevels");
}

BOOST_AUTO_TEST_CASE(test_malformed_literal_argument) {
    const auto outcome = cli.parse(Tokens{"children", "2", "[1,2,"});
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::MalformedLiteral);
    BOOST_CHECK_EQUAL(err.tokenIndex, 2u);
    BOOST_CHECK_EQUAL(err.offset, 0u);
    BOOST_CHECK_EQUAL(err.subject, "children.ages");
}

BOOST_AUTO_TEST_CASE(test_malformed_line) {
    const auto outcome = cli.parseLine("children 2 [1,2,");
    const auto& err = error(outcome);
    BOOST_CHECK(err.code == ErrorCode::MalformedLiteral);
    BOOST_CHECK_EQUAL(err.tokenIndex, 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SignalTestSuite, DemoTree)

BOOST_AUTO_TEST_CASE(test_only_global_options_raise_no_command) {
    const auto outcome = cli.parse(Tokens{"-q", "-t", "4"});
    const auto& s = signal(outcome);
    BOOST_CHECK(s.kind == SignalKind::NoCommand);
    BOOST_CHECK(s.node == &cli);
}

BOOST_AUTO_TEST_CASE(test_nearest_default_handler_is_called) {
    std::string calledBy;
    const Node* calledFor = nullptr;
    cli.onDefault([&](const Node& n) {
        calledBy = "root";
        calledFor = &n;
        return HandlerAction::RaiseNoCommand;
    });
    cli.addGroup("images")
        .onDefault([&](const Node& n) {
            calledBy = "images";
            calledFor = &n;
            return HandlerAction::RaiseNoCommand;
        })
        .addGroup("snapshots")
        .addCommand("prune");

    auto outcome = cli.parse(Tokens{"images", "snapshots"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::NoCommand);
    BOOST_CHECK_EQUAL(calledBy, "images");
    BOOST_REQUIRE(calledFor != nullptr);
    BOOST_CHECK_EQUAL(calledFor->name(), "snapshots");

    outcome = cli.parse(Tokens{"--quiet"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::NoCommand);
    BOOST_CHECK_EQUAL(calledBy, "root");
}

BOOST_AUTO_TEST_CASE(test_default_handler_actions) {
    HandlerAction action = HandlerAction::Continue;
    cli.onDefault([&](const Node&) { return action; });

    auto outcome = cli.parse(Tokens{"-q", "vms"});
    const auto& r = result(outcome);
    BOOST_CHECK(!r.hasCommand());
    BOOST_CHECK_EQUAL(r.group()->name(), "vms");
    BOOST_CHECK_EQUAL(r.commandPath(), "vms");
    BOOST_CHECK_EQUAL(r.global().get<bool>("quiet"), true);

    action = HandlerAction::RaiseHelp;
    outcome = cli.parse(Tokens{"vms"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);

    action = HandlerAction::Exit;
    outcome = cli.parse(Tokens{"vms"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Exit);
}

BOOST_AUTO_TEST_CASE(test_help_markers) {
    auto outcome = cli.parse(Tokens{"vms", "--help"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);
    BOOST_CHECK_EQUAL(signal(outcome).node->name(), "vms");

    outcome = cli.parse(Tokens{"vms", "instances", "list", "-h"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);
    BOOST_CHECK_EQUAL(signal(outcome).node->name(), "list");

    outcome = cli.parse(Tokens{"-qh"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);
    BOOST_CHECK(signal(outcome).node == &cli);
}

BOOST_AUTO_TEST_CASE(test_help_wins_over_missing_arguments) {
    const auto outcome = cli.parse(Tokens{"user", "Jack", "-h"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);
}

BOOST_AUTO_TEST_CASE(test_help_handler_actions) {
    std::string seen;
    HandlerAction action = HandlerAction::Continue;
    cli.onHelp([&](const Node& n) {
        seen = n.commandPath();
        return action;
    });

    auto outcome = cli.parse(Tokens{"user", "-h"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Help);
    BOOST_CHECK_EQUAL(seen, "testcli2 user");

    action = HandlerAction::Exit;
    outcome = cli.parse(Tokens{"-h"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::Exit);

    action = HandlerAction::RaiseNoCommand;
    outcome = cli.parse(Tokens{"--help"});
    BOOST_CHECK(signal(outcome).kind == SignalKind::NoCommand);
}

BOOST_AUTO_TEST_CASE(test_disabled_help_makes_marker_unknown) {
    cli.addCommand("plain").disableHelp();
    const auto outcome = cli.parse(Tokens{"plain", "-h"});
    BOOST_CHECK(error(outcome).code == ErrorCode::UnknownOption);
}

BOOST_AUTO_TEST_SUITE_END()
