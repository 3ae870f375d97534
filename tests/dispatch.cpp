#include "cmdtree/command_registry.hpp"
#include "cmdtree/dispatcher.hpp"
#include "cmdtree/errors.hpp"
#include "test_tree.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cmdtree;
using cmdtree::testing::CapturedIo;
using cmdtree::testing::Invocation;

namespace {

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

struct Fixture {
    CommandRegistry registry;
    Invocation record;
    CapturedIo io;
    const CommandDescriptor& root = testing::register_test_tree(registry, record);

    int run(const std::vector<std::string>& args) { return run_command(registry, io.io, root, args); }
};

void test_leaf_receives_its_options_and_arguments() {
    Fixture f;
    assert(f.run({"image", "pull", "--tag", "latest", "myrepo"}) == 0);
    assert(f.record.count == 1);
    assert(f.record.command == "pull");
    assert(f.record.arguments == std::vector<std::string>{"myrepo"});
    assert(f.record.options.size() == 1);
    assert(f.record.options.at("tag") == std::vector<std::string>{"latest"});
    assert(f.record.ancestor_options.empty());
    assert(f.io.out.str().empty());
    assert(f.io.err.str().empty());
}

void test_parent_options_visible_to_leaf() {
    Fixture f;
    assert(f.run({"-v", "image", "push", "-t", "v2"}) == 0);
    assert(f.record.command == "push");
    assert(f.record.ancestor_options == std::vector<std::string>{"tool:verbose"});
    assert(f.record.options.at("tag") == std::vector<std::string>{"v2"});
}

void test_unknown_command() {
    CommandRegistry registry;
    CapturedIo io;
    const auto& image = registry.register_command({
        .type_name = "ImageCommand",
        .scope = "",
        .factory = [] { return Command{.description = "Manage images.", .is_root = true}; },
    });
    registry.register_command({
        .type_name = "PullCommand",
        .scope = "Image",
        .factory = [] { return Command{.description = "Pull.", .handler = [](const CommandContext&) { return 0; }}; },
    });

    try {
        (void)run_command(registry, io.io, image, {"foo"});
        assert(false && "unknown command accepted");
    } catch (const UnknownCommandError& ex) {
        assert(ex.command_path() == "image");
        assert(ex.token() == "foo");
        assert(std::string(ex.what()) == "image: 'foo' is not a valid command.");
    }

    // Names match exactly, without the type suffix.
    try {
        (void)run_command(registry, io.io, image, {"pullcommand"});
        assert(false && "type name accepted as command");
    } catch (const UnknownCommandError& ex) {
        assert(ex.token() == "pullcommand");
    }

    // Options consumed by the level do not count as a sub-command.
    Fixture f;
    try {
        (void)f.run({"-v"});
        assert(false && "missing sub-command accepted");
    } catch (const UnknownCommandError& ex) {
        assert(ex.command_path() == "tool");
        assert(ex.token().empty());
        assert(std::string(ex.what()) == "tool: a command name is required.");
    }
    try {
        (void)f.run({"image", "-v", "pull"});
        assert(false && "unknown option accepted as sub-command");
    } catch (const UnknownCommandError& ex) {
        assert(ex.command_path() == "tool image");
        assert(ex.token() == "-v");
    }
    assert(f.record.count == 0);
}

void test_help_tokens() {
    for (const std::string token : {"-h", "--help"}) {
        Fixture f;
        assert(f.run({"image", "pull", token}) == 0);
        assert(f.record.count == 0);
        assert(contains(f.io.out.str(), "tool image pull\n"));
        assert(contains(f.io.out.str(), "Usage:"));

        Fixture g;
        assert(g.run({token}) == 0);
        assert(contains(g.io.out.str(), "Commands:"));
    }

    // Help only replaces the whole argument list.
    Fixture f;
    assert(f.run({"image", "pull", "-t", "x", "-h"}) == 0);
    assert(f.record.count == 1);
    assert(f.record.arguments == std::vector<std::string>{"-h"});
    assert(f.io.out.str().empty());
}

void test_empty_arguments() {
    // Default: print help.
    Fixture f;
    assert(f.run({}) == 0);
    assert(contains(f.io.out.str(), "Test tool."));
    assert(f.record.count == 0);

    Fixture g;
    assert(g.run({"image", "pull"}) == 0);
    assert(g.record.count == 0);
    assert(contains(g.io.out.str(), "Pull an image."));

    // Disabled: the leaf runs with nothing.
    Fixture h;
    assert(h.run({"level"}) == 0);
    assert(h.record.count == 1);
    assert(h.record.command == "level");
    assert(h.record.arguments.empty());
    assert(h.record.options.empty());
    assert(h.io.out.str().empty());
}

void test_requirement_violations() {
    Fixture f;
    try {
        (void)f.run({"level", "--level", "15"});
        assert(false && "out of range value accepted");
    } catch (const RequirementViolation& ex) {
        assert(ex.errors().size() == 1);
        assert(contains(ex.errors().front().message, "level"));
        assert(contains(ex.errors().front().message, "[1, 10]"));
    }
    assert(f.record.count == 0);

    try {
        (void)f.run({"pair", "-a", "-b"});
        assert(false && "exclusive options accepted");
    } catch (const RequirementViolation& ex) {
        assert(ex.errors().size() == 1);
        assert(ex.errors().front().message == "-a, -b are mutually exclusive.");
    }

    // All rules are reported together.
    try {
        (void)f.run({"image", "pull", "-t", "x", "--all-tags", "--retries", "9", "repo"});
        assert(false && "violations accepted");
    } catch (const RequirementViolation& ex) {
        assert(ex.errors().size() == 2);
        assert(ex.errors()[0].message == "-t, --all-tags are mutually exclusive.");
        assert(ex.errors()[1].message == "--retries has value in range [0, 5].");
        assert(std::string(ex.what()) == ex.errors()[0].message + "\n" + ex.errors()[1].message);
    }

    try {
        (void)f.run({"image", "push", "repo"});
        assert(false && "missing required option accepted");
    } catch (const RequirementViolation& ex) {
        assert(ex.errors().front().message == "--tag is required.");
    }

    // Caught as the common base too.
    bool caught = false;
    try {
        (void)f.run({"level", "-l", "abc"});
    } catch (const CommandError& ex) {
        caught = true;
        assert(std::string(ex.what()) == "Invalid argument value: -l abc");
    }
    assert(caught);
    assert(f.record.count == 0);

    assert(f.run({"level", "-l", "10"}) == 0);
    assert(f.record.count == 1);
}

void test_parse_errors() {
    Fixture f;
    bool caught = false;
    try {
        (void)f.run({"image", "pull", "--tag"});
    } catch (const ParseError& ex) {
        caught = true;
        assert(contains(ex.what(), "--tag"));
    }
    assert(caught);

    caught = false;
    try {
        (void)f.run({"pair", "-a", "--alpha"});
    } catch (const ParseError&) {
        caught = true;
    }
    assert(caught);
    assert(f.record.count == 0);
}

void test_no_interleaving() {
    // The root flag after the sub-command token belongs to the sub-command.
    Fixture f;
    assert(f.run({"pair", "-v"}) == 0);
    assert(f.record.arguments == std::vector<std::string>{"-v"});
    assert(f.record.options.empty());
    assert(f.record.ancestor_options.empty());
}

void test_leaf_without_action() {
    CommandRegistry registry;
    CapturedIo io;
    const auto& root = registry.register_command({
        .type_name = "LonelyCommand",
        .scope = "",
        .factory = [] { return Command{.description = "Nothing to do.", .print_help_with_no_args = false}; },
    });
    bool caught = false;
    try {
        (void)run_command(registry, io.io, root, {});
    } catch (const ConfigurationError&) {
        caught = true;
    }
    assert(caught);
}

void test_status_and_exceptions_from_actions() {
    CommandRegistry registry;
    CapturedIo io;
    const auto& root = registry.register_command({
        .type_name = "AppCommand",
        .scope = "",
        .factory = [] { return Command{.description = "App.", .is_root = true}; },
    });
    registry.register_command({
        .type_name = "ExitCommand",
        .scope = "App",
        .factory = [] {
            return Command{
                .description = "Exit with a status.",
                .arguments_help = "STATUS",
                .handler = [](const CommandContext& context) {
                    context.io.write_line("exiting");
                    return std::stoi(context.arguments.at(0));
                },
            };
        },
    });
    registry.register_command({
        .type_name = "FailCommand",
        .scope = "App",
        .factory = [] {
            return Command{
                .description = "Fail.",
                .print_help_with_no_args = false,
                .handler = [](const CommandContext&) -> int { throw std::runtime_error("boom"); },
            };
        },
    });

    assert(run_command(registry, io.io, root, {"exit", "7"}) == 7);
    assert(io.out.str() == "exiting\n");

    bool caught = false;
    try {
        (void)run_command(registry, io.io, root, {"fail"});
    } catch (const std::runtime_error& ex) {
        caught = true;
        assert(std::string(ex.what()) == "boom");
    }
    assert(caught);
}

void test_repeated_runs_are_independent() {
    Fixture f;
    assert(f.run({"-v", "image", "pull", "-t", "a", "one"}) == 0);
    assert(f.record.ancestor_options.size() == 1);
    assert(f.run({"image", "pull", "--all-tags", "two"}) == 0);
    assert(f.record.count == 2);
    assert(f.record.arguments == std::vector<std::string>{"two"});
    assert(f.record.options.size() == 1);
    assert(f.record.options.count("all-tags") == 1);
    assert(f.record.ancestor_options.empty());
}

} // namespace

int main() {
    test_leaf_receives_its_options_and_arguments();
    test_parent_options_visible_to_leaf();
    test_unknown_command();
    test_help_tokens();
    test_empty_arguments();
    test_requirement_violations();
    test_parse_errors();
    test_no_interleaving();
    test_leaf_without_action();
    test_status_and_exceptions_from_actions();
    test_repeated_runs_are_independent();
    return 0;
}
