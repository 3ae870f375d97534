#include "cmdtree/errors.hpp"
#include "cmdtree/option_parser.hpp"
#include "cmdtree/parsed_options.hpp"

#include <cassert>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace cmdtree;

namespace {

std::vector<OptionSpec> sample_options() {
    return {
        OptionSpec{"tag", 't', {ArgumentKind::String}, "Tag."},
        OptionSpec{"force", 'f', {}, "Force."},
        OptionSpec{"size", '\0', {ArgumentKind::Integer, ArgumentKind::Integer}, "Width and height."},
        OptionSpec{"ratio", 'r', {ArgumentKind::Double}, "Ratio."},
    };
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    OptionParser parser(sample_options());

    // Recognized prefix is consumed, the rest is left for sub-commands.
    {
        const std::vector<std::string> args{"--tag", "latest", "-f", "pull", "--force"};
        OptionParseResult result = parser.parse(args);
        assert(result.consumed == 3);
        assert(result.options.size() == 2);
        assert(result.options[0].option->long_name == "tag");
        assert(result.options[0].parsed_name == "--tag");
        assert(result.options[0].arguments == std::vector<std::string>{"latest"});
        assert(result.options[1].option->long_name == "force");
        assert(result.options[1].parsed_name == "-f");
        assert(result.options[1].arguments.empty());
    }

    // Multi-value options take exactly their arity, verbatim and uncoerced.
    {
        OptionParseResult result = parser.parse({"--size", "10", "abc", "rest"});
        assert(result.consumed == 3);
        assert(result.options.size() == 1);
        assert((result.options[0].arguments == std::vector<std::string>{"10", "abc"}));
    }

    // A value that looks like an option is still taken as the value.
    {
        OptionParseResult result = parser.parse({"-t", "-f"});
        assert(result.consumed == 2);
        assert(result.options[0].arguments.front() == "-f");
    }

    // Order of appearance is preserved.
    {
        OptionParseResult result = parser.parse({"-r", "0.5", "--force", "-t", "v1"});
        assert(result.consumed == 5);
        assert(result.options[0].option->long_name == "ratio");
        assert(result.options[1].option->long_name == "force");
        assert(result.options[2].option->long_name == "tag");
    }

    // Help tokens and positionals are not options here.
    {
        assert(parser.parse({"-h"}).consumed == 0);
        assert(parser.parse({"--help", "-f"}).consumed == 0);
        assert(parser.parse({}).consumed == 0);
        assert(parser.parse({"tag"}).consumed == 0);
        assert(parser.parse({"--tag=latest"}).consumed == 0);
    }

    // Truncated value lists.
    assert(throws<ParseError>([&] { (void)parser.parse({"--tag"}); }));
    assert(throws<ParseError>([&] { (void)parser.parse({"--size", "10"}); }));
    try {
        (void)parser.parse({"-f", "-t"});
        assert(false && "truncated option accepted");
    } catch (const ParseError& ex) {
        assert(std::string(ex.what()).find("'-t'") != std::string::npos);
    }

    // Repeated options are rejected, whichever form is used.
    assert(throws<ParseError>([&] { (void)parser.parse({"-f", "--force"}); }));
    assert(throws<ParseError>([&] { (void)parser.parse({"-t", "a", "-t", "b"}); }));

    // Declaration errors.
    assert(throws<ConfigurationError>([] {
        OptionParser bad(std::vector<OptionSpec>{OptionSpec{"", 'x', {}, ""}});
    }));
    assert(throws<ConfigurationError>([] {
        OptionParser bad(std::vector<OptionSpec>{OptionSpec{"tag", 't', {}, ""}, OptionSpec{"tag", 'u', {}, ""}});
    }));
    assert(throws<ConfigurationError>([] {
        OptionParser bad(std::vector<OptionSpec>{OptionSpec{"tag", 't', {}, ""}, OptionSpec{"type", 't', {}, ""}});
    }));

    assert(parser.match("--ratio") != nullptr);
    assert(parser.match("-r") == parser.match("--ratio"));
    assert(parser.match("ratio") == nullptr);
    assert(parser.match("-s") == nullptr);

    // Typed access for command actions.
    {
        OptionParseResult result = parser.parse({"-t", "16", "--ratio", "2.5", "--size", "3", "4"});
        ParsedOptions options(std::move(result.options));
        assert(options.size() == 3);
        assert(options.has("tag"));
        assert(options.has("t"));
        assert(!options.has("force"));
        assert(options.value("tag") == std::optional<std::string>("16"));
        assert(options.value_as_int("t", 0) == 16);
        assert(options.require_int("tag") == 16);
        assert(options.value_as_double("ratio", 0.0) == 2.5);
        assert(options.value_as_int("force", 7) == 7);
        assert(options.value_or("force", "none") == "none");
        assert(options.values("size").size() == 2);
        assert(options.values("missing").empty());
        assert(throws<ParseError>([&] { (void)options.require_int("force"); }));
    }
    {
        OptionParseResult result = parser.parse({"-t", "latest"});
        ParsedOptions options(std::move(result.options));
        try {
            (void)options.value_as_int("tag", 0);
            assert(false && "non-numeric value accepted");
        } catch (const ParseError& ex) {
            assert(std::string(ex.what()).find("'-t'") != std::string::npos);
        }
        assert(throws<ParseError>([&] { (void)options.value_as_double("t", 0.0); }));
    }

    // Integers read as decimal, the same way range rules read them.
    {
        OptionParseResult result = parser.parse({"-t", "010", "-r", " 08 ", "--size", "0x10", "+7"});
        ParsedOptions options(std::move(result.options));
        assert(options.value_as_int("tag", 0) == 10);
        assert(options.value_as_int("ratio", 0) == 8);
        assert(options.value_as_double("ratio", 0.0) == 8.0);
        assert(throws<ParseError>([&] { (void)options.value_as_int("size", 0); }));
        assert(throws<ParseError>([&] { (void)options.value_as_double("size", 0.0); }));
    }
    assert(parse_integer("08") == std::optional<int64_t>(8));
    assert(parse_integer("-12") == std::optional<int64_t>(-12));
    assert(!parse_integer("1.5").has_value());
    assert(!parse_integer("").has_value());
    assert(!parse_integer("+-1").has_value());
    assert(parse_number("2.5e1") == std::optional<double>(25.0));
    assert(!parse_number("0x10").has_value());

    return 0;
}
