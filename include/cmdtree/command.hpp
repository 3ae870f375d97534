#ifndef CMDTREE_COMMAND_HPP
#define CMDTREE_COMMAND_HPP

#include "cmdtree/option.hpp"
#include "cmdtree/option_parser.hpp"
#include "cmdtree/option_requirement.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cmdtree {

struct CommandContext;
struct CommandDescriptor;

using CommandHandler = std::function<int(const CommandContext&)>;

// Declaration of one node of the command tree, as produced by a descriptor's factory.
struct Command {
    std::string description;
    std::vector<OptionSpec> options;
    std::vector<OptionRequirement> requirements;
    bool options_required = false;
    bool print_help_with_no_args = true;
    bool is_root = false;
    // Usage placeholder for a leaf's own positional arguments.
    std::string arguments_help;
    // Action of a leaf. Ignored when the node has sub-commands.
    CommandHandler handler;
};

// Display name of a command type: the `Command` suffix removed, lower-cased.
std::string command_name_from_type(std::string_view type_name);

// Type name without its `Command` suffix, case preserved. Names the scope of the children.
std::string command_stem_from_type(std::string_view type_name);

class CommandNode {
public:
    CommandNode(const CommandDescriptor& descriptor, Command command);

    CommandNode(const CommandNode&) = delete;
    CommandNode& operator=(const CommandNode&) = delete;

    const CommandDescriptor& descriptor() const noexcept { return descriptor_; }
    const std::string& name() const noexcept { return name_; }
    const std::string& description() const noexcept { return command_.description; }

    const OptionParser& parser() const noexcept { return parser_; }
    const std::vector<OptionSpec>& options() const noexcept { return parser_.definitions(); }
    const std::vector<OptionRequirement>& requirements() const noexcept { return command_.requirements; }

    bool has_options() const noexcept { return !parser_.definitions().empty(); }
    bool has_required_options() const noexcept;
    bool print_help_with_no_args() const noexcept { return command_.print_help_with_no_args; }
    bool is_root() const noexcept { return command_.is_root; }
    const std::string& arguments_help() const noexcept { return command_.arguments_help; }

    bool has_handler() const noexcept { return static_cast<bool>(command_.handler); }
    int invoke(const CommandContext& context) const;

private:
    const CommandDescriptor& descriptor_;
    std::string name_;
    OptionParser parser_;
    Command command_;
};

} // namespace cmdtree

#endif // CMDTREE_COMMAND_HPP
