#ifndef CMDTREE_HELP_RENDERER_HPP
#define CMDTREE_HELP_RENDERER_HPP

#include <string>

namespace cmdtree {

class CommandRegistry;
struct CommandDescriptor;

// `name [NAME_OPTIONS] ... COMMAND` for the path from the root to `descriptor`.
std::string render_usage_line(CommandRegistry& registry, const CommandDescriptor& descriptor);

std::string render_command_help(CommandRegistry& registry, const CommandDescriptor& descriptor);

} // namespace cmdtree

#endif // CMDTREE_HELP_RENDERER_HPP
