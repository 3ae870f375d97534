#ifndef CMDTREE_DISPATCHER_HPP
#define CMDTREE_DISPATCHER_HPP

#include <string>
#include <vector>

namespace cmdtree {

class CommandRegistry;
class IoService;
struct CommandDescriptor;

bool is_help_token(const std::string& token) noexcept;

// Walks the command tree from `root`, each level consuming its own options and
// handing the rest down, and runs the action of the command reached. Returns the
// action's status, or 0 when help was printed.
//
// Throws ParseError, RequirementViolation and UnknownCommandError for bad input,
// ConfigurationError for broken declarations. Exceptions raised by actions
// propagate unchanged.
int run_command(CommandRegistry& registry,
                IoService& io,
                const CommandDescriptor& root,
                const std::vector<std::string>& args);

} // namespace cmdtree

#endif // CMDTREE_DISPATCHER_HPP
