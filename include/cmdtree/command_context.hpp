#ifndef CMDTREE_COMMAND_CONTEXT_HPP
#define CMDTREE_COMMAND_CONTEXT_HPP

#include "cmdtree/parsed_options.hpp"

#include <string>
#include <vector>

namespace cmdtree {

class CommandRegistry;
class CommandNode;
class IoService;

// State of one command level during one invocation. `parent` is the context
// of the enclosing command, null at the root.
struct CommandContext {
    CommandRegistry& registry;
    IoService& io;
    const CommandNode& command;
    ParsedOptions options;
    std::vector<std::string> arguments;
    const CommandContext* parent = nullptr;
};

} // namespace cmdtree

#endif // CMDTREE_COMMAND_CONTEXT_HPP
