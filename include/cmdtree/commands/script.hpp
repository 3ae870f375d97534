#ifndef CMDTREE_COMMANDS_SCRIPT_HPP
#define CMDTREE_COMMANDS_SCRIPT_HPP

#include "cmdtree/command_registry.hpp"

#include <string>

namespace cmdtree::commands {

// Exit status of the script command when the build has no LuaJIT support.
constexpr int kScriptingDisabledStatus = 64;

// Registers `ScriptCommand` in `scope`; scripts dispatch from the root of that tree.
const CommandDescriptor& register_script_command(CommandRegistry& registry, std::string scope);

} // namespace cmdtree::commands

#endif // CMDTREE_COMMANDS_SCRIPT_HPP
