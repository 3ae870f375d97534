#ifndef CMDTREE_COMMANDS_IMAGE_HPP
#define CMDTREE_COMMANDS_IMAGE_HPP

#include "cmdtree/command_registry.hpp"

#include <string>

namespace cmdtree::commands {

// Registers `ImageCommand` with `pull`, `push` and `ls` below it, in `scope`.
const CommandDescriptor& register_image_commands(CommandRegistry& registry, const std::string& scope);

}

#endif // CMDTREE_COMMANDS_IMAGE_HPP
