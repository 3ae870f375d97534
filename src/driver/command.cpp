#include "cmdtree/command.hpp"

#include "cmdtree/command_context.hpp"
#include "cmdtree/command_registry.hpp"
#include "cmdtree/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <variant>

namespace cmdtree {

namespace {
constexpr std::string_view kCommandSuffix = "Command";
}

std::string command_stem_from_type(std::string_view type_name) {
    if (type_name.size() >= kCommandSuffix.size() &&
        type_name.substr(type_name.size() - kCommandSuffix.size()) == kCommandSuffix) {
        type_name.remove_suffix(kCommandSuffix.size());
    }
    return std::string(type_name);
}

std::string command_name_from_type(std::string_view type_name) {
    std::string name = command_stem_from_type(type_name);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

CommandNode::CommandNode(const CommandDescriptor& descriptor, Command command)
    : descriptor_(descriptor),
      name_(command_name_from_type(descriptor.type_name)),
      parser_(std::move(command.options)),
      command_(std::move(command)) {
    if (name_.empty()) {
        throw ConfigurationError("command type '" + descriptor.type_name + "' derives an empty name");
    }
    if (command_.description.empty()) {
        throw ConfigurationError("command '" + name_ + "' has no description");
    }
    for (const auto& requirement : command_.requirements) {
        check_requirement(requirement, parser_.definitions());
    }
}

bool CommandNode::has_required_options() const noexcept {
    if (!has_options()) return false;
    if (command_.options_required) return true;
    return std::any_of(command_.requirements.begin(), command_.requirements.end(), [](const OptionRequirement& r) {
        return std::holds_alternative<RequireOneOfRequirement>(r.rule());
    });
}

int CommandNode::invoke(const CommandContext& context) const {
    if (!command_.handler) {
        throw ConfigurationError("command '" + name_ + "' has no sub-commands and no action");
    }
    return command_.handler(context);
}

} // namespace cmdtree
