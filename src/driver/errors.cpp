#include "cmdtree/errors.hpp"

#include <utility>

namespace cmdtree {

namespace {

std::string unknown_command_message(const std::string& command_path, const std::string& token) {
    if (token.empty()) {
        return command_path + ": a command name is required.";
    }
    return command_path + ": '" + token + "' is not a valid command.";
}

std::string join_messages(const std::vector<OptionRequirementError>& errors) {
    std::string message;
    for (const auto& error : errors) {
        if (!message.empty()) message += '\n';
        message += error.message;
    }
    return message;
}

} // namespace

UnknownCommandError::UnknownCommandError(std::string command_path, std::string token)
    : CommandError(unknown_command_message(command_path, token)),
      command_path_(std::move(command_path)),
      token_(std::move(token)) {}

RequirementViolation::RequirementViolation(std::vector<OptionRequirementError> errors)
    : CommandError(join_messages(errors)),
      errors_(std::move(errors)) {}

} // namespace cmdtree
