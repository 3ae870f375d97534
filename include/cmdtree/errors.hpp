#ifndef CMDTREE_ERRORS_HPP
#define CMDTREE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace cmdtree {

// Base of every error caused by user input on the command line.
class CommandError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or truncated option arguments.
class ParseError : public CommandError {
public:
    using CommandError::CommandError;
};

// Sub-command token missing or not matching any child.
class UnknownCommandError : public CommandError {
public:
    UnknownCommandError(std::string command_path, std::string token);

    const std::string& command_path() const noexcept { return command_path_; }
    const std::string& token() const noexcept { return token_; }

private:
    std::string command_path_;
    std::string token_;
};

struct OptionRequirementError {
    std::string message;
};

// One or more requirement rules failed. Holds every violation in evaluation order.
class RequirementViolation : public CommandError {
public:
    explicit RequirementViolation(std::vector<OptionRequirementError> errors);

    const std::vector<OptionRequirementError>& errors() const noexcept { return errors_; }

private:
    std::vector<OptionRequirementError> errors_;
};

// Programming error in a command declaration. Never caused by user input.
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace cmdtree

#endif // CMDTREE_ERRORS_HPP
