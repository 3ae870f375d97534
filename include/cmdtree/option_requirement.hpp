#ifndef CMDTREE_OPTION_REQUIREMENT_HPP
#define CMDTREE_OPTION_REQUIREMENT_HPP

#include "cmdtree/errors.hpp"
#include "cmdtree/option.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cmdtree {

class OptionRequirement;

// Violated when two or more of the named options are present.
struct ExclusiveRequirement {
    std::vector<std::string> option_names;
};

// Violated when none of the named options is present.
struct RequireOneOfRequirement {
    std::vector<std::string> option_names;
};

// Evaluates `then` only when `option_name` is present.
struct IfPresentThenRequirement {
    std::string option_name;
    std::shared_ptr<const OptionRequirement> then;
};

// Violated when the first argument of the option falls outside [min_value, max_value].
struct RangeRequirement {
    std::string option_name;
    double min_value = 0.0;
    double max_value = 0.0;
};

class OptionRequirement {
public:
    using Rule = std::variant<ExclusiveRequirement,
                              RequireOneOfRequirement,
                              IfPresentThenRequirement,
                              RangeRequirement>;

    explicit OptionRequirement(Rule rule);

    const Rule& rule() const noexcept { return rule_; }

    // Every option name referenced, nested rules included.
    std::vector<std::string> option_names() const;

private:
    Rule rule_;
};

OptionRequirement exclusive(std::vector<std::string> option_names);
OptionRequirement require_one_of(std::vector<std::string> option_names);
OptionRequirement if_present_then(std::string option_name, OptionRequirement then);
OptionRequirement range(std::string option_name, double min_value, double max_value);

// Throws ConfigurationError when no definition has `name` as long or short name.
const OptionSpec& find_option_by_name(const std::vector<OptionSpec>& definitions, std::string_view name);

// Checks that `requirement` only references declared options and that range
// rules target options taking a value.
void check_requirement(const OptionRequirement& requirement, const std::vector<OptionSpec>& definitions);

std::string requirement_help_line(const OptionRequirement& requirement, const std::vector<OptionSpec>& definitions);

// Runs every rule and returns all violations, in rule order.
std::vector<OptionRequirementError> validate_requirements(const std::vector<OptionSpec>& definitions,
                                                          const std::vector<OptionRequirement>& requirements,
                                                          const std::vector<ParsedOption>& parsed_options);

std::vector<OptionRequirementError> validate_requirement(const OptionRequirement& requirement,
                                                         const std::vector<OptionSpec>& definitions,
                                                         const std::vector<ParsedOption>& parsed_options);

} // namespace cmdtree

#endif // CMDTREE_OPTION_REQUIREMENT_HPP
