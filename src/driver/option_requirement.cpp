#include "cmdtree/option_requirement.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <sstream>
#include <type_traits>
#include <utility>

namespace cmdtree {

namespace {

const ParsedOption* find_parsed(const std::vector<ParsedOption>& parsed_options, std::string_view name) {
    for (const auto& parsed : parsed_options) {
        if (parsed.option != nullptr && option_matches(*parsed.option, name)) {
            return &parsed;
        }
    }
    return nullptr;
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) joined += ", ";
        joined += items[i];
    }
    return joined;
}

std::vector<std::string> canonical_names(const std::vector<OptionSpec>& definitions,
                                         const std::vector<std::string>& names) {
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(long_token(find_option_by_name(definitions, name)));
    }
    return result;
}

std::string format_bound(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string mutual_exclusion_sentence(const std::vector<std::string>& names) {
    return join(names) + " are mutually exclusive.";
}

std::string range_sentence(const std::string& name, const RangeRequirement& rule) {
    return name + " has value in range [" + format_bound(rule.min_value) + ", " +
           format_bound(rule.max_value) + "].";
}

std::string if_present_sentence(const std::string& name, const std::string& then_line) {
    return "If " + name + " is present then " + then_line;
}

// Help lines

std::string help_line(const ExclusiveRequirement& rule, const std::vector<OptionSpec>& definitions) {
    return mutual_exclusion_sentence(canonical_names(definitions, rule.option_names));
}

std::string help_line(const RequireOneOfRequirement& rule, const std::vector<OptionSpec>& definitions) {
    return join(canonical_names(definitions, rule.option_names)) +
           (rule.option_names.size() == 1 ? " is required." : " at least one is required.");
}

std::string help_line(const IfPresentThenRequirement& rule, const std::vector<OptionSpec>& definitions) {
    return if_present_sentence(long_token(find_option_by_name(definitions, rule.option_name)),
                               requirement_help_line(*rule.then, definitions));
}

std::string help_line(const RangeRequirement& rule, const std::vector<OptionSpec>& definitions) {
    return range_sentence(long_token(find_option_by_name(definitions, rule.option_name)), rule);
}

// Validation

std::vector<OptionRequirementError> validate(const ExclusiveRequirement& rule,
                                             const std::vector<OptionSpec>& definitions,
                                             const std::vector<ParsedOption>& parsed_options) {
    for (const auto& name : rule.option_names) {
        (void)find_option_by_name(definitions, name);
    }

    std::vector<std::string> present;
    for (const auto& parsed : parsed_options) {
        const bool referenced = std::any_of(rule.option_names.begin(), rule.option_names.end(),
                                            [&](const std::string& name) {
                                                return option_matches(*parsed.option, name);
                                            });
        if (referenced) {
            present.push_back(parsed.parsed_name);
        }
    }

    if (present.size() < 2) return {};
    return {OptionRequirementError{mutual_exclusion_sentence(present)}};
}

std::vector<OptionRequirementError> validate(const RequireOneOfRequirement& rule,
                                             const std::vector<OptionSpec>& definitions,
                                             const std::vector<ParsedOption>& parsed_options) {
    const std::string line = help_line(rule, definitions);
    for (const auto& name : rule.option_names) {
        if (find_parsed(parsed_options, name) != nullptr) return {};
    }
    return {OptionRequirementError{line}};
}

std::vector<OptionRequirementError> validate(const IfPresentThenRequirement& rule,
                                             const std::vector<OptionSpec>& definitions,
                                             const std::vector<ParsedOption>& parsed_options) {
    const std::string name = long_token(find_option_by_name(definitions, rule.option_name));
    if (find_parsed(parsed_options, rule.option_name) == nullptr) return {};

    auto errors = validate_requirement(*rule.then, definitions, parsed_options);
    for (auto& error : errors) {
        error.message = if_present_sentence(name, error.message);
    }
    return errors;
}

std::vector<OptionRequirementError> validate(const RangeRequirement& rule,
                                             const std::vector<OptionSpec>& definitions,
                                             const std::vector<ParsedOption>& parsed_options) {
    const std::string name = long_token(find_option_by_name(definitions, rule.option_name));
    const ParsedOption* parsed = find_parsed(parsed_options, rule.option_name);
    if (parsed == nullptr) return {};

    const std::string token = parsed->arguments.empty() ? std::string() : parsed->arguments.front();
    const std::optional<double> value = parse_number(token);
    if (!value) {
        return {OptionRequirementError{"Invalid argument value: " + parsed->parsed_name + " " + token}};
    }

    if (*value >= rule.min_value && *value <= rule.max_value) return {};
    return {OptionRequirementError{range_sentence(name, rule)}};
}

} // namespace

OptionRequirement::OptionRequirement(Rule rule)
    : rule_(std::move(rule)) {}

std::vector<std::string> OptionRequirement::option_names() const {
    return std::visit([](const auto& rule) -> std::vector<std::string> {
        using T = std::decay_t<decltype(rule)>;
        if constexpr (std::is_same_v<T, IfPresentThenRequirement>) {
            std::vector<std::string> names{rule.option_name};
            for (auto& nested : rule.then->option_names()) {
                names.push_back(std::move(nested));
            }
            return names;
        } else if constexpr (std::is_same_v<T, RangeRequirement>) {
            return {rule.option_name};
        } else {
            return rule.option_names;
        }
    }, rule_);
}

OptionRequirement exclusive(std::vector<std::string> option_names) {
    if (option_names.size() < 2) {
        throw ConfigurationError("Exclusive requirement needs at least two options");
    }
    return OptionRequirement(ExclusiveRequirement{std::move(option_names)});
}

OptionRequirement require_one_of(std::vector<std::string> option_names) {
    if (option_names.empty()) {
        throw ConfigurationError("RequireOneOf requirement needs at least one option");
    }
    return OptionRequirement(RequireOneOfRequirement{std::move(option_names)});
}

OptionRequirement if_present_then(std::string option_name, OptionRequirement then) {
    return OptionRequirement(IfPresentThenRequirement{
        std::move(option_name),
        std::make_shared<const OptionRequirement>(std::move(then))});
}

OptionRequirement range(std::string option_name, double min_value, double max_value) {
    if (!(min_value < max_value)) {
        throw ConfigurationError("Min value must be smaller than max value");
    }
    return OptionRequirement(RangeRequirement{std::move(option_name), min_value, max_value});
}

const OptionSpec& find_option_by_name(const std::vector<OptionSpec>& definitions, std::string_view name) {
    for (const auto& option : definitions) {
        if (option_matches(option, name)) {
            return option;
        }
    }
    throw ConfigurationError("Requirement references undeclared option '" + std::string(name) + "'");
}

void check_requirement(const OptionRequirement& requirement, const std::vector<OptionSpec>& definitions) {
    for (const auto& name : requirement.option_names()) {
        (void)find_option_by_name(definitions, name);
    }
    std::visit([&](const auto& rule) {
        using T = std::decay_t<decltype(rule)>;
        if constexpr (std::is_same_v<T, RangeRequirement>) {
            if (find_option_by_name(definitions, rule.option_name).argument_kinds.empty()) {
                throw ConfigurationError("Range requirement on option '--" +
                                         find_option_by_name(definitions, rule.option_name).long_name +
                                         "' which takes no value");
            }
        } else if constexpr (std::is_same_v<T, IfPresentThenRequirement>) {
            check_requirement(*rule.then, definitions);
        }
    }, requirement.rule());
}

std::string requirement_help_line(const OptionRequirement& requirement, const std::vector<OptionSpec>& definitions) {
    return std::visit([&](const auto& rule) { return help_line(rule, definitions); }, requirement.rule());
}

std::vector<OptionRequirementError> validate_requirement(const OptionRequirement& requirement,
                                                         const std::vector<OptionSpec>& definitions,
                                                         const std::vector<ParsedOption>& parsed_options) {
    return std::visit([&](const auto& rule) { return validate(rule, definitions, parsed_options); },
                      requirement.rule());
}

std::vector<OptionRequirementError> validate_requirements(const std::vector<OptionSpec>& definitions,
                                                          const std::vector<OptionRequirement>& requirements,
                                                          const std::vector<ParsedOption>& parsed_options) {
    std::vector<OptionRequirementError> errors;
    for (const auto& requirement : requirements) {
        auto found = validate_requirement(requirement, definitions, parsed_options);
        errors.insert(errors.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    return errors;
}

} // namespace cmdtree
