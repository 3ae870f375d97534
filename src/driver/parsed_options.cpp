#include "cmdtree/parsed_options.hpp"

#include "cmdtree/errors.hpp"

#include <utility>

namespace cmdtree {

namespace {
const std::vector<std::string> kEmptyValues;
}

ParsedOptions::ParsedOptions() = default;

ParsedOptions::ParsedOptions(std::vector<ParsedOption> options)
    : options_(std::move(options)) {}

bool ParsedOptions::has(std::string_view name) const {
    return find(name) != nullptr;
}

const ParsedOption* ParsedOptions::find(std::string_view name) const {
    for (const auto& parsed : options_) {
        if (parsed.option != nullptr && option_matches(*parsed.option, name)) {
            return &parsed;
        }
    }
    return nullptr;
}

const std::vector<std::string>& ParsedOptions::values(std::string_view name) const {
    const ParsedOption* parsed = find(name);
    if (parsed == nullptr) {
        return kEmptyValues;
    }
    return parsed->arguments;
}

std::optional<std::string> ParsedOptions::value(std::string_view name) const {
    const ParsedOption* parsed = find(name);
    if (parsed == nullptr || parsed->arguments.empty()) {
        return std::nullopt;
    }
    return parsed->arguments.front();
}

std::string ParsedOptions::value_or(std::string_view name, std::string_view fallback) const {
    auto opt = value(name);
    if (opt) {
        return *opt;
    }
    return std::string(fallback);
}

int64_t ParsedOptions::value_as_int(std::string_view name, int64_t fallback) const {
    auto opt = value(name);
    if (!opt) {
        return fallback;
    }
    const std::optional<int64_t> parsed = parse_integer(*opt);
    if (!parsed) {
        throw ParseError("Option '" + find(name)->parsed_name + "' expects an integer value");
    }
    return *parsed;
}

int64_t ParsedOptions::require_int(std::string_view name) const {
    auto opt = value(name);
    if (!opt) {
        throw ParseError("Missing required option '" + std::string(name) + "'");
    }
    return value_as_int(name, 0);
}

double ParsedOptions::value_as_double(std::string_view name, double fallback) const {
    auto opt = value(name);
    if (!opt) {
        return fallback;
    }
    const std::optional<double> parsed = parse_number(*opt);
    if (!parsed) {
        throw ParseError("Option '" + find(name)->parsed_name + "' expects a numeric value");
    }
    return *parsed;
}

} // namespace cmdtree
