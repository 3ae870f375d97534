#include "cmdtree/option_parser.hpp"

#include "cmdtree/errors.hpp"
#include "cmdtree/logging.hpp"

#include <sstream>
#include <utility>

namespace cmdtree {

namespace {

void ensure_single_occurrence(const OptionSpec& option, const std::vector<ParsedOption>& parsed) {
    for (const auto& existing : parsed) {
        if (existing.option == &option) {
            throw ParseError("Option '" + long_token(option) + "' specified multiple times");
        }
    }
}

} // namespace

OptionParser::OptionParser() = default;

OptionParser::OptionParser(std::vector<OptionSpec> definitions)
    : definitions_(std::move(definitions)) {
    for (std::size_t index = 0; index < definitions_.size(); ++index) {
        const auto& option = definitions_[index];
        if (option.long_name.empty()) {
            throw ConfigurationError("Option long name must not be empty");
        }
        if (!by_token_.emplace(long_token(option), index).second) {
            throw ConfigurationError("Duplicate option long name: " + long_token(option));
        }
        if (option.short_name != '\0') {
            if (!by_token_.emplace(short_token(option), index).second) {
                std::ostringstream oss;
                oss << "Duplicate short option: -" << option.short_name;
                throw ConfigurationError(oss.str());
            }
        }
    }
}

const OptionSpec* OptionParser::match(std::string_view token) const {
    const auto it = by_token_.find(std::string(token));
    if (it == by_token_.end()) return nullptr;
    return &definitions_.at(it->second);
}

OptionParseResult OptionParser::parse(const std::vector<std::string>& args) const {
    OptionParseResult result;

    std::size_t i = 0;
    while (i < args.size()) {
        const std::string& token = args[i];
        const OptionSpec* spec = match(token);
        if (spec == nullptr) {
            break;
        }

        const std::size_t arity = spec->argument_kinds.size();
        if (args.size() - i - 1 < arity) {
            std::ostringstream oss;
            oss << "Option '" << token << "' expects " << arity
                << (arity == 1 ? " value" : " values");
            throw ParseError(oss.str());
        }
        ensure_single_occurrence(*spec, result.options);

        ParsedOption parsed;
        parsed.option = spec;
        parsed.parsed_name = token;
        parsed.arguments.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                args.begin() + static_cast<std::ptrdiff_t>(i + 1 + arity));
        result.options.push_back(std::move(parsed));
        i += 1 + arity;
    }

    result.consumed = i;
    CMDTREE_LOG_DISPATCH_TRACE("parsed %zu option(s) from %zu token(s)", result.options.size(), result.consumed);
    return result;
}

} // namespace cmdtree
