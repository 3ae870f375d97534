#ifndef CMDTREE_OPTION_HPP
#define CMDTREE_OPTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmdtree {

enum class ArgumentKind {
    String,
    Integer,
    Double
};

// Lower-case placeholder shown in help output.
std::string_view argument_kind_name(ArgumentKind kind) noexcept;

struct OptionSpec {
    std::string long_name;
    char short_name = '\0';
    std::vector<ArgumentKind> argument_kinds;
    std::string description;
};

struct ParsedOption {
    const OptionSpec* option = nullptr;
    std::string parsed_name;
    std::vector<std::string> arguments;
};

// True when `name` is the long name or the single-character short name of `option`.
bool option_matches(const OptionSpec& option, std::string_view name) noexcept;

std::string long_token(const OptionSpec& option);
std::string short_token(const OptionSpec& option);

// Decimal readings of an option value. Surrounding whitespace and one leading
// '+' are accepted; hexadecimal, octal and trailing characters are not.
std::optional<double> parse_number(std::string_view text) noexcept;
std::optional<int64_t> parse_integer(std::string_view text) noexcept;

} // namespace cmdtree

#endif // CMDTREE_OPTION_HPP
