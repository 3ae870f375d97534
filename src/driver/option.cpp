#include "cmdtree/option.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace cmdtree {

namespace {

std::string_view trim_number(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

} // namespace

std::string_view argument_kind_name(ArgumentKind kind) noexcept {
    switch (kind) {
    case ArgumentKind::String:
        return "string";
    case ArgumentKind::Integer:
        return "int";
    case ArgumentKind::Double:
        return "double";
    }
    return "value";
}

bool option_matches(const OptionSpec& option, std::string_view name) noexcept {
    if (name == option.long_name) return true;
    return option.short_name != '\0' && name.size() == 1 && name.front() == option.short_name;
}

std::string long_token(const OptionSpec& option) {
    return "--" + option.long_name;
}

std::string short_token(const OptionSpec& option) {
    if (option.short_name == '\0') return {};
    return std::string("-") + option.short_name;
}

std::optional<double> parse_number(std::string_view text) noexcept {
    text = trim_number(text);
    if (text.empty()) return std::nullopt;
    const char* last = text.data() + text.size();
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), last, value, std::chars_format::general);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

std::optional<int64_t> parse_integer(std::string_view text) noexcept {
    text = trim_number(text);
    if (text.empty()) return std::nullopt;
    const char* last = text.data() + text.size();
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), last, value, 10);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

} // namespace cmdtree
