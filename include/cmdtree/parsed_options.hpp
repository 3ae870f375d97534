#ifndef CMDTREE_PARSED_OPTIONS_HPP
#define CMDTREE_PARSED_OPTIONS_HPP

#include "cmdtree/option.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmdtree {

// Options parsed for one command on one invocation. Names are looked up by
// long name or short name, the same way requirement rules refer to them.
class ParsedOptions {
public:
    ParsedOptions();
    explicit ParsedOptions(std::vector<ParsedOption> options);

    bool has(std::string_view name) const;
    const ParsedOption* find(std::string_view name) const;

    const std::vector<std::string>& values(std::string_view name) const;
    std::optional<std::string> value(std::string_view name) const;
    std::string value_or(std::string_view name, std::string_view fallback) const;

    int64_t value_as_int(std::string_view name, int64_t fallback) const;
    int64_t require_int(std::string_view name) const;
    double value_as_double(std::string_view name, double fallback) const;

    std::size_t size() const noexcept { return options_.size(); }
    bool empty() const noexcept { return options_.empty(); }
    const std::vector<ParsedOption>& all() const noexcept { return options_; }

private:
    std::vector<ParsedOption> options_;
};

} // namespace cmdtree

#endif // CMDTREE_PARSED_OPTIONS_HPP
