#ifndef CMDTREE_OPTION_PARSER_HPP
#define CMDTREE_OPTION_PARSER_HPP

#include "cmdtree/option.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cmdtree {

struct OptionParseResult {
    std::size_t consumed = 0;
    std::vector<ParsedOption> options;
};

class OptionParser {
public:
    OptionParser();
    explicit OptionParser(std::vector<OptionSpec> definitions);

    OptionParser(const OptionParser&) = delete;
    OptionParser& operator=(const OptionParser&) = delete;

    OptionParser(OptionParser&&) = delete;
    OptionParser& operator=(OptionParser&&) = delete;

    const std::vector<OptionSpec>& definitions() const noexcept { return definitions_; }

    // Spec matching the literal command line token (`--long` or `-s`), if any.
    const OptionSpec* match(std::string_view token) const;

    // Consumes the longest prefix of recognized options and their values.
    OptionParseResult parse(const std::vector<std::string>& args) const;

private:
    std::vector<OptionSpec> definitions_;
    std::unordered_map<std::string, std::size_t> by_token_;
};

} // namespace cmdtree

#endif // CMDTREE_OPTION_PARSER_HPP
