#include "cmdtree/help_renderer.hpp"

#include "cmdtree/command_registry.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

namespace cmdtree {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

void rtrim(std::string& text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
}

std::string option_label(const OptionSpec& option) {
    std::string label = option.short_name == '\0' ? "    " : short_token(option) + ", ";
    label += long_token(option);
    for (const auto kind : option.argument_kinds) {
        label += ' ';
        label += argument_kind_name(kind);
    }
    return label;
}

// Rows of `  label<pad>description`, padded to the longest label plus four.
void append_table(std::ostringstream& out, const std::vector<std::pair<std::string, std::string>>& rows) {
    std::size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.first.size());
    }
    width += 4;
    for (const auto& row : rows) {
        out << "  " << row.first << std::string(width - row.first.size(), ' ') << row.second << "\n";
    }
}

} // namespace

std::string render_usage_line(CommandRegistry& registry, const CommandDescriptor& descriptor) {
    std::string usage;
    for (const CommandDescriptor* entry : registry.path_of(descriptor)) {
        const CommandNode& command = registry.resolve(*entry);
        usage += command.name();
        if (command.has_options()) {
            const std::string placeholder = to_upper(command.name()) + "_OPTIONS";
            usage += command.has_required_options() ? " " + placeholder : " [" + placeholder + "]";
        }
        usage += ' ';
    }
    const CommandNode& command = registry.resolve(descriptor);
    usage += registry.children_of(descriptor).empty() ? command.arguments_help() : "COMMAND";
    rtrim(usage);
    return usage;
}

std::string render_command_help(CommandRegistry& registry, const CommandDescriptor& descriptor) {
    const CommandNode& command = registry.resolve(descriptor);
    const std::string path = registry.path_names(descriptor);
    std::ostringstream out;

    out << path << "\n";
    out << command.description() << "\n\n";

    out << "Usage:  " << render_usage_line(registry, descriptor) << "\n\n";

    const auto children = registry.children_of(descriptor);
    if (!children.empty()) {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const CommandDescriptor* child : children) {
            const CommandNode& node = registry.resolve(*child);
            rows.emplace_back(node.name(), node.description());
        }
        out << "Commands:\n";
        append_table(out, rows);
        out << "\n";
    }

    if (command.has_options()) {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto& option : command.options()) {
            rows.emplace_back(option_label(option), option.description);
        }
        out << "Options:\n";
        append_table(out, rows);
        out << "\n";

        if (!command.requirements().empty()) {
            out << "Option requirements:\n";
            for (const auto& requirement : command.requirements()) {
                out << "  " << requirement_help_line(requirement, command.options()) << "\n";
            }
            out << "\n";
        }
    }

    out << "Run '" << path << " -h' or '" << path << " --help' to print help.\n";
    if (command.is_root()) {
        out << "Run '" << path << " COMMAND -h' or '" << path
            << " COMMAND --help' for more information on a command.\n";
    }
    out << "\n";
    return out.str();
}

} // namespace cmdtree
