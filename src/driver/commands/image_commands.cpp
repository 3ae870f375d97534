#include "cmdtree/commands/image.hpp"

#include "cmdtree/command_context.hpp"
#include "cmdtree/io_service.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace cmdtree::commands {
namespace {

// Options of any enclosing command apply to the whole invocation.
bool inherited_flag(const CommandContext& context, const char* name) {
    for (const CommandContext* level = &context; level != nullptr; level = level->parent) {
        if (level->options.has(name)) return true;
    }
    return false;
}

std::string join_scope(const std::string& scope, const char* stem) {
    return scope.empty() ? std::string(stem) : scope + "." + stem;
}

int pull_command(const CommandContext& context) {
    if (context.arguments.size() != 1) {
        context.io.write_error_line("pull expects exactly one REPOSITORY argument.");
        return 1;
    }
    const std::string& repository = context.arguments.front();
    std::ostringstream out;
    if (context.options.has("all-tags")) {
        out << "Pulling all tags of " << repository;
    } else {
        out << "Pulling " << repository << ":" << context.options.value_or("tag", "latest");
    }
    const int64_t retries = context.options.value_as_int("retries", 0);
    if (retries > 0) {
        out << " (up to " << retries << " retries)";
    }
    context.io.write_line(out.str());
    if (inherited_flag(context, "verbose")) {
        context.io.write_line("  registry: " + context.options.value_or("registry", "default"));
    }
    return 0;
}

int push_command(const CommandContext& context) {
    if (context.arguments.size() != 1) {
        context.io.write_error_line("push expects exactly one REPOSITORY argument.");
        return 1;
    }
    const std::string& repository = context.arguments.front();
    if (!context.options.has("quiet")) {
        context.io.write_line("Pushing " + repository + ":" + context.options.value_or("tag", "latest"));
    }
    const double ratio = context.options.value_as_double("compression", 1.0);
    if (inherited_flag(context, "verbose")) {
        std::ostringstream out;
        out << "  compression: " << ratio;
        context.io.write_line(out.str());
    }
    return 0;
}

int ls_command(const CommandContext& context) {
    const int64_t limit = context.options.value_as_int("limit", 10);
    const std::string filter = context.options.value_or("filter", "");
    static const std::vector<std::string> kImages = {"alpine", "busybox", "debian", "ubuntu"};

    int64_t shown = 0;
    for (const auto& image : kImages) {
        if (shown >= limit) break;
        if (!filter.empty() && image.find(filter) == std::string::npos) continue;
        context.io.write_line(image);
        ++shown;
    }
    return 0;
}

} // namespace

const CommandDescriptor& register_image_commands(CommandRegistry& registry, const std::string& scope) {
    const auto& image = registry.register_command({
        .type_name = "ImageCommand",
        .scope = scope,
        .factory = [] {
            return Command{
                .description = "Manage images.",
            };
        },
    });

    const std::string image_scope = join_scope(scope, "Image");

    registry.register_command({
        .type_name = "PullCommand",
        .scope = image_scope,
        .factory = [] {
            return Command{
                .description = "Download an image from a registry.",
                .options = {
                    OptionSpec{"tag", 't', {ArgumentKind::String}, "Tag to pull (default latest)."},
                    OptionSpec{"all-tags", 'a', {}, "Pull every tagged image of the repository."},
                    OptionSpec{"registry", '\0', {ArgumentKind::String}, "Registry host name."},
                    OptionSpec{"retries", 'r', {ArgumentKind::Integer}, "Retries on transient failures."},
                },
                .requirements = {
                    exclusive({"tag", "all-tags"}),
                    range("retries", 0, 10),
                },
                .arguments_help = "REPOSITORY",
                .handler = pull_command,
            };
        },
    });

    registry.register_command({
        .type_name = "PushCommand",
        .scope = image_scope,
        .factory = [] {
            return Command{
                .description = "Upload an image to a registry.",
                .options = {
                    OptionSpec{"tag", 't', {ArgumentKind::String}, "Tag to push."},
                    OptionSpec{"quiet", 'q', {}, "Suppress progress output."},
                    OptionSpec{"compression", 'c', {ArgumentKind::Double}, "Layer compression ratio."},
                },
                .requirements = {
                    require_one_of({"tag"}),
                    range("compression", 0.1, 1.0),
                },
                .arguments_help = "REPOSITORY",
                .handler = push_command,
            };
        },
    });

    registry.register_command({
        .type_name = "LsCommand",
        .scope = image_scope,
        .factory = [] {
            return Command{
                .description = "List local images.",
                .options = {
                    OptionSpec{"filter", 'f', {ArgumentKind::String}, "Only show names containing the text."},
                    OptionSpec{"limit", 'n', {ArgumentKind::Integer}, "Maximum number of images shown."},
                },
                .requirements = {
                    if_present_then("filter", range("limit", 1, 100)),
                },
                .print_help_with_no_args = false,
                .handler = ls_command,
            };
        },
    });

    return image;
}

} // namespace cmdtree::commands
