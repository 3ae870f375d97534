#include "cmdtree/dispatcher.hpp"

#include "cmdtree/command_context.hpp"
#include "cmdtree/command_registry.hpp"
#include "cmdtree/errors.hpp"
#include "cmdtree/help_renderer.hpp"
#include "cmdtree/io_service.hpp"
#include "cmdtree/logging.hpp"

#include <cstddef>
#include <utility>

namespace cmdtree {

namespace {

bool should_print_help(const CommandNode& command, const std::vector<std::string>& args) {
    if (args.empty()) return command.print_help_with_no_args();
    return args.size() == 1 && is_help_token(args.front());
}

int run_level(CommandRegistry& registry,
              IoService& io,
              const CommandDescriptor& descriptor,
              const std::vector<std::string>& args,
              const CommandContext* parent) {
    const CommandNode& command = registry.resolve(descriptor);

    if (should_print_help(command, args)) {
        CMDTREE_LOG_DISPATCH_DEBUG("printing help for '%s'", command.name().c_str());
        io.write(render_command_help(registry, descriptor));
        return 0;
    }

    OptionParseResult parsed = command.parser().parse(args);
    auto errors = validate_requirements(command.options(), command.requirements(), parsed.options);
    if (!errors.empty()) {
        CMDTREE_LOG_DISPATCH_INFO("'%s': %zu requirement violation(s)", command.name().c_str(), errors.size());
        throw RequirementViolation(std::move(errors));
    }

    CommandContext context{
        registry,
        io,
        command,
        ParsedOptions{std::move(parsed.options)},
        std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(parsed.consumed), args.end()),
        parent};

    if (registry.children_of(descriptor).empty()) {
        CMDTREE_LOG_DISPATCH_DEBUG("executing '%s' with %zu argument(s)",
                                   command.name().c_str(), context.arguments.size());
        return command.invoke(context);
    }

    const std::string path = registry.path_names(descriptor);
    if (context.arguments.empty()) {
        throw UnknownCommandError(path, "");
    }

    const std::string& token = context.arguments.front();
    const CommandDescriptor* child = registry.find_child(descriptor, token);
    if (child == nullptr) {
        CMDTREE_LOG_DISPATCH_WARN("'%s': no sub-command '%s'", path.c_str(), token.c_str());
        throw UnknownCommandError(path, token);
    }

    CMDTREE_LOG_DISPATCH_DEBUG("'%s' -> '%s'", path.c_str(), token.c_str());
    const std::vector<std::string> rest(context.arguments.begin() + 1, context.arguments.end());
    return run_level(registry, io, *child, rest, &context);
}

} // namespace

bool is_help_token(const std::string& token) noexcept {
    return token == "-h" || token == "--help";
}

int run_command(CommandRegistry& registry,
                IoService& io,
                const CommandDescriptor& root,
                const std::vector<std::string>& args) {
    return run_level(registry, io, root, args, nullptr);
}

} // namespace cmdtree
