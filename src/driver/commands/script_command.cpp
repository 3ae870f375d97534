#include "cmdtree/commands/script.hpp"

#include "cmdtree/command_context.hpp"
#include "cmdtree/command_registry.hpp"
#include "cmdtree/io_service.hpp"

#include <string>
#include <utility>

#if CMDTREE_WITH_LUAJIT
#include "cmdtree/scripting/lua_engine.hpp"

#include <exception>
#include <filesystem>
#include <vector>
extern "C" {
#include "lua.hpp"
}
#endif

namespace cmdtree::commands {
namespace {

int script_command(const CommandContext& context) {
#if CMDTREE_WITH_LUAJIT
    const auto& positionals = context.arguments;
    if (positionals.empty()) {
        context.io.write_error_line("script command expects a Lua file path.");
        return 1;
    }

    scripting::ScriptOptions options;
    options.path = positionals.front();
    options.allow_unsafe_libraries = context.options.has("allow-unsafe");
    for (std::size_t i = 1; i < positionals.size(); ++i) {
        options.args.push_back(positionals[i]);
    }

    std::filesystem::path script_path(options.path);
    if (!script_path.is_absolute()) {
        script_path = std::filesystem::absolute(script_path);
        options.path = script_path.string();
    }

    if (!std::filesystem::exists(script_path)) {
        context.io.write_error_line("Script file '" + options.path + "' does not exist.");
        return 1;
    }
    if (!std::filesystem::is_regular_file(script_path)) {
        context.io.write_error_line("Script path '" + options.path + "' is not a regular file.");
        return 1;
    }

    const auto path = context.registry.path_of(context.command.descriptor());
    try {
        scripting::LuaEngine engine(context.registry, context.io, *path.front());
        engine.open_standard_libraries(options.allow_unsafe_libraries);
        engine.register_bindings();
        const int status = engine.run_file(options);
        if (status != LUA_OK) {
            context.io.write_error_line("Lua interpreter returned status code " + std::to_string(status) + ".");
            return 6;
        }
    } catch (const std::exception& ex) {
        context.io.write_error_line(std::string("Failed to run Lua script: ") + ex.what());
        return 6;
    }
    return 0;
#else
    context.io.write_error_line("Lua scripting support is not enabled. Reconfigure with -DCMDTREE_WITH_LUAJIT=ON.");
    return kScriptingDisabledStatus;
#endif
}

} // namespace

const CommandDescriptor& register_script_command(CommandRegistry& registry, std::string scope) {
    return registry.register_command({
        .type_name = "ScriptCommand",
        .scope = std::move(scope),
        .factory = [] {
            return Command{
                .description = "Run a Lua script that drives this tool through exec().",
                .options = {
                    OptionSpec{
                        .long_name = "allow-unsafe",
                        .short_name = '\0',
                        .argument_kinds = {},
                        .description = "Expose Lua's os/io libraries (disabled by default)."
                    },
                },
                .requirements = {},
                .options_required = false,
                .print_help_with_no_args = true,
                .is_root = false,
                .arguments_help = "SCRIPT [ARGS...]",
                .handler = script_command,
            };
        },
    });
}

} // namespace cmdtree::commands
