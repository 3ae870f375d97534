#include "cmdtree/command_context.hpp"
#include "cmdtree/command_registry.hpp"
#include "cmdtree/commands/image.hpp"
#include "cmdtree/commands/script.hpp"
#include "cmdtree/dispatcher.hpp"
#include "cmdtree/errors.hpp"
#include "cmdtree/io_service.hpp"

#include <exception>
#include <string>
#include <vector>

namespace {

constexpr const char* kToolBanner = "cmdtree";
constexpr const char* kToolVersion = "0.1.0";

// Exit statuses of the sample driver.
constexpr int kExitUnknownCommand = 2;
constexpr int kExitBadArguments = 3;
constexpr int kExitCommandFailed = 4;
constexpr int kExitConfiguration = 70;

int version_command(const cmdtree::CommandContext& context) {
    context.io.write_line(std::string(kToolBanner));
    context.io.write_line(std::string("Version: ") + kToolVersion);
    return 0;
}

const cmdtree::CommandDescriptor& register_tool(cmdtree::CommandRegistry& registry) {
    const auto& root = registry.register_command({
        .type_name = "CmdtreeCommand",
        .scope = "",
        .factory = [] {
            return cmdtree::Command{
                .description = "Sample tool built on the cmdtree command framework.",
                .options = {
                    cmdtree::OptionSpec{"verbose", 'v', {}, "Print additional details."},
                },
                .is_root = true,
            };
        },
    });

    cmdtree::commands::register_image_commands(registry, "Cmdtree");
    cmdtree::commands::register_script_command(registry, "Cmdtree");

    registry.register_command({
        .type_name = "VersionCommand",
        .scope = "Cmdtree",
        .factory = [] {
            return cmdtree::Command{
                .description = "Print the tool version.",
                .print_help_with_no_args = false,
                .handler = version_command,
            };
        },
    });

    return root;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    cmdtree::ConsoleIoService io;
    cmdtree::CommandRegistry registry;

    try {
        const auto& root = register_tool(registry);
        return cmdtree::run_command(registry, io, root, args);
    } catch (const cmdtree::UnknownCommandError& ex) {
        io.write_error_line(ex.what());
        io.write_error_line("Run '" + ex.command_path() + " --help' to list the available commands.");
        return kExitUnknownCommand;
    } catch (const cmdtree::RequirementViolation& ex) {
        for (const auto& error : ex.errors()) {
            io.write_error_line(error.message);
        }
        return kExitBadArguments;
    } catch (const cmdtree::CommandError& ex) {
        io.write_error_line(std::string("Argument error: ") + ex.what());
        return kExitBadArguments;
    } catch (const cmdtree::ConfigurationError& ex) {
        io.write_error_line(std::string("Configuration error: ") + ex.what());
        return kExitConfiguration;
    } catch (const std::exception& ex) {
        io.write_error_line(std::string("Command failed: ") + ex.what());
    }
    return kExitCommandFailed;
}
