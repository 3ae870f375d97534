#ifndef CMDTREE_COMMAND_REGISTRY_HPP
#define CMDTREE_COMMAND_REGISTRY_HPP

#include "cmdtree/command.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cmdtree {

using CommandFactory = std::function<Command()>;

// Static registration record of a command type. `scope` is the dot-separated
// namespace the type lives in; the children of `FooCommand` in scope `a.b`
// live in scope `a.b.Foo`.
struct CommandDescriptor {
    std::string type_name;
    std::string scope;
    CommandFactory factory;
};

class CommandRegistry {
public:
    CommandRegistry();
    ~CommandRegistry();

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    const CommandDescriptor& register_command(CommandDescriptor descriptor);

    const CommandDescriptor* find(std::string_view scope, std::string_view type_name) const;
    const CommandDescriptor* find_child(const CommandDescriptor& parent, std::string_view name) const;

    // Sorted by type name.
    std::vector<const CommandDescriptor*> children_of(const CommandDescriptor& descriptor) const;
    const CommandDescriptor* parent_of(const CommandDescriptor& descriptor) const;

    // Root first, `descriptor` last. Recomputed on every call.
    std::vector<const CommandDescriptor*> path_of(const CommandDescriptor& descriptor) const;
    std::string path_names(const CommandDescriptor& descriptor) const;

    // Builds the node on first use and keeps it for the lifetime of the registry.
    const CommandNode& resolve(const CommandDescriptor& descriptor);

    const std::vector<std::unique_ptr<CommandDescriptor>>& descriptors() const noexcept { return descriptors_; }

private:
    std::vector<std::unique_ptr<CommandDescriptor>> descriptors_;
    std::unordered_map<const CommandDescriptor*, std::unique_ptr<CommandNode>> nodes_;
};

} // namespace cmdtree

#endif // CMDTREE_COMMAND_REGISTRY_HPP
