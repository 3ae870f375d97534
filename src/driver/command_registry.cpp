#include "cmdtree/command_registry.hpp"

#include "cmdtree/errors.hpp"
#include "cmdtree/logging.hpp"

#include <algorithm>
#include <utility>

namespace cmdtree {

namespace {

std::string children_scope(const CommandDescriptor& descriptor) {
    const std::string stem = command_stem_from_type(descriptor.type_name);
    if (descriptor.scope.empty()) return stem;
    return descriptor.scope + "." + stem;
}

} // namespace

CommandRegistry::CommandRegistry() = default;

CommandRegistry::~CommandRegistry() = default;

const CommandDescriptor& CommandRegistry::register_command(CommandDescriptor descriptor) {
    if (descriptor.type_name.empty()) {
        throw ConfigurationError("command type name must not be empty");
    }
    const std::string name = command_name_from_type(descriptor.type_name);
    if (name.empty()) {
        throw ConfigurationError("command type '" + descriptor.type_name + "' derives an empty name");
    }
    if (!descriptor.factory) {
        throw ConfigurationError("command type '" + descriptor.type_name + "' has no factory");
    }
    for (const auto& existing : descriptors_) {
        if (existing->scope != descriptor.scope) continue;
        if (existing->type_name == descriptor.type_name) {
            throw ConfigurationError("duplicate command type: " + descriptor.scope + "." + descriptor.type_name);
        }
        if (command_name_from_type(existing->type_name) == name) {
            throw ConfigurationError("duplicate command name '" + name + "' in scope '" + descriptor.scope + "'");
        }
    }

    descriptors_.push_back(std::make_unique<CommandDescriptor>(std::move(descriptor)));
    CMDTREE_LOG_REGISTRY_INFO("registered %s in scope '%s'",
                              descriptors_.back()->type_name.c_str(),
                              descriptors_.back()->scope.c_str());
    return *descriptors_.back();
}

const CommandDescriptor* CommandRegistry::find(std::string_view scope, std::string_view type_name) const {
    for (const auto& descriptor : descriptors_) {
        if (descriptor->scope == scope && descriptor->type_name == type_name) {
            return descriptor.get();
        }
    }
    return nullptr;
}

const CommandDescriptor* CommandRegistry::find_child(const CommandDescriptor& parent, std::string_view name) const {
    const std::string scope = children_scope(parent);
    for (const auto& descriptor : descriptors_) {
        if (descriptor->scope == scope && command_name_from_type(descriptor->type_name) == name) {
            return descriptor.get();
        }
    }
    return nullptr;
}

std::vector<const CommandDescriptor*> CommandRegistry::children_of(const CommandDescriptor& descriptor) const {
    const std::string scope = children_scope(descriptor);
    std::vector<const CommandDescriptor*> children;
    for (const auto& candidate : descriptors_) {
        if (candidate->scope == scope) {
            children.push_back(candidate.get());
        }
    }
    std::sort(children.begin(), children.end(), [](const CommandDescriptor* a, const CommandDescriptor* b) {
        return a->type_name < b->type_name;
    });
    return children;
}

const CommandDescriptor* CommandRegistry::parent_of(const CommandDescriptor& descriptor) const {
    if (descriptor.scope.empty()) return nullptr;

    const auto separator = descriptor.scope.rfind('.');
    std::string parent_scope;
    std::string owner_stem;
    if (separator == std::string::npos) {
        owner_stem = descriptor.scope;
    } else {
        parent_scope = descriptor.scope.substr(0, separator);
        owner_stem = descriptor.scope.substr(separator + 1);
    }
    return find(parent_scope, owner_stem + "Command");
}

std::vector<const CommandDescriptor*> CommandRegistry::path_of(const CommandDescriptor& descriptor) const {
    std::vector<const CommandDescriptor*> path;
    for (const CommandDescriptor* current = &descriptor; current != nullptr; current = parent_of(*current)) {
        path.push_back(current);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::string CommandRegistry::path_names(const CommandDescriptor& descriptor) const {
    std::string names;
    for (const CommandDescriptor* entry : path_of(descriptor)) {
        if (!names.empty()) names += ' ';
        names += command_name_from_type(entry->type_name);
    }
    return names;
}

const CommandNode& CommandRegistry::resolve(const CommandDescriptor& descriptor) {
    const auto it = nodes_.find(&descriptor);
    if (it != nodes_.end()) return *it->second;

    CMDTREE_LOG_REGISTRY_DEBUG("constructing %s", descriptor.type_name.c_str());
    auto node = std::make_unique<CommandNode>(descriptor, descriptor.factory());
    const CommandNode& stored = *node;
    nodes_.emplace(&descriptor, std::move(node));
    return stored;
}

} // namespace cmdtree
