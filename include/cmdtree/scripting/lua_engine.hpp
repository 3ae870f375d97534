#ifndef CMDTREE_SCRIPTING_LUA_ENGINE_HPP
#define CMDTREE_SCRIPTING_LUA_ENGINE_HPP

// Available only in builds with CMDTREE_WITH_LUAJIT.
#if CMDTREE_WITH_LUAJIT

#include "cmdtree/command_registry.hpp"
#include "cmdtree/io_service.hpp"

#include <string>
#include <vector>

extern "C" {
struct lua_State;
}

namespace cmdtree::scripting {

struct ScriptOptions {
    std::string path;
    std::vector<std::string> args;
    bool allow_unsafe_libraries = false;
};

// Lua state whose `exec(...)` runs command lines from `root` of `registry`.
class LuaEngine {
public:
    LuaEngine(CommandRegistry& registry, IoService& io, const CommandDescriptor& root);
    ~LuaEngine();

    LuaEngine(const LuaEngine&) = delete;
    LuaEngine& operator=(const LuaEngine&) = delete;

    LuaEngine(LuaEngine&&) = delete;
    LuaEngine& operator=(LuaEngine&&) = delete;

    void open_standard_libraries(bool allow_unsafe);
    void register_bindings();
    int run_file(const ScriptOptions& options);

private:
    CommandRegistry& registry_;
    IoService& io_;
    const CommandDescriptor& root_;
    ::lua_State* state_ = nullptr;

    void push_script_arguments(const ScriptOptions& options);

    static int lua_exec(::lua_State* L);
    static int lua_write(::lua_State* L);
    static int lua_commands(::lua_State* L);
    static LuaEngine& from_upvalue(::lua_State* L);

    void ensure_state() const;
};

} // namespace cmdtree::scripting

#endif // CMDTREE_WITH_LUAJIT

#endif // CMDTREE_SCRIPTING_LUA_ENGINE_HPP
