#include "cmdtree/scripting/lua_engine.hpp"

#if CMDTREE_WITH_LUAJIT

#include "cmdtree/dispatcher.hpp"
#include "cmdtree/errors.hpp"
#include "cmdtree/logging.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include "lua.hpp"
}

namespace {

std::string lua_to_string(lua_State* L, int index, const char* context) {
    const int type = lua_type(L, index);
    switch (type) {
    case LUA_TSTRING:
    case LUA_TNUMBER: {
        size_t len = 0;
        const char* value = lua_tolstring(L, index, &len);
        return std::string(value, len);
    }
    case LUA_TBOOLEAN:
        return lua_toboolean(L, index) ? "true" : "false";
    case LUA_TNIL:
        luaL_error(L, "%s cannot be nil", context);
        break;
    default:
        luaL_error(L, "%s must be a string, number, or boolean", context);
        break;
    }
    return {};
}

// exec("image", "pull", "repo") and exec({"image", "pull", "repo"}) are equivalent.
std::vector<std::string> collect_tokens(lua_State* L) {
    std::vector<std::string> tokens;
    const int nargs = lua_gettop(L);
    if (nargs == 1 && lua_istable(L, 1)) {
        const size_t len = lua_objlen(L, 1);
        tokens.reserve(len);
        for (size_t i = 1; i <= len; ++i) {
            lua_rawgeti(L, 1, static_cast<int>(i));
            if (lua_istable(L, -1)) {
                lua_pop(L, 1);
                luaL_error(L, "exec does not accept nested tables");
            }
            tokens.push_back(lua_to_string(L, -1, "command token"));
            lua_pop(L, 1);
        }
        return tokens;
    }
    for (int i = 1; i <= nargs; ++i) {
        if (lua_istable(L, i)) {
            luaL_error(L, "exec arguments must be string-like values");
        }
        tokens.push_back(lua_to_string(L, i, "command token"));
    }
    return tokens;
}

} // namespace

namespace cmdtree::scripting {

LuaEngine::LuaEngine(CommandRegistry& registry, IoService& io, const CommandDescriptor& root)
    : registry_(registry),
      io_(io),
      root_(root),
      state_(luaL_newstate()) {
    if (state_ == nullptr) {
        throw std::runtime_error("Failed to initialise LuaJIT state");
    }
}

LuaEngine::~LuaEngine() {
    if (state_ != nullptr) {
        lua_close(state_);
        state_ = nullptr;
    }
}

void LuaEngine::ensure_state() const {
    if (state_ == nullptr) {
        throw std::runtime_error("Lua state is not initialised");
    }
}

void LuaEngine::open_standard_libraries(bool allow_unsafe) {
    ensure_state();
    luaL_openlibs(state_);
    if (!allow_unsafe) {
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_OSLIBNAME);
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_IOLIBNAME);
    }
}

LuaEngine& LuaEngine::from_upvalue(lua_State* L) {
    void* context = lua_touserdata(L, lua_upvalueindex(1));
    if (context == nullptr) {
        luaL_error(L, "missing scripting context");
    }
    return *static_cast<LuaEngine*>(context);
}

// Returns the status of the command, or nil plus the message when the command
// line was rejected. Failures inside the command's action raise a Lua error.
int LuaEngine::lua_exec(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    const std::vector<std::string> tokens = collect_tokens(L);

    std::string rejected;
    std::string failure;
    int status = 0;
    try {
        status = run_command(engine.registry_, engine.io_, engine.root_, tokens);
    } catch (const CommandError& ex) {
        rejected = ex.what();
    } catch (const std::exception& ex) {
        failure = ex.what();
    }

    if (!failure.empty()) {
        return luaL_error(L, "exec failed: %s", failure.c_str());
    }
    if (!rejected.empty()) {
        engine.io_.write_error_line(rejected);
        lua_pushnil(L);
        lua_pushlstring(L, rejected.c_str(), rejected.size());
        return 2;
    }
    lua_pushinteger(L, static_cast<lua_Integer>(status));
    return 1;
}

int LuaEngine::lua_write(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    size_t len = 0;
    const char* text = luaL_checklstring(L, 1, &len);
    engine.io_.write(std::string_view(text, len));
    return 0;
}

int LuaEngine::lua_commands(lua_State* L) {
    LuaEngine& engine = from_upvalue(L);
    lua_newtable(L);
    lua_Integer index = 1;
    for (const CommandDescriptor* entry : engine.registry_.children_of(engine.root_)) {
        const std::string name = command_name_from_type(entry->type_name);
        lua_pushinteger(L, index++);
        lua_pushlstring(L, name.c_str(), name.size());
        lua_settable(L, -3);
    }
    return 1;
}

void LuaEngine::register_bindings() {
    ensure_state();

    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, &LuaEngine::lua_exec, 1);
    lua_setglobal(state_, "exec");

    lua_newtable(state_);
    const int module_index = lua_gettop(state_);

    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, &LuaEngine::lua_exec, 1);
    lua_setfield(state_, module_index, "exec");

    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, &LuaEngine::lua_write, 1);
    lua_setfield(state_, module_index, "write");

    lua_pushlightuserdata(state_, this);
    lua_pushcclosure(state_, &LuaEngine::lua_commands, 1);
    lua_setfield(state_, module_index, "commands");

    const std::string root_name = registry_.path_names(root_);
    lua_pushlstring(state_, root_name.c_str(), root_name.size());
    lua_setfield(state_, module_index, "root");

    lua_setglobal(state_, "cmdtree");
}

void LuaEngine::push_script_arguments(const ScriptOptions& options) {
    ensure_state();
    lua_newtable(state_);

    lua_pushinteger(state_, 0);
    lua_pushlstring(state_, options.path.c_str(), options.path.size());
    lua_settable(state_, -3);

    for (std::size_t index = 0; index < options.args.size(); ++index) {
        lua_pushinteger(state_, static_cast<lua_Integer>(index + 1));
        const std::string& value = options.args[index];
        lua_pushlstring(state_, value.c_str(), value.size());
        lua_settable(state_, -3);
    }

    lua_setglobal(state_, "arg");
}

int LuaEngine::run_file(const ScriptOptions& options) {
    ensure_state();
    push_script_arguments(options);

    const int load_status = luaL_loadfile(state_, options.path.c_str());
    if (load_status != LUA_OK) {
        const char* message = lua_tostring(state_, -1);
        io_.write_error_line("Failed to load script '" + options.path + "': " +
                             (message ? message : "unknown error"));
        lua_pop(state_, 1);
        return load_status;
    }

    CMDTREE_LOG_DISPATCH_DEBUG("running script '%s'", options.path.c_str());
    const int call_status = lua_pcall(state_, 0, LUA_MULTRET, 0);
    if (call_status != LUA_OK) {
        const char* message = lua_tostring(state_, -1);
        io_.write_error_line("Script '" + options.path + "' failed: " +
                             (message ? message : "unknown error"));
        lua_pop(state_, 1);
        return call_status;
    }
    return LUA_OK;
}

} // namespace cmdtree::scripting

#endif // CMDTREE_WITH_LUAJIT
