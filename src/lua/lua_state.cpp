#include "lua/lua_state.hpp"
#include "core/log.hpp"

#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace salvo::lua {

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }
    luaL_openlibs(L_);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::register_log_functions() {
    register_function("LOG", log::l_LOG);
    register_function("WARN", log::l_WARN);
    register_function("SPEW", log::l_SPEW);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

std::optional<f64> LuaState::global_number(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<f64> result;
    if (lua_type(L_, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L_, -1);
    }
    lua_pop(L_, 1);
    return result;
}

Result<void> LuaState::do_string(std::string_view code,
                                 const char* chunk_name) {
    return do_buffer(code.data(), code.size(), chunk_name);
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error(ErrorKind::IoError, "Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        return Error(ErrorKind::IoError, "Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    int status = luaL_loadbuffer(L_, buf, len, name);
    if (status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(ErrorKind::ScriptError, std::move(err));
    }

    status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) {
        std::string err = lua_isstring(L_, -1) ? lua_tostring(L_, -1)
                                               : "non-string Lua error";
        lua_pop(L_, 1);
        return Error(ErrorKind::ScriptError, std::move(err));
    }

    return {};
}

void LuaState::set_registry_pointer(const char* key, void* ptr) {
    lua_pushstring(L_, key);
    lua_pushlightuserdata(L_, ptr);
    lua_rawset(L_, LUA_REGISTRYINDEX);
}

void* LuaState::get_registry_pointer(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_rawget(L, LUA_REGISTRYINDEX);
    void* ptr = lua_touserdata(L, -1);
    lua_pop(L, 1);
    return ptr;
}

} // namespace salvo::lua
