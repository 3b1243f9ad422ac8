#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

struct lua_State;

namespace salvo::lua {

/// Registry keys for storing engine pointers accessible from C bindings.
constexpr const char* REG_DEFINITION_SINK = "salvo_definition_sink";

/// RAII wrapper around a Lua state used to evaluate data files.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Register LOG / WARN / SPEW bound to spdlog.
    void register_log_functions();

    void set_global_number(const char* name, f64 value);
    void set_global_string(const char* name, const char* value);

    /// Read a numeric global. Empty if unset or not a number.
    std::optional<f64> global_number(const char* name) const;

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code,
                           const char* chunk_name = "=string");

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Store an opaque pointer in the Lua registry under key.
    void set_registry_pointer(const char* key, void* ptr);

    /// Retrieve a pointer stored with set_registry_pointer (static, for use
    /// in C bindings).
    static void* get_registry_pointer(lua_State* L, const char* key);

private:
    lua_State* L_ = nullptr;
};

} // namespace salvo::lua
