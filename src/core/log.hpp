#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace salvo::log {

/// Initialize logging with a console sink, plus a file sink when
/// log_file is non-empty.
void init(const std::filesystem::path& log_file = {},
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

// Logging functions exposed to data scripts
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);

} // namespace salvo::log
