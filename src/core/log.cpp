#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace salvo::log {

void init(const std::filesystem::path& log_file,
          spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>("salvo", sinks.begin(),
                                                   sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::info("salvo v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

/// Concatenate all Lua arguments into a single string.
static std::string lua_concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        switch (lua_type(L, i)) {
        case LUA_TSTRING:
        case LUA_TNUMBER:
            result += lua_tostring(L, i);
            break;
        case LUA_TNIL:
            result += "nil";
            break;
        case LUA_TBOOLEAN:
            result += lua_toboolean(L, i) ? "true" : "false";
            break;
        default:
            result += lua_typename(L, lua_type(L, i));
            break;
        }
    }
    return result;
}

int l_LOG(lua_State* L) {
    spdlog::info("{}", lua_concat_args(L));
    return 0;
}

int l_WARN(lua_State* L) {
    spdlog::warn("{}", lua_concat_args(L));
    return 0;
}

int l_SPEW(lua_State* L) {
    spdlog::debug("{}", lua_concat_args(L));
    return 0;
}

} // namespace salvo::log
