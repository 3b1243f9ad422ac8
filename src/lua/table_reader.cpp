#include "lua/table_reader.hpp"

#include <algorithm>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace salvo::lua {

TableReader::TableReader(lua_State* L, int index, std::string context)
    : TableReader(L, index, std::move(context), nullptr) {}

TableReader::TableReader(lua_State* L, int index, std::string context,
                         std::vector<std::string>* errors)
    : L_(L), context_(std::move(context)),
      errors_(errors ? errors : &own_errors_) {
    // Make the index absolute so pushes don't shift it
    index_ = (index < 0 && index > LUA_REGISTRYINDEX)
                 ? lua_gettop(L) + index + 1
                 : index;
}

int TableReader::push_field(const char* field) const {
    lua_pushstring(L_, field);
    lua_rawget(L_, index_);
    return lua_type(L_, -1);
}

void TableReader::mark(const char* field) {
    if (std::find(seen_.begin(), seen_.end(), field) == seen_.end())
        seen_.emplace_back(field);
}

bool TableReader::has(const char* field) const {
    bool present = push_field(field) != LUA_TNIL;
    lua_pop(L_, 1);
    return present;
}

void TableReader::fail(const std::string& message) {
    errors_->push_back(context_ + ": " + message);
}

std::optional<f64> TableReader::number(const char* field) {
    mark(field);
    std::optional<f64> result;
    int type = push_field(field);
    if (type == LUA_TNUMBER) {
        result = lua_tonumber(L_, -1);
    } else if (type != LUA_TNIL) {
        fail(std::string("field '") + field + "' must be a number, got " +
             lua_typename(L_, type));
    }
    lua_pop(L_, 1);
    return result;
}

std::optional<f64> TableReader::number_in(const char* field, f64 lo, f64 hi) {
    auto value = number(field);
    if (value && (*value < lo || *value > hi)) {
        fail(std::string("field '") + field + "' out of range");
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> TableReader::string(const char* field) {
    mark(field);
    std::optional<std::string> result;
    int type = push_field(field);
    if (type == LUA_TSTRING) {
        result = std::string(lua_tostring(L_, -1));
    } else if (type != LUA_TNIL) {
        fail(std::string("field '") + field + "' must be a string, got " +
             lua_typename(L_, type));
    }
    lua_pop(L_, 1);
    return result;
}

std::optional<bool> TableReader::boolean(const char* field) {
    mark(field);
    std::optional<bool> result;
    int type = push_field(field);
    if (type == LUA_TBOOLEAN) {
        result = lua_toboolean(L_, -1) != 0;
    } else if (type != LUA_TNIL) {
        fail(std::string("field '") + field + "' must be a boolean, got " +
             lua_typename(L_, type));
    }
    lua_pop(L_, 1);
    return result;
}

bool TableReader::table(const char* field,
                        const std::function<void(TableReader&)>& fn) {
    mark(field);
    int type = push_field(field);
    if (type == LUA_TNIL) {
        lua_pop(L_, 1);
        return false;
    }
    if (type != LUA_TTABLE) {
        fail(std::string("field '") + field + "' must be a table, got " +
             lua_typename(L_, type));
        lua_pop(L_, 1);
        return false;
    }

    TableReader nested(L_, lua_gettop(L_), context_ + "." + field, errors_);
    fn(nested);
    nested.check_unknown_fields();
    lua_pop(L_, 1);
    return true;
}

void TableReader::each_element(const char* field,
                               const std::function<void(TableReader&)>& fn) {
    mark(field);
    int type = push_field(field);
    if (type == LUA_TNIL) {
        lua_pop(L_, 1);
        return;
    }
    if (type != LUA_TTABLE) {
        fail(std::string("field '") + field + "' must be a list");
        lua_pop(L_, 1);
        return;
    }

    int list_idx = lua_gettop(L_);
    for (int i = 1;; i++) {
        lua_rawgeti(L_, list_idx, i);
        int elem_type = lua_type(L_, -1);
        if (elem_type == LUA_TNIL) {
            lua_pop(L_, 1);
            break;
        }
        std::string elem_context =
            context_ + "." + field + "[" + std::to_string(i) + "]";
        if (elem_type != LUA_TTABLE) {
            errors_->push_back(elem_context + ": must be a table");
        } else {
            TableReader elem(L_, lua_gettop(L_), elem_context, errors_);
            fn(elem);
            elem.check_unknown_fields();
        }
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);
}

void TableReader::each_indexed(
    const char* field, const std::function<void(i32, TableReader&)>& fn) {
    mark(field);
    int type = push_field(field);
    if (type == LUA_TNIL) {
        lua_pop(L_, 1);
        return;
    }
    if (type != LUA_TTABLE) {
        fail(std::string("field '") + field + "' must be a table");
        lua_pop(L_, 1);
        return;
    }

    // Collect keys first so entries are visited in ascending order
    int map_idx = lua_gettop(L_);
    std::vector<i32> keys;
    lua_pushnil(L_);
    while (lua_next(L_, map_idx) != 0) {
        bool valid = false;
        if (lua_type(L_, -2) == LUA_TNUMBER) {
            f64 k = lua_tonumber(L_, -2);
            if (k == static_cast<f64>(static_cast<i32>(k))) {
                keys.push_back(static_cast<i32>(k));
                valid = true;
            }
        }
        if (!valid) {
            fail(std::string("field '") + field + "' must use integer keys");
        }
        lua_pop(L_, 1);
    }
    std::sort(keys.begin(), keys.end());

    for (i32 key : keys) {
        lua_rawgeti(L_, map_idx, key);
        std::string entry_context =
            context_ + "." + field + "[" + std::to_string(key) + "]";
        if (lua_type(L_, -1) != LUA_TTABLE) {
            errors_->push_back(entry_context + ": must be a table");
        } else {
            TableReader entry(L_, lua_gettop(L_), entry_context, errors_);
            fn(key, entry);
            entry.check_unknown_fields();
        }
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);
}

void TableReader::check_unknown_fields() {
    lua_pushnil(L_);
    while (lua_next(L_, index_) != 0) {
        // Only inspect the key type; lua_tostring on a number key would
        // confuse lua_next.
        if (lua_type(L_, -2) == LUA_TSTRING) {
            std::string key = lua_tostring(L_, -2);
            if (std::find(seen_.begin(), seen_.end(), key) == seen_.end()) {
                fail("unknown field '" + key + "'");
            }
        } else {
            fail("unexpected non-string key");
        }
        lua_pop(L_, 1);
    }
}

Result<void> TableReader::finish() {
    check_unknown_fields();
    if (!errors_->empty()) {
        return Error(ErrorKind::InvalidDefinition, errors_->front());
    }
    return {};
}

} // namespace salvo::lua
