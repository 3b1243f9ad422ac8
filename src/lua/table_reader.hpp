#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct lua_State;

namespace salvo::lua {

/// Strict reader for a Lua table describing a record. Every field read is
/// remembered so finish() can reject fields the schema does not know.
/// Type errors and unknown fields are collected rather than thrown; the
/// first one is reported by finish().
class TableReader {
public:
    /// Reader over the table at stack index `index` (made absolute).
    TableReader(lua_State* L, int index, std::string context);

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    const std::string& context() const { return context_; }
    void set_context(std::string context) { context_ = std::move(context); }
    bool has(const char* field) const;

    std::optional<f64> number(const char* field);
    std::optional<std::string> string(const char* field);
    std::optional<bool> boolean(const char* field);

    /// Number constrained to [lo, hi]; out-of-range values are an error.
    std::optional<f64> number_in(const char* field, f64 lo, f64 hi);

    /// Invoke fn with a reader over a nested table. Returns false when the
    /// field is absent; a non-table value is an error.
    bool table(const char* field, const std::function<void(TableReader&)>& fn);

    /// Invoke fn for each table in the array part of `field` (1..n).
    void each_element(const char* field,
                      const std::function<void(TableReader&)>& fn);

    /// Invoke fn for each integer-keyed table entry of `field`, in
    /// ascending key order. Non-integer keys are an error.
    void each_indexed(const char* field,
                      const std::function<void(i32, TableReader&)>& fn);

    /// Record a schema error against this table.
    void fail(const std::string& message);

    /// Check for unknown fields in this table and return the first error
    /// encountered while reading it or any nested table.
    Result<void> finish();

private:
    TableReader(lua_State* L, int index, std::string context,
                std::vector<std::string>* errors);

    /// Push field value; caller pops.
    int push_field(const char* field) const;
    void mark(const char* field);
    void check_unknown_fields();

    lua_State* L_;
    int index_;
    std::string context_;
    std::vector<std::string> seen_;
    std::vector<std::string> own_errors_;
    std::vector<std::string>* errors_;
};

} // namespace salvo::lua
