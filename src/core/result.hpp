#pragma once

#include <optional>
#include <string>
#include <variant>

namespace salvo {

/// Broad category of a failed operation. Callers branch on this, the
/// message is for logs.
enum class ErrorKind {
    Generic,
    UnknownWeapon,
    AlreadyEquipped,
    NotAllowed,
    MaxLevel,
    InvalidDefinition,
    ScriptError,
    IoError,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic: return "error";
    case ErrorKind::UnknownWeapon: return "missing-registry";
    case ErrorKind::AlreadyEquipped: return "already-equipped";
    case ErrorKind::NotAllowed: return "not-allowed";
    case ErrorKind::MaxLevel: return "max-level";
    case ErrorKind::InvalidDefinition: return "invalid-definition";
    case ErrorKind::ScriptError: return "script-error";
    case ErrorKind::IoError: return "io-error";
    }
    return "error";
}

} // namespace salvo
