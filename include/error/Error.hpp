#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace sp::error {

enum class Kind {
    NotInitialized,
    AlreadyInitialized,
    NotFound,
    NoFilesToSave,
    Integrity,
    Patch,
    IO,
    Pattern,
    Config
};

std::string_view to_string(Kind kind);

// Base of every failure the engine reports. Callers that only need the
// category can switch on kind() instead of catching each subclass.
class Error : public std::runtime_error {
public:
    explicit Error(const char* message) : std::runtime_error(message) {}
    explicit Error(const std::string& message) : std::runtime_error(message) {}

    template <typename... Args>
    explicit Error(fmt::format_string<Args...> fmt, Args&&... args)
        : std::runtime_error(fmt::format(fmt, std::forward<Args>(args)...)) {}

    [[nodiscard]] virtual Kind kind() const noexcept = 0;
};

class NotInitialized : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::NotInitialized; }
};

class AlreadyInitialized : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::AlreadyInitialized; }
};

class NotFound : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::NotFound; }
};

class NoFilesToSave : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::NoFilesToSave; }
};

// Stored data does not verify against its recorded hash or structure.
class IntegrityError : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::Integrity; }
};

class PatchError : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::Patch; }
};

class IOError : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::IO; }
};

class PatternError : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::Pattern; }
};

class ConfigError : public Error {
public:
    using Error::Error;
    [[nodiscard]] Kind kind() const noexcept override { return Kind::Config; }
};

}
