#pragma once

/// @file error.hpp
/// @brief Error and Result types shared by the nexus libraries
///
/// Every fallible nexus operation returns `Result<T>`. A failed result carries
/// an `Error`: an `ErrorCode`, a message, optional key/value context and, for
/// resolver failures, the `SkillError` that caused it.

#include "fwd.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nexus_core {

// =============================================================================
// ErrorCode
// =============================================================================

enum class ErrorCode : std::uint8_t {
    NotFound,          ///< Missing file or unknown skill
    InvalidArgument,   ///< Level outside its range
    IOError,           ///< File could not be opened or written
    ParseError,        ///< Malformed catalog, config or plan data
    CyclicDependency,  ///< Prerequisite graph contains a loop
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// SkillError
// =============================================================================

/// Failure raised while resolving a skill request
struct SkillError {
    enum class Kind : std::uint8_t {
        InvalidLevel,
        UnknownSkill,
        CyclicDependency,
    };

    Kind kind;
    std::string message;
    std::int64_t skill_id = 0;
    int level = 0;                        // For InvalidLevel
    std::vector<std::int64_t> cycle_path; // For CyclicDependency

    [[nodiscard]] static SkillError invalid_level(std::int64_t id, int lvl);
    [[nodiscard]] static SkillError unknown_skill(std::int64_t id);

    /// @param path Skills along the loop, first skill repeated at the end
    [[nodiscard]] static SkillError cyclic_dependency(std::vector<std::int64_t> path);

    /// ErrorCode an Error built from this failure reports
    [[nodiscard]] ErrorCode code() const;
};

[[nodiscard]] const char* skill_error_kind_name(SkillError::Kind kind);

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    Error(SkillError err)
        : m_code(err.code()), m_message(err.message), m_skill(std::move(err)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& message() const noexcept { return m_message; }

    /// Resolver failure behind this error, if any
    [[nodiscard]] const SkillError* skill_error() const {
        return m_skill ? &*m_skill : nullptr;
    }

    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    ErrorCode m_code;
    std::string m_message;
    std::optional<SkillError> m_skill;
    std::map<std::string, std::string> m_context;
};

/// One-line rendering: `[Code] message (details) {key=value}...`
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T>
// =============================================================================

/// Value or Error
template<typename T>
class Result {
public:
    Result(T value) : m_value(std::move(value)) {}
    Result(Error error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

    /// Only valid when is_err()
    [[nodiscard]] const Error& error() const { return *m_error; }

private:
    std::optional<T> m_value;
    std::optional<Error> m_error;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return !m_error.has_value(); }

    [[nodiscard]] const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace nexus_core
