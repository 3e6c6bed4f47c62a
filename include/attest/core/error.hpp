#pragma once

/// @file error.hpp
/// @brief Error values and Result<T> for attest
///
/// Fallible operations return Result<T>. An Error carries a coarse ErrorCode,
/// a readable message, the domain detail it was built from (if any) and
/// ordered key/value context added while it travels up the stack.

#include "fwd.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace attest_core {

enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NotSupported,
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// Domain details
// =============================================================================

/// Failure reading a zip container (plugin jar or dependency archive)
struct ArchiveError {
    enum class Kind : std::uint8_t {
        OpenFailed,
        NotAnArchive,     // no end-of-central-directory record
        Corrupt,
        EntryNotFound,
        Unsupported,      // zip64, encryption, unknown compression
        ChecksumMismatch, // CRC-32 of inflated data differs
    };

    Kind kind;
    std::string message;
    std::string archive;
    std::string entry;

    [[nodiscard]] ErrorCode code() const noexcept {
        switch (kind) {
            case Kind::OpenFailed: return ErrorCode::IOError;
            case Kind::NotAnArchive:
            case Kind::Corrupt: return ErrorCode::ParseError;
            case Kind::EntryNotFound: return ErrorCode::NotFound;
            case Kind::Unsupported: return ErrorCode::NotSupported;
            case Kind::ChecksumMismatch: return ErrorCode::ValidationError;
        }
        return ErrorCode::Unknown;
    }

    [[nodiscard]] static ArchiveError open_failed(const std::string& archive) {
        return {Kind::OpenFailed, "Cannot read archive: " + archive, archive, {}};
    }
    [[nodiscard]] static ArchiveError not_an_archive(const std::string& archive) {
        return {Kind::NotAnArchive, "Not a zip archive: " + archive, archive, {}};
    }
    [[nodiscard]] static ArchiveError corrupt(const std::string& archive, const std::string& reason) {
        return {Kind::Corrupt, "Corrupt archive '" + archive + "': " + reason, archive, {}};
    }
    [[nodiscard]] static ArchiveError entry_not_found(const std::string& archive, const std::string& entry) {
        return {Kind::EntryNotFound, "Entry '" + entry + "' not found in " + archive, archive, entry};
    }
    [[nodiscard]] static ArchiveError unsupported(const std::string& archive, const std::string& feature) {
        return {Kind::Unsupported, "Unsupported archive feature: " + feature, archive, {}};
    }
    [[nodiscard]] static ArchiveError checksum_mismatch(const std::string& archive, const std::string& entry) {
        return {Kind::ChecksumMismatch, "CRC mismatch for entry '" + entry + "'", archive, entry};
    }
};

/// Malformed compiled type metadata
struct ClassFileError {
    enum class Kind : std::uint8_t {
        Truncated,
        BadMagic,        // not 0xCAFEBABE
        BadConstantPool,
    };

    Kind kind;
    std::string message;
    std::string source;

    [[nodiscard]] ErrorCode code() const noexcept { return ErrorCode::ParseError; }

    [[nodiscard]] static ClassFileError truncated(const std::string& source) {
        return {Kind::Truncated, "Class file truncated", source};
    }
    [[nodiscard]] static ClassFileError bad_magic(const std::string& source) {
        return {Kind::BadMagic, "Not a class file (bad magic)", source};
    }
    [[nodiscard]] static ClassFileError bad_constant_pool(const std::string& source, const std::string& reason) {
        return {Kind::BadConstantPool, "Invalid constant pool: " + reason, source};
    }
};

struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] ErrorCode code() const noexcept {
        switch (kind) {
            case Kind::FileNotFound: return ErrorCode::NotFound;
            case Kind::ParseFailed: return ErrorCode::ParseError;
            case Kind::InvalidValue: return ErrorCode::InvalidArgument;
        }
        return ErrorCode::Unknown;
    }

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return {Kind::FileNotFound, "Config file not found: " + path, {}};
    }
    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return {Kind::ParseFailed, "Config parse failed: " + reason, {}};
    }
    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return {Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    using Detail = std::variant<std::monostate, ArchiveError, ClassFileError, ConfigError>;
    using Context = std::vector<std::pair<std::string, std::string>>;

    Error() : Error(ErrorCode::Unknown, "Unknown error") {}
    Error(const std::string& message) : Error(ErrorCode::Unknown, message) {}
    Error(const char* message) : Error(ErrorCode::Unknown, std::string(message)) {}
    Error(ErrorCode code, std::string message) : m_code(code), m_message(std::move(message)) {}

    Error(ArchiveError detail) { adopt(std::move(detail)); }
    Error(ClassFileError detail) { adopt(std::move(detail)); }
    Error(ConfigError detail) { adopt(std::move(detail)); }

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& message() const noexcept { return m_message; }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_detail); }

    /// Domain detail of type T, or nullptr
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_detail); }

    [[nodiscard]] const Detail& detail() const noexcept { return m_detail; }

    /// Sets key, replacing an earlier value; insertion order is kept
    Error& with_context(const std::string& key, const std::string& value);

    [[nodiscard]] const std::string* get_context(const std::string& key) const;
    [[nodiscard]] const Context& context() const noexcept { return m_context; }

private:
    template<typename D>
    void adopt(D detail) {
        m_code = detail.code();
        m_message = detail.message;
        m_detail = std::move(detail);
    }

    ErrorCode m_code = ErrorCode::Unknown;
    std::string m_message;
    Detail m_detail;
    Context m_context;
};

/// One-line code and message, the domain detail, then one context line per key
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result
// =============================================================================

template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Value, or std::runtime_error carrying the error message
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return value();
    }
    [[nodiscard]] T&& unwrap() && {
        throw_if_err();
        return std::move(*this).value();
    }

private:
    void throw_if_err() const {
        if (is_err()) {
            throw std::runtime_error(std::get<1>(m_state).message());
        }
    }

    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    E m_error;
    bool m_failed = false;
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

} // namespace attest_core
