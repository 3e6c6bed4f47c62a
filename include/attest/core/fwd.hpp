#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for attest_core module

#include <cstdint>

namespace attest_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ArchiveError;
struct ClassFileError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Configuration
// =============================================================================

struct AttestConfig;

// =============================================================================
// Caching
// =============================================================================

template<typename K, typename V>
class ConcurrentCache;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace attest_core
