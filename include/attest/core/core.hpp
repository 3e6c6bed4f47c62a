#pragma once

/// @file core.hpp
/// @brief Main include file for attest_core module

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
#include "concurrent_cache.hpp"

/// @namespace attest_core
/// @brief Foundation shared by all attest modules
///
/// - **Error Handling**: Result<T> with domain errors for archives, class
///   files and configuration
/// - **Logging**: spdlog loggers per subsystem
/// - **Configuration**: AttestConfig, JSON file plus environment overrides
/// - **Caching**: ConcurrentCache, compute-if-absent per key
