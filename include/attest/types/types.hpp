#pragma once

/// @file types.hpp
/// @brief Main include file for attest_types module

#include "fwd.hpp"
#include "class_file.hpp"
#include "type_source.hpp"
#include "ambient.hpp"
#include "type_registry.hpp"
#include "capability.hpp"
#include "verifier.hpp"

/// @namespace attest_types
/// @brief Type shape lookup and capability verification
///
/// Types are never loaded or run. Class files are read for their name,
/// super class and interfaces only.
