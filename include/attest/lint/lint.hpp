#pragma once

/// @file lint.hpp
/// @brief Main include file for attest_lint module

#include "fwd.hpp"
#include "context.hpp"
#include "inspector.hpp"
