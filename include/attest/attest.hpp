#pragma once

/// @file attest.hpp
/// @brief Everything in one include

#include "core/core.hpp"
#include "resource/resource.hpp"
#include "types/types.hpp"
#include "plugin/plugin.hpp"
#include "lint/lint.hpp"
