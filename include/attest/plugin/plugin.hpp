#pragma once

/// @file plugin.hpp
/// @brief Main include file for attest_plugin module

#include "fwd.hpp"
#include "descriptor.hpp"
#include "api_version.hpp"
