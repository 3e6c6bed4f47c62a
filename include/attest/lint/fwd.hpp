#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for attest_lint module

#include <cstdint>

namespace attest_lint {

class ResolutionContext;

enum class Severity : std::uint8_t;
struct Finding;
struct TypeCheck;
struct PluginReport;
struct ProjectReport;
class PluginInspector;

} // namespace attest_lint
