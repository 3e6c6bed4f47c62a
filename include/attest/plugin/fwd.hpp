#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for attest_plugin module

#include <cstdint>

namespace attest_plugin {

struct ImplementationType;
class PluginDescriptor;
class StaticPluginDescriptor;

enum class DetectionSource : std::uint8_t;
struct DetectedVersion;

} // namespace attest_plugin
