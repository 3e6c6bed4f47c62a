#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for attest_types module

#include <cstdint>

namespace attest_types {

struct ClassFileInfo;

enum class TypeKind : std::uint8_t;
struct TypeDescriptor;
class TypeSource;
class AmbientTypeSpace;
class ClassDirectorySource;
class ClassArchiveSource;
class ProjectTypeContext;
class TypeRegistry;
class TypeRegistryCache;

enum class ApiVersion : std::uint8_t;
enum class ElementRole : std::uint8_t;
struct Capability;
struct CapabilitySet;
struct VerificationResult;

} // namespace attest_types
