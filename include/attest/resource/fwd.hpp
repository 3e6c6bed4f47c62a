#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for attest_resource module

#include <cstdint>

namespace attest_resource {

// Reference normalization
class NormalizedPath;

// Resource roots
enum class RootStrategy : std::uint8_t;
struct ResourceRoot;
struct RootHints;
class ResourceRootResolver;

// Resolution results
struct NotFound;
struct FoundInRoot;
struct FoundOutsideRoot;
struct FoundInDependency;
struct ResolvedResources;

// Archives and project layout
struct ZipEntry;
class ZipArchive;
class ArchiveCache;
enum class LayoutDepth : std::uint8_t;
struct ProjectLayout;
class DependencyArchiveSet;
class TempFileRegistry;

// Location
class ResourceLocator;

// FHIR content
class FhirElement;
class FhirDocument;
enum class CrossReferenceKind : std::uint8_t;
class CrossReferencer;

} // namespace attest_resource
