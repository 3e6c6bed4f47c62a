#pragma once

/// @file resolution.hpp
/// @brief Classified outcome of locating a reference against a resource root

#include "fwd.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

// =============================================================================
// ResolutionResult Variants
// =============================================================================

/// Nothing matched by any search step
struct NotFound {};

/// File exists and its canonical path is inside the expected root
struct FoundInRoot {
    fs::path file;
};

/// File exists but its canonical path escapes the expected root
struct FoundOutsideRoot {
    fs::path file;
    fs::path actual_location;
    fs::path expected_root;
};

/// Entry found in a dependency archive and copied to a temporary file
struct FoundInDependency {
    fs::path materialized_file;
    fs::path origin_archive;
    fs::path expected_root;
};

using ResolutionResult = std::variant<NotFound, FoundInRoot, FoundOutsideRoot, FoundInDependency>;

// =============================================================================
// Helpers
// =============================================================================

[[nodiscard]] inline bool is_found(const ResolutionResult& result) noexcept {
    return !std::holds_alternative<NotFound>(result);
}

[[nodiscard]] inline bool is_in_root(const ResolutionResult& result) noexcept {
    return std::holds_alternative<FoundInRoot>(result);
}

[[nodiscard]] inline bool is_outside_root(const ResolutionResult& result) noexcept {
    return std::holds_alternative<FoundOutsideRoot>(result);
}

[[nodiscard]] inline bool is_from_dependency(const ResolutionResult& result) noexcept {
    return std::holds_alternative<FoundInDependency>(result);
}

/// The readable file behind any found variant
[[nodiscard]] std::optional<fs::path> file_of(const ResolutionResult& result);

/// Where the resource actually lives (the archive for dependency hits)
[[nodiscard]] std::optional<fs::path> actual_location_of(const ResolutionResult& result);

/// Short classification name ("not-found", "in-root", "outside-root", "dependency")
[[nodiscard]] const char* classification_name(const ResolutionResult& result) noexcept;

/// Human-readable one-line description for diagnostics
[[nodiscard]] std::string describe(const ResolutionResult& result);

// =============================================================================
// ResolvedResources
// =============================================================================

/// Outcome of resolving a batch of references, reference order preserved
struct ResolvedResources {
    std::vector<fs::path> valid_files;
    std::vector<std::string> missing_references;
    std::map<std::string, FoundOutsideRoot> outside_root;
    std::map<std::string, FoundInDependency> from_dependencies;

    [[nodiscard]] bool all_in_root() const noexcept {
        return missing_references.empty() && outside_root.empty() && from_dependencies.empty();
    }
};

} // namespace attest_resource
