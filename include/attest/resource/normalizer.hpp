#pragma once

/// @file normalizer.hpp
/// @brief Canonical form of declared resource references
///
/// Declared references arrive in many spellings ("classpath:/bpe/x.bpmn",
/// "src/main/resources/bpe/x.bpmn", "\\bpe\\x.bpmn"). All of them map to one
/// relative, forward-slash path.

#include "fwd.hpp"

#include <attest/core/fwd.hpp>

#include <string>
#include <string_view>

namespace attest_resource {

/// Relative resource path with '/' separators. An empty value is the
/// sentinel for "nothing to resolve".
class NormalizedPath {
public:
    NormalizedPath() = default;
    explicit NormalizedPath(std::string path) : m_path(std::move(path)) {}

    [[nodiscard]] const std::string& str() const noexcept { return m_path; }
    [[nodiscard]] bool empty() const noexcept { return m_path.empty(); }

    /// Last path segment ("x.bpmn" for "bpe/x.bpmn")
    [[nodiscard]] std::string file_name() const;

    bool operator==(const NormalizedPath& other) const = default;

private:
    std::string m_path;
};

/// Trim, strip the scheme and source prefixes, strip leading separators and
/// convert backslashes. Uses the default prefixes.
[[nodiscard]] NormalizedPath normalize_reference(std::string_view reference);

/// Same as above with the prefixes taken from the configuration
[[nodiscard]] NormalizedPath normalize_reference(std::string_view reference,
                                                 const attest_core::AttestConfig& config);

/// Drop a "|version" suffix from a canonical URL ("http://x/y|1.0" -> "http://x/y")
[[nodiscard]] std::string remove_version_suffix(std::string_view canonical);

/// Backslashes to '/', with exactly one trailing '/' (empty stays empty)
[[nodiscard]] std::string normalize_directory(std::string_view directory);

} // namespace attest_resource
