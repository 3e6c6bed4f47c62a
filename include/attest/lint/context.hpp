#pragma once

/// @file context.hpp
/// @brief Resolution context and the engine's outward operations
///
/// ResolutionContext owns every cache the engine keeps: opened archives,
/// materialized temporary files, resource roots, archive scans and type
/// registries. Hosts create one context per run and pass it by reference;
/// its destructor removes the temporary files.

#include "fwd.hpp"

#include <attest/core/config.hpp>
#include <attest/resource/archive.hpp>
#include <attest/resource/cross_reference.hpp>
#include <attest/resource/locator.hpp>
#include <attest/resource/root_resolver.hpp>
#include <attest/resource/temp_files.hpp>
#include <attest/types/ambient.hpp>
#include <attest/types/type_registry.hpp>
#include <attest/types/verifier.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace attest_plugin {
class PluginDescriptor;
}

namespace attest_lint {

namespace fs = std::filesystem;

class ResolutionContext {
public:
    explicit ResolutionContext(attest_core::AttestConfig config = {});
    ~ResolutionContext();

    ResolutionContext(const ResolutionContext&) = delete;
    ResolutionContext& operator=(const ResolutionContext&) = delete;

    [[nodiscard]] const attest_core::AttestConfig& config() const noexcept { return m_config; }

    [[nodiscard]] attest_resource::ArchiveCache& archives() noexcept { return m_archives; }
    [[nodiscard]] attest_resource::TempFileRegistry& temp_files() noexcept { return m_temp_files; }
    [[nodiscard]] attest_resource::ResourceRootResolver& roots() noexcept { return m_roots; }
    [[nodiscard]] attest_resource::ResourceLocator& locator() noexcept { return m_locator; }
    [[nodiscard]] attest_types::TypeRegistryCache& registries() noexcept { return m_registries; }
    [[nodiscard]] const attest_resource::CrossReferencer& cross_referencer() const noexcept {
        return m_cross_referencer;
    }

    /// Platform types; hosts may add their own before the first registry is built
    [[nodiscard]] attest_types::AmbientTypeSpace& ambient() noexcept { return *m_ambient; }

    /// Delete materialized files now instead of at destruction
    void cleanup();

private:
    attest_core::AttestConfig m_config;
    attest_resource::ArchiveCache m_archives;
    attest_resource::TempFileRegistry m_temp_files;
    attest_resource::ResourceRootResolver m_roots;
    attest_resource::ResourceLocator m_locator;
    std::shared_ptr<attest_types::AmbientTypeSpace> m_ambient;
    attest_types::TypeRegistryCache m_registries;
    attest_resource::CrossReferencer m_cross_referencer;
};

// =============================================================================
// Engine Operations
// =============================================================================

/// Project-wide default resource root
[[nodiscard]] attest_resource::ResourceRoot resolve_root(ResolutionContext& ctx, const fs::path& project_dir);

/// Resource root of one plugin
[[nodiscard]] attest_resource::ResourceRoot resolve_root(ResolutionContext& ctx,
                                                         const fs::path& project_dir,
                                                         const attest_plugin::PluginDescriptor& plugin);

[[nodiscard]] attest_resource::ResolutionResult locate(ResolutionContext& ctx,
                                                       std::string_view reference,
                                                       const attest_resource::ResourceRoot& root);

/// Throws std::invalid_argument when project_dir is not a directory
[[nodiscard]] std::shared_ptr<const attest_types::TypeRegistry> for_project(ResolutionContext& ctx,
                                                                            const fs::path& project_dir);

[[nodiscard]] std::shared_ptr<const attest_types::TypeRegistry> for_project_deep(ResolutionContext& ctx,
                                                                                 const fs::path& project_dir);

[[nodiscard]] attest_types::VerificationResult verify(std::string_view type_name,
                                                      const attest_types::CapabilitySet& capabilities,
                                                      const attest_types::TypeRegistry& registry);

/// Kind is one of "activity-definition-message-name", "activity-definition-url",
/// "structure-definition-value", "questionnaire-url"; other kinds never match
[[nodiscard]] bool cross_reference(const attest_resource::ResolutionResult& result,
                                   std::string_view kind,
                                   std::string_view value);

} // namespace attest_lint
