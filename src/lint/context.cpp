/// @file context.cpp
/// @brief ResolutionContext and engine operations

#include <attest/lint/context.hpp>
#include <attest/plugin/descriptor.hpp>
#include <attest/core/log.hpp>

namespace attest_lint {

ResolutionContext::ResolutionContext(attest_core::AttestConfig config)
    : m_config(std::move(config))
    , m_temp_files(m_config.temp_prefix)
    , m_locator(m_config, m_archives, m_temp_files)
    , m_ambient(attest_types::AmbientTypeSpace::with_platform_api())
    , m_registries(m_config, m_archives, m_ambient) {
    ATTEST_LOG_DEBUG("Resolution context created ({} ambient types)", m_ambient->size());
}

ResolutionContext::~ResolutionContext() {
    // Materialized dependency files do not outlive the context
    m_registries.clear();
    m_temp_files.cleanup();
}

void ResolutionContext::cleanup() {
    m_temp_files.cleanup();
}

attest_resource::ResourceRoot resolve_root(ResolutionContext& ctx, const fs::path& project_dir) {
    return ctx.roots().resolve_root(project_dir);
}

attest_resource::ResourceRoot resolve_root(ResolutionContext& ctx,
                                           const fs::path& project_dir,
                                           const attest_plugin::PluginDescriptor& plugin) {
    return ctx.roots().resolve_root(project_dir, plugin.root_hints());
}

attest_resource::ResolutionResult locate(ResolutionContext& ctx,
                                         std::string_view reference,
                                         const attest_resource::ResourceRoot& root) {
    return ctx.locator().locate(reference, root);
}

std::shared_ptr<const attest_types::TypeRegistry> for_project(ResolutionContext& ctx,
                                                              const fs::path& project_dir) {
    return ctx.registries().for_project(project_dir);
}

std::shared_ptr<const attest_types::TypeRegistry> for_project_deep(ResolutionContext& ctx,
                                                                   const fs::path& project_dir) {
    return ctx.registries().for_project_deep(project_dir);
}

attest_types::VerificationResult verify(std::string_view type_name,
                                        const attest_types::CapabilitySet& capabilities,
                                        const attest_types::TypeRegistry& registry) {
    return attest_types::verify(type_name, capabilities, registry);
}

bool cross_reference(const attest_resource::ResolutionResult& result,
                     std::string_view kind,
                     std::string_view value) {
    return attest_resource::cross_reference(result, kind, value);
}

} // namespace attest_lint
