#pragma once

/// @file leftover.hpp
/// @brief Resources present below a root that no plugin references

#include "fwd.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace attest_resource {

namespace fs = std::filesystem;

struct LeftoverAnalysis {
    /// Root-relative paths of process models (bpe/**/*.bpmn, bpmn/**/*.bpmn) nobody references
    std::set<std::string> unreferenced_process_models;

    /// Root-relative paths of FHIR files (fhir/**/*.xml|json) nobody references
    std::set<std::string> unreferenced_fhir_resources;

    std::size_t process_model_count = 0;
    std::size_t fhir_resource_count = 0;

    [[nodiscard]] bool empty() const noexcept {
        return unreferenced_process_models.empty() && unreferenced_fhir_resources.empty();
    }
};

/// Compare the files below <resource_root>/bpe, <resource_root>/bpmn and
/// <resource_root>/fhir with
/// the normalized references of all plugins of the project
[[nodiscard]] LeftoverAnalysis find_unreferenced_resources(const fs::path& resource_root,
                                                           const std::set<std::string>& referenced_process_models,
                                                           const std::set<std::string>& referenced_fhir_resources);

} // namespace attest_resource
