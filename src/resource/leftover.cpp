/// @file leftover.cpp
/// @brief Unreferenced resource detection

#include <attest/resource/leftover.hpp>
#include <attest/resource/fhir_document.hpp>
#include <attest/core/log.hpp>

#include <functional>
#include <string_view>

namespace attest_resource {

namespace {

std::set<std::string> collect(const fs::path& root, const fs::path& dir,
                              const std::function<bool(const fs::path&)>& accept) {
    std::set<std::string> paths;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return paths;
    }
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && accept(it->path())) {
            paths.insert(it->path().lexically_relative(root).generic_string());
        }
    }
    return paths;
}

} // anonymous namespace

LeftoverAnalysis find_unreferenced_resources(const fs::path& resource_root,
                                             const std::set<std::string>& referenced_process_models,
                                             const std::set<std::string>& referenced_fhir_resources) {
    LeftoverAnalysis analysis;

    const auto is_model = [](const fs::path& p) { return p.extension() == ".bpmn"; };
    auto models = collect(resource_root, resource_root / "bpe", is_model);
    models.merge(collect(resource_root, resource_root / "bpmn", is_model));
    const auto fhir = collect(resource_root, resource_root / "fhir",
        [](const fs::path& p) { return is_fhir_file(p); });

    analysis.process_model_count = models.size();
    analysis.fhir_resource_count = fhir.size();

    // Models in the bpmn/ subfolder may be referenced without the folder name
    const auto is_referenced_model = [&referenced_process_models](const std::string& path) {
        if (referenced_process_models.count(path)) {
            return true;
        }
        constexpr std::string_view subfolder = "bpmn/";
        return path.compare(0, subfolder.size(), subfolder) == 0 &&
               referenced_process_models.count(path.substr(subfolder.size())) > 0;
    };

    for (const auto& path : models) {
        if (!is_referenced_model(path)) {
            analysis.unreferenced_process_models.insert(path);
        }
    }
    for (const auto& path : fhir) {
        if (!referenced_fhir_resources.count(path)) {
            analysis.unreferenced_fhir_resources.insert(path);
        }
    }

    attest_core::resolver_logger()->debug(
        "Leftover analysis of {}: {}/{} process models and {}/{} FHIR resources unreferenced",
        resource_root.string(),
        analysis.unreferenced_process_models.size(), models.size(),
        analysis.unreferenced_fhir_resources.size(), fhir.size());

    return analysis;
}

} // namespace attest_resource
