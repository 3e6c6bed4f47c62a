/// @file resolution.cpp
/// @brief ResolutionResult helpers

#include <attest/resource/resolution.hpp>

namespace attest_resource {

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

std::optional<fs::path> file_of(const ResolutionResult& result) {
    return std::visit(Overloaded{
        [](const NotFound&) -> std::optional<fs::path> { return std::nullopt; },
        [](const FoundInRoot& r) -> std::optional<fs::path> { return r.file; },
        [](const FoundOutsideRoot& r) -> std::optional<fs::path> { return r.file; },
        [](const FoundInDependency& r) -> std::optional<fs::path> { return r.materialized_file; },
    }, result);
}

std::optional<fs::path> actual_location_of(const ResolutionResult& result) {
    return std::visit(Overloaded{
        [](const NotFound&) -> std::optional<fs::path> { return std::nullopt; },
        [](const FoundInRoot& r) -> std::optional<fs::path> { return r.file; },
        [](const FoundOutsideRoot& r) -> std::optional<fs::path> { return r.actual_location; },
        [](const FoundInDependency& r) -> std::optional<fs::path> { return r.origin_archive; },
    }, result);
}

const char* classification_name(const ResolutionResult& result) noexcept {
    switch (result.index()) {
        case 0: return "not-found";
        case 1: return "in-root";
        case 2: return "outside-root";
        case 3: return "dependency";
        default: return "unknown";
    }
}

std::string describe(const ResolutionResult& result) {
    return std::visit(Overloaded{
        [](const NotFound&) -> std::string { return "not found"; },
        [](const FoundInRoot& r) -> std::string { return "found at " + r.file.string(); },
        [](const FoundOutsideRoot& r) -> std::string {
            return "found at " + r.actual_location.string() +
                   " outside expected root " + r.expected_root.string();
        },
        [](const FoundInDependency& r) -> std::string {
            return "found in dependency " + r.origin_archive.filename().string() +
                   " (materialized to " + r.materialized_file.string() + ")";
        },
    }, result);
}

} // namespace attest_resource
