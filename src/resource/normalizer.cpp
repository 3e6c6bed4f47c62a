/// @file normalizer.cpp
/// @brief Reference normalization

#include <attest/resource/normalizer.hpp>
#include <attest/core/config.hpp>

#include <algorithm>

namespace attest_resource {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

NormalizedPath normalize(std::string_view reference,
                         std::string_view scheme_prefix,
                         std::string_view source_prefix) {
    std::string_view view = trim(reference);

    if (!scheme_prefix.empty() && view.starts_with(scheme_prefix)) {
        view.remove_prefix(scheme_prefix.size());
    }

    if (!source_prefix.empty() && view.starts_with(source_prefix)) {
        view.remove_prefix(source_prefix.size());
    }

    while (!view.empty() && (view.front() == '/' || view.front() == '\\')) {
        view.remove_prefix(1);
    }

    std::string path(view);
    std::replace(path.begin(), path.end(), '\\', '/');
    return NormalizedPath(std::move(path));
}

} // anonymous namespace

std::string NormalizedPath::file_name() const {
    const auto slash = m_path.rfind('/');
    return slash == std::string::npos ? m_path : m_path.substr(slash + 1);
}

NormalizedPath normalize_reference(std::string_view reference) {
    return normalize(reference, "classpath:", "src/main/resources/");
}

NormalizedPath normalize_reference(std::string_view reference, const attest_core::AttestConfig& config) {
    return normalize(reference, config.scheme_prefix, config.source_resources_prefix);
}

std::string remove_version_suffix(std::string_view canonical) {
    const auto bar = canonical.find('|');
    return std::string(bar == std::string_view::npos ? canonical : canonical.substr(0, bar));
}

std::string normalize_directory(std::string_view directory) {
    if (directory.empty()) {
        return {};
    }
    std::string dir(directory);
    std::replace(dir.begin(), dir.end(), '\\', '/');
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    if (dir != "/") {
        dir.push_back('/');
    }
    return dir;
}

} // namespace attest_resource
