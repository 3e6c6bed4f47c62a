/// @file type_source.cpp
/// @brief Directory, archive and project type sources

#include <attest/types/type_source.hpp>
#include <attest/types/class_file.hpp>
#include <attest/resource/archive.hpp>
#include <attest/core/log.hpp>

#include <exception>

namespace attest_types {

namespace {

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

/// Dotted names only; rejects path tricks like "../x" or "/abs"
bool is_plausible_type_name(std::string_view name) {
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return false;
    }
    return name.find('/') == std::string_view::npos &&
           name.find('\\') == std::string_view::npos &&
           name.find("..") == std::string_view::npos;
}

} // anonymous namespace

const char* type_kind_name(TypeKind kind) noexcept {
    switch (kind) {
        case TypeKind::Class: return "class";
        case TypeKind::AbstractClass: return "abstract class";
        case TypeKind::Interface: return "interface";
        default: return "unknown";
    }
}

std::vector<std::string> TypeDescriptor::direct_supertypes() const {
    std::vector<std::string> result;
    if (super_name) {
        result.push_back(*super_name);
    }
    result.insert(result.end(), interfaces.begin(), interfaces.end());
    return result;
}

TypeDescriptor descriptor_from_class_file(const ClassFileInfo& info, std::string origin) {
    TypeDescriptor descriptor;
    descriptor.name = info.name;
    descriptor.super_name = info.super_name;
    descriptor.interfaces = info.interfaces;
    descriptor.kind = info.is_interface() ? TypeKind::Interface
                    : info.is_abstract() ? TypeKind::AbstractClass
                    : TypeKind::Class;
    descriptor.origin = std::move(origin);
    return descriptor;
}

// =============================================================================
// ClassDirectorySource
// =============================================================================

std::optional<TypeDescriptor> ClassDirectorySource::find(std::string_view name) const {
    if (!is_plausible_type_name(name)) {
        return std::nullopt;
    }
    const fs::path file = m_directory / class_entry_name(name);
    if (!is_file(file)) {
        return std::nullopt;
    }

    auto info = read_class_file(file);
    if (!info) {
        attest_core::types_logger()->debug("Unreadable class file {}: {}", file.string(), info.error().message());
        return std::nullopt;
    }
    if (info->name != name) {
        // File name and declared name disagree; the file belongs to another type
        return std::nullopt;
    }
    return descriptor_from_class_file(*info, m_directory.string());
}

// =============================================================================
// ClassArchiveSource
// =============================================================================

ClassArchiveSource::ClassArchiveSource(std::shared_ptr<const attest_resource::ZipArchive> archive)
    : m_archive(std::move(archive)) {}

std::optional<TypeDescriptor> ClassArchiveSource::find(std::string_view name) const {
    if (!is_plausible_type_name(name)) {
        return std::nullopt;
    }
    const std::string entry = class_entry_name(name);
    if (!m_archive->contains(entry)) {
        return std::nullopt;
    }

    try {
        auto data = m_archive->read(entry);
        if (!data) {
            attest_core::types_logger()->debug("Cannot read {} from {}: {}",
                entry, m_archive->path().string(), data.error().message());
            return std::nullopt;
        }
        auto info = read_class_file(*data, m_archive->path().string() + "!/" + entry);
        if (!info || info->name != name) {
            return std::nullopt;
        }
        return descriptor_from_class_file(*info, m_archive->path().string());
    } catch (const std::exception& e) {
        attest_core::types_logger()->debug("Reading {} from {} failed: {}",
            entry, m_archive->path().string(), e.what());
        return std::nullopt;
    }
}

std::string ClassArchiveSource::describe() const {
    return m_archive->path().string();
}

// =============================================================================
// ProjectTypeContext
// =============================================================================

ProjectTypeContext::ProjectTypeContext(std::vector<std::unique_ptr<TypeSource>> sources)
    : m_sources(std::move(sources)) {}

std::optional<TypeDescriptor> ProjectTypeContext::find(std::string_view name) const {
    const std::string key(name);
    {
        std::shared_lock lock(m_mutex);
        auto it = m_memo.find(key);
        if (it != m_memo.end()) {
            return it->second;
        }
    }

    std::optional<TypeDescriptor> found;
    for (const auto& source : m_sources) {
        found = source->find(name);
        if (found) {
            break;
        }
    }

    std::unique_lock lock(m_mutex);
    return m_memo.emplace(key, std::move(found)).first->second;
}

std::string ProjectTypeContext::describe() const {
    return "project context (" + std::to_string(m_sources.size()) + " locations)";
}

// =============================================================================
// File Probe
// =============================================================================

TypeLookup make_file_probe(const fs::path& project_dir) {
    const std::vector<fs::path> roots = {
        project_dir,
        project_dir / "target" / "classes",
        project_dir / "build" / "classes",
        project_dir / "build" / "classes" / "java" / "main",
    };

    return [roots](std::string_view name) -> std::optional<TypeDescriptor> {
        if (!is_plausible_type_name(name)) {
            return std::nullopt;
        }
        const std::string rel = class_entry_name(name);
        for (const auto& root : roots) {
            const fs::path file = root / rel;
            if (!is_file(file)) {
                continue;
            }
            auto info = read_class_file(file);
            if (info && info->name == name) {
                return descriptor_from_class_file(*info, root.string());
            }
            TypeDescriptor existence;
            existence.name = std::string(name);
            existence.origin = root.string();
            existence.shape_known = false;
            return existence;
        }
        return std::nullopt;
    };
}

} // namespace attest_types
