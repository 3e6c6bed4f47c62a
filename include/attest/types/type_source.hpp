#pragma once

/// @file type_source.hpp
/// @brief Structural type descriptors and the places they are read from

#include "fwd.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace attest_resource {
class ZipArchive;
}

namespace attest_types {

namespace fs = std::filesystem;

enum class TypeKind : std::uint8_t {
    Class,
    AbstractClass,
    Interface,
};

[[nodiscard]] const char* type_kind_name(TypeKind kind) noexcept;

/// Shape of one type: its name and direct supertypes
struct TypeDescriptor {
    std::string name;
    std::optional<std::string> super_name;
    std::vector<std::string> interfaces;
    TypeKind kind = TypeKind::Class;

    /// Location that produced the descriptor (directory, archive or "ambient")
    std::string origin;

    /// False when only existence is known (file probe of an unreadable class file)
    bool shape_known = true;

    /// Super class followed by interfaces
    [[nodiscard]] std::vector<std::string> direct_supertypes() const;
};

/// Function from a dotted type name to its descriptor
using TypeLookup = std::function<std::optional<TypeDescriptor>(std::string_view)>;

// =============================================================================
// TypeSource
// =============================================================================

/// A place type descriptors can be looked up in
class TypeSource {
public:
    virtual ~TypeSource() = default;

    [[nodiscard]] virtual std::optional<TypeDescriptor> find(std::string_view name) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Loose class files below a directory ("a.b.C" -> <dir>/a/b/C.class)
class ClassDirectorySource : public TypeSource {
public:
    explicit ClassDirectorySource(fs::path directory) : m_directory(std::move(directory)) {}

    [[nodiscard]] std::optional<TypeDescriptor> find(std::string_view name) const override;
    [[nodiscard]] std::string describe() const override { return m_directory.string(); }

private:
    fs::path m_directory;
};

/// Class files inside an archive
class ClassArchiveSource : public TypeSource {
public:
    explicit ClassArchiveSource(std::shared_ptr<const attest_resource::ZipArchive> archive);

    [[nodiscard]] std::optional<TypeDescriptor> find(std::string_view name) const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::shared_ptr<const attest_resource::ZipArchive> m_archive;
};

/// Ordered sources of one project; the first source that knows a name wins.
/// Answers (including misses) are memoized per name.
class ProjectTypeContext : public TypeSource {
public:
    explicit ProjectTypeContext(std::vector<std::unique_ptr<TypeSource>> sources);

    [[nodiscard]] std::optional<TypeDescriptor> find(std::string_view name) const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] std::size_t source_count() const noexcept { return m_sources.size(); }

private:
    std::vector<std::unique_ptr<TypeSource>> m_sources;
    mutable std::shared_mutex m_mutex;
    mutable std::unordered_map<std::string, std::optional<TypeDescriptor>> m_memo;
};

/// Existence probe for loose output: <root>/<a/b/C.class> under the project
/// root and the conventional compiled-output folders. Never throws.
[[nodiscard]] TypeLookup make_file_probe(const fs::path& project_dir);

/// Build a descriptor from a parsed class file
[[nodiscard]] TypeDescriptor descriptor_from_class_file(const ClassFileInfo& info, std::string origin);

} // namespace attest_types
