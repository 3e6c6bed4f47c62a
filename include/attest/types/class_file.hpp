#pragma once

/// @file class_file.hpp
/// @brief Reader for the header of compiled JVM class files
///
/// Only the parts needed for structural ancestry checks are decoded: the
/// constant pool, access flags, this class, super class and interfaces.
/// Fields, methods and attributes are never read.

#include "fwd.hpp"

#include <attest/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace attest_types {

namespace fs = std::filesystem;

struct ClassFileInfo {
    /// Dotted binary name ("org.example.Task")
    std::string name;

    /// Dotted super class name; empty only for java.lang.Object and module-info
    std::optional<std::string> super_name;

    /// Directly implemented (or, for interfaces, extended) interfaces
    std::vector<std::string> interfaces;

    std::uint16_t access_flags = 0;
    std::uint16_t major_version = 0;

    static constexpr std::uint16_t k_acc_interface = 0x0200;
    static constexpr std::uint16_t k_acc_abstract = 0x0400;

    [[nodiscard]] bool is_interface() const noexcept { return (access_flags & k_acc_interface) != 0; }
    [[nodiscard]] bool is_abstract() const noexcept { return (access_flags & k_acc_abstract) != 0; }
};

/// Parse a class file image; source names the origin in error messages
[[nodiscard]] attest_core::Result<ClassFileInfo> read_class_file(std::span<const std::uint8_t> data,
                                                                 std::string_view source = {});

[[nodiscard]] attest_core::Result<ClassFileInfo> read_class_file(const fs::path& path);

/// "org/example/Task" -> "org.example.Task"
[[nodiscard]] std::string binary_name(std::string_view internal_name);

/// "org.example.Task" -> "org/example/Task.class"
[[nodiscard]] std::string class_entry_name(std::string_view dotted_name);

} // namespace attest_types
