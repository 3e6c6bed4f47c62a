/// @file class_file.cpp
/// @brief Class file header parsing

#include <attest/types/class_file.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace attest_types {

using attest_core::ClassFileError;
using attest_core::Err;
using attest_core::Ok;
using attest_core::Result;

namespace {

enum ConstantTag : std::uint8_t {
    Utf8 = 1,
    Integer = 3,
    Float = 4,
    Long = 5,
    Double = 6,
    Class = 7,
    String = 8,
    FieldRef = 9,
    MethodRef = 10,
    InterfaceMethodRef = 11,
    NameAndType = 12,
    MethodHandle = 15,
    MethodType = 16,
    Dynamic = 17,
    InvokeDynamic = 18,
    Module = 19,
    Package = 20,
};

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) : m_data(data) {}

    [[nodiscard]] bool has(std::size_t n) const noexcept { return m_pos + n <= m_data.size(); }

    std::uint8_t u1() { return m_data[m_pos++]; }

    std::uint16_t u2() {
        const auto v = static_cast<std::uint16_t>((m_data[m_pos] << 8) | m_data[m_pos + 1]);
        m_pos += 2;
        return v;
    }

    std::uint32_t u4() {
        const auto v = (static_cast<std::uint32_t>(m_data[m_pos]) << 24) |
                       (static_cast<std::uint32_t>(m_data[m_pos + 1]) << 16) |
                       (static_cast<std::uint32_t>(m_data[m_pos + 2]) << 8) |
                       static_cast<std::uint32_t>(m_data[m_pos + 3]);
        m_pos += 4;
        return v;
    }

    void skip(std::size_t n) { m_pos += n; }

    [[nodiscard]] std::string_view bytes(std::size_t n) {
        std::string_view view(reinterpret_cast<const char*>(m_data.data() + m_pos), n);
        m_pos += n;
        return view;
    }

private:
    std::span<const std::uint8_t> m_data;
    std::size_t m_pos = 0;
};

struct PoolEntry {
    std::uint8_t tag = 0;
    std::uint16_t ref = 0;     ///< name_index of a Class entry
    std::string_view utf8;     ///< Modified UTF-8 bytes of a Utf8 entry
};

/// Size of the payload following the tag, 0 for variable-size or unknown tags
std::size_t fixed_payload_size(std::uint8_t tag) {
    switch (tag) {
        case Class: case String: case MethodType: case Module: case Package: return 2;
        case MethodHandle: return 3;
        case Integer: case Float: case FieldRef: case MethodRef: case InterfaceMethodRef:
        case NameAndType: case Dynamic: case InvokeDynamic: return 4;
        case Long: case Double: return 8;
        default: return 0;
    }
}

} // anonymous namespace

std::string binary_name(std::string_view internal_name) {
    std::string name(internal_name);
    std::replace(name.begin(), name.end(), '/', '.');
    return name;
}

std::string class_entry_name(std::string_view dotted_name) {
    std::string name(dotted_name);
    std::replace(name.begin(), name.end(), '.', '/');
    return name + ".class";
}

Result<ClassFileInfo> read_class_file(std::span<const std::uint8_t> data, std::string_view source) {
    const std::string src(source);
    Reader in(data);

    if (!in.has(10)) {
        return Err<ClassFileInfo>(ClassFileError::truncated(src));
    }
    if (in.u4() != 0xCAFEBABE) {
        return Err<ClassFileInfo>(ClassFileError::bad_magic(src));
    }

    ClassFileInfo info;
    in.skip(2);  // minor version
    info.major_version = in.u2();

    const std::uint16_t pool_count = in.u2();
    std::vector<PoolEntry> pool(pool_count);

    for (std::uint16_t i = 1; i < pool_count; ++i) {
        if (!in.has(1)) {
            return Err<ClassFileInfo>(ClassFileError::truncated(src));
        }
        PoolEntry& entry = pool[i];
        entry.tag = in.u1();

        if (entry.tag == Utf8) {
            if (!in.has(2)) {
                return Err<ClassFileInfo>(ClassFileError::truncated(src));
            }
            const std::uint16_t length = in.u2();
            if (!in.has(length)) {
                return Err<ClassFileInfo>(ClassFileError::truncated(src));
            }
            entry.utf8 = in.bytes(length);
            continue;
        }

        const std::size_t size = fixed_payload_size(entry.tag);
        if (size == 0) {
            return Err<ClassFileInfo>(ClassFileError::bad_constant_pool(src,
                "unknown tag " + std::to_string(entry.tag) + " at index " + std::to_string(i)));
        }
        if (!in.has(size)) {
            return Err<ClassFileInfo>(ClassFileError::truncated(src));
        }
        if (entry.tag == Class) {
            entry.ref = in.u2();
        } else {
            in.skip(size);
        }
        // Long and Double occupy two pool slots
        if (entry.tag == Long || entry.tag == Double) {
            ++i;
        }
    }

    auto class_name = [&pool, &src](std::uint16_t index) -> Result<std::string> {
        if (index == 0 || index >= pool.size() || pool[index].tag != Class) {
            return Err<std::string>(ClassFileError::bad_constant_pool(src,
                "index " + std::to_string(index) + " is not a class entry"));
        }
        const std::uint16_t name_index = pool[index].ref;
        if (name_index == 0 || name_index >= pool.size() || pool[name_index].tag != Utf8) {
            return Err<std::string>(ClassFileError::bad_constant_pool(src,
                "class entry " + std::to_string(index) + " has no name"));
        }
        return Ok(binary_name(pool[name_index].utf8));
    };

    if (!in.has(8)) {
        return Err<ClassFileInfo>(ClassFileError::truncated(src));
    }
    info.access_flags = in.u2();

    auto this_name = class_name(in.u2());
    if (!this_name) {
        return Err<ClassFileInfo>(std::move(this_name.error()));
    }
    info.name = std::move(*this_name);

    const std::uint16_t super_index = in.u2();
    if (super_index != 0) {
        auto super_name = class_name(super_index);
        if (!super_name) {
            return Err<ClassFileInfo>(std::move(super_name.error()));
        }
        info.super_name = std::move(*super_name);
    }

    const std::uint16_t interface_count = in.u2();
    if (!in.has(static_cast<std::size_t>(interface_count) * 2)) {
        return Err<ClassFileInfo>(ClassFileError::truncated(src));
    }
    info.interfaces.reserve(interface_count);
    for (std::uint16_t i = 0; i < interface_count; ++i) {
        auto interface_name = class_name(in.u2());
        if (!interface_name) {
            return Err<ClassFileInfo>(std::move(interface_name.error()));
        }
        info.interfaces.push_back(std::move(*interface_name));
    }

    return Ok(std::move(info));
}

Result<ClassFileInfo> read_class_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<ClassFileInfo>(attest_core::Error(attest_core::ErrorCode::IOError,
            "Cannot open class file: " + path.string()));
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return read_class_file(data, path.string());
}

} // namespace attest_types
