#pragma once

/// @file ambient.hpp
/// @brief Types visible without consulting any project
///
/// The ambient space plays the role of the running platform: it knows the
/// API contracts plugins implement (both generations) and java.lang.Object.
/// Hosts may register further types.

#include "fwd.hpp"
#include "type_source.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace attest_types {

class AmbientTypeSpace : public TypeSource {
public:
    AmbientTypeSpace() = default;

    /// Space pre-populated with the platform API contracts of both generations
    [[nodiscard]] static std::shared_ptr<AmbientTypeSpace> with_platform_api();

    /// Add or replace a type
    void add(TypeDescriptor descriptor);

    [[nodiscard]] std::optional<TypeDescriptor> find(std::string_view name) const override;
    [[nodiscard]] std::string describe() const override { return "ambient"; }

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, TypeDescriptor> m_types;
};

} // namespace attest_types
