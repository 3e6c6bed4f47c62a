#pragma once

/// @file verifier.hpp
/// @brief Structural capability checks for implementation types

#include "fwd.hpp"
#include "capability.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace attest_types {

class TypeRegistry;

struct VerificationResult {
    enum class Status : std::uint8_t {
        Passed,
        NotFound,
        NotSatisfied,
        EmptyName,
    };

    Status status = Status::NotFound;
    std::string type_name;

    /// Satisfied capability (Passed only)
    std::optional<std::string> matched;

    std::string message;

    /// Passed, but the expected base class is not extended
    std::optional<std::string> base_warning;

    [[nodiscard]] bool passed() const noexcept { return status == Status::Passed; }

    [[nodiscard]] static VerificationResult pass(std::string type_name, std::string capability);
    [[nodiscard]] static VerificationResult not_found(std::string type_name);
    [[nodiscard]] static VerificationResult not_satisfied(std::string type_name, const CapabilitySet& expected);
    [[nodiscard]] static VerificationResult empty_name();
};

[[nodiscard]] const char* verification_status_name(VerificationResult::Status status) noexcept;

/// Check a type against a capability set. Capabilities are tried in order and
/// the first satisfied one is reported. Nothing is loaded or executed.
[[nodiscard]] VerificationResult verify(std::string_view type_name,
                                        const CapabilitySet& capabilities,
                                        const TypeRegistry& registry);

} // namespace attest_types
