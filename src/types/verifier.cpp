/// @file verifier.cpp
/// @brief Capability verification

#include <attest/types/verifier.hpp>
#include <attest/types/type_registry.hpp>
#include <attest/core/log.hpp>

namespace attest_types {

VerificationResult VerificationResult::pass(std::string type_name, std::string capability) {
    VerificationResult result;
    result.status = Status::Passed;
    result.message = type_name + " satisfies " + capability;
    result.type_name = std::move(type_name);
    result.matched = std::move(capability);
    return result;
}

VerificationResult VerificationResult::not_found(std::string type_name) {
    VerificationResult result;
    result.status = Status::NotFound;
    result.message = "Type not found: " + type_name;
    result.type_name = std::move(type_name);
    return result;
}

VerificationResult VerificationResult::not_satisfied(std::string type_name, const CapabilitySet& expected) {
    VerificationResult result;
    result.status = Status::NotSatisfied;
    result.message = type_name + " does not satisfy " +
                     expected_description(expected.version, expected.role);
    result.type_name = std::move(type_name);
    return result;
}

VerificationResult VerificationResult::empty_name() {
    VerificationResult result;
    result.status = Status::EmptyName;
    result.message = "Implementation type name is empty";
    return result;
}

const char* verification_status_name(VerificationResult::Status status) noexcept {
    switch (status) {
        case VerificationResult::Status::Passed: return "passed";
        case VerificationResult::Status::NotFound: return "not-found";
        case VerificationResult::Status::NotSatisfied: return "not-satisfied";
        case VerificationResult::Status::EmptyName: return "empty-name";
        default: return "unknown";
    }
}

VerificationResult verify(std::string_view type_name,
                          const CapabilitySet& capabilities,
                          const TypeRegistry& registry) {
    if (type_name.empty()) {
        return VerificationResult::empty_name();
    }

    if (!registry.exists(type_name)) {
        attest_core::types_logger()->debug("Type {} not found for project {}",
                                           type_name, registry.project_dir().string());
        return VerificationResult::not_found(std::string(type_name));
    }

    for (const auto& capability : capabilities.capabilities) {
        if (registry.is_subtype_of(type_name, capability.type_name, capability.proper_subtype_only)) {
            auto result = VerificationResult::pass(std::string(type_name), capability.type_name);
            const auto& base = capabilities.expected_base;
            if (base && !registry.is_subtype_of(type_name, *base, false)) {
                result.base_warning = result.type_name + " implements " + capability.type_name +
                                      " but does not extend " + *base;
            }
            return result;
        }
    }

    return VerificationResult::not_satisfied(std::string(type_name), capabilities);
}

} // namespace attest_types
