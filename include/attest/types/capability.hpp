#pragma once

/// @file capability.hpp
/// @brief Capability contracts per API generation and BPMN element role

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest_types {

// =============================================================================
// Platform API Type Names
// =============================================================================

namespace api {

inline constexpr std::string_view k_object = "java.lang.Object";

// Generation 1 (process engine delegate contracts)
inline constexpr std::string_view k_v1_java_delegate = "org.camunda.bpm.engine.delegate.JavaDelegate";
inline constexpr std::string_view k_v1_task_listener = "org.camunda.bpm.engine.delegate.TaskListener";
inline constexpr std::string_view k_v1_execution_listener = "org.camunda.bpm.engine.delegate.ExecutionListener";
inline constexpr std::string_view k_v1_abstract_service_delegate = "dev.dsf.bpe.v1.activity.AbstractServiceDelegate";
inline constexpr std::string_view k_v1_abstract_task_message_send = "dev.dsf.bpe.v1.activity.AbstractTaskMessageSend";
inline constexpr std::string_view k_v1_default_user_task_listener = "dev.dsf.bpe.v1.activity.DefaultUserTaskListener";
inline constexpr std::string_view k_v1_plugin_definition = "dev.dsf.bpe.v1.ProcessPluginDefinition";

// Generation 2 (platform activity interfaces)
inline constexpr std::string_view k_v2_service_task = "dev.dsf.bpe.v2.activity.ServiceTask";
inline constexpr std::string_view k_v2_message_send_task = "dev.dsf.bpe.v2.activity.MessageSendTask";
inline constexpr std::string_view k_v2_message_intermediate_throw_event =
    "dev.dsf.bpe.v2.activity.MessageIntermediateThrowEvent";
inline constexpr std::string_view k_v2_message_end_event = "dev.dsf.bpe.v2.activity.MessageEndEvent";
inline constexpr std::string_view k_v2_user_task_listener = "dev.dsf.bpe.v2.activity.UserTaskListener";
inline constexpr std::string_view k_v2_execution_listener = "dev.dsf.bpe.v2.activity.ExecutionListener";
inline constexpr std::string_view k_v2_default_user_task_listener = "dev.dsf.bpe.v2.activity.DefaultUserTaskListener";
inline constexpr std::string_view k_v2_plugin_definition = "dev.dsf.bpe.v2.ProcessPluginDefinition";

} // namespace api

// =============================================================================
// Generation and Role
// =============================================================================

enum class ApiVersion : std::uint8_t {
    Unknown,
    V1,
    V2,
};

[[nodiscard]] const char* api_version_name(ApiVersion version) noexcept;

/// "v1", "1", "V1" ... -> V1
[[nodiscard]] ApiVersion parse_api_version(std::string_view text);

/// Structural role of the BPMN element declaring an implementation type
enum class ElementRole : std::uint8_t {
    ServiceTask,
    SendTask,
    MessageIntermediateThrowEvent,
    MessageEndEvent,
    UserTaskListener,
    ExecutionListener,
    ReceiveTask,
    Generic,
};

[[nodiscard]] const char* element_role_name(ElementRole role) noexcept;

[[nodiscard]] std::optional<ElementRole> parse_element_role(std::string_view text) noexcept;

// =============================================================================
// Capabilities
// =============================================================================

struct Capability {
    std::string type_name;

    /// The capability type itself does not satisfy the contract
    bool proper_subtype_only = false;
};

struct CapabilitySet {
    ApiVersion version = ApiVersion::Unknown;
    ElementRole role = ElementRole::Generic;
    std::vector<Capability> capabilities;

    /// Base class implementations are expected to extend. Missing it does
    /// not fail the contract; it is reported alongside the match.
    std::optional<std::string> expected_base;

    [[nodiscard]] bool empty() const noexcept { return capabilities.empty(); }

    /// "dev.dsf.bpe.v2.activity.ServiceTask" or "A or B" for several capabilities
    [[nodiscard]] std::string describe() const;
};

/// Capabilities for an element role under an API generation, in match order.
/// Unknown generations yield an empty set.
[[nodiscard]] CapabilitySet capabilities_for(ApiVersion version, ElementRole role);

/// Contract name used in findings, e.g. "dev.dsf.bpe.v2.activity.ServiceTask"
/// or "a subclass of dev.dsf.bpe.v2.activity.DefaultUserTaskListener or ..."
[[nodiscard]] std::string expected_description(ApiVersion version, ElementRole role);

} // namespace attest_types
