/// @file capability.cpp
/// @brief Capability tables for both API generations

#include <attest/types/capability.hpp>

#include <algorithm>
#include <cctype>

namespace attest_types {

namespace {

Capability cap(std::string_view name, bool proper = false) {
    return Capability{std::string(name), proper};
}

std::vector<Capability> v1_capabilities(ElementRole role) {
    switch (role) {
        case ElementRole::ServiceTask:
        case ElementRole::SendTask:
        case ElementRole::MessageIntermediateThrowEvent:
        case ElementRole::MessageEndEvent:
            return {cap(api::k_v1_java_delegate)};
        case ElementRole::UserTaskListener:
            return {cap(api::k_v1_default_user_task_listener, true), cap(api::k_v1_task_listener)};
        case ElementRole::ExecutionListener:
            return {cap(api::k_v1_execution_listener)};
        case ElementRole::ReceiveTask:
        case ElementRole::Generic:
        default:
            return {cap(api::k_v1_java_delegate), cap(api::k_v1_task_listener), cap(api::k_v1_execution_listener)};
    }
}

std::vector<Capability> v2_capabilities(ElementRole role) {
    switch (role) {
        case ElementRole::ServiceTask:
            return {cap(api::k_v2_service_task)};
        case ElementRole::SendTask:
            return {cap(api::k_v2_message_send_task)};
        case ElementRole::MessageIntermediateThrowEvent:
            return {cap(api::k_v2_message_intermediate_throw_event)};
        case ElementRole::MessageEndEvent:
            return {cap(api::k_v2_message_end_event)};
        case ElementRole::UserTaskListener:
            return {cap(api::k_v2_default_user_task_listener, true), cap(api::k_v2_user_task_listener)};
        case ElementRole::ExecutionListener:
            return {cap(api::k_v2_execution_listener)};
        case ElementRole::ReceiveTask:
        case ElementRole::Generic:
        default:
            return {
                cap(api::k_v2_service_task),
                cap(api::k_v2_message_send_task),
                cap(api::k_v2_message_intermediate_throw_event),
                cap(api::k_v2_message_end_event),
                cap(api::k_v2_user_task_listener),
                cap(api::k_v2_execution_listener),
            };
    }
}

std::string lower(std::string_view text) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

const char* api_version_name(ApiVersion version) noexcept {
    switch (version) {
        case ApiVersion::V1: return "v1";
        case ApiVersion::V2: return "v2";
        case ApiVersion::Unknown:
        default: return "unknown";
    }
}

ApiVersion parse_api_version(std::string_view text) {
    const std::string s = lower(text);
    if (s == "v1" || s == "1") return ApiVersion::V1;
    if (s == "v2" || s == "2") return ApiVersion::V2;
    return ApiVersion::Unknown;
}

const char* element_role_name(ElementRole role) noexcept {
    switch (role) {
        case ElementRole::ServiceTask: return "service-task";
        case ElementRole::SendTask: return "send-task";
        case ElementRole::MessageIntermediateThrowEvent: return "message-intermediate-throw-event";
        case ElementRole::MessageEndEvent: return "message-end-event";
        case ElementRole::UserTaskListener: return "user-task-listener";
        case ElementRole::ExecutionListener: return "execution-listener";
        case ElementRole::ReceiveTask: return "receive-task";
        case ElementRole::Generic: return "generic";
        default: return "unknown";
    }
}

std::optional<ElementRole> parse_element_role(std::string_view text) noexcept {
    for (auto role : {ElementRole::ServiceTask, ElementRole::SendTask,
                      ElementRole::MessageIntermediateThrowEvent, ElementRole::MessageEndEvent,
                      ElementRole::UserTaskListener, ElementRole::ExecutionListener,
                      ElementRole::ReceiveTask, ElementRole::Generic}) {
        if (text == element_role_name(role)) {
            return role;
        }
    }
    return std::nullopt;
}

std::string CapabilitySet::describe() const {
    std::string text;
    for (const auto& capability : capabilities) {
        if (!text.empty()) {
            text += " or ";
        }
        text += capability.type_name;
    }
    return text.empty() ? "(no capability)" : text;
}

CapabilitySet capabilities_for(ApiVersion version, ElementRole role) {
    CapabilitySet set;
    set.version = version;
    set.role = role;
    switch (version) {
        case ApiVersion::V1:
            set.capabilities = v1_capabilities(role);
            if (role == ElementRole::ServiceTask) {
                set.expected_base = std::string(api::k_v1_abstract_service_delegate);
            }
            break;
        case ApiVersion::V2: set.capabilities = v2_capabilities(role); break;
        case ApiVersion::Unknown:
        default: break;
    }
    return set;
}

std::string expected_description(ApiVersion version, ElementRole role) {
    const auto set = capabilities_for(version, role);
    if (set.empty()) {
        return std::string("no known contract for API ") + api_version_name(version);
    }

    std::string text;
    for (const auto& capability : set.capabilities) {
        if (!text.empty()) {
            text += " or ";
        }
        if (capability.proper_subtype_only) {
            text += "a subclass of ";
        }
        text += capability.type_name;
    }
    return text;
}

} // namespace attest_types
