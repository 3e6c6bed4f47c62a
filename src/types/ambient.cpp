/// @file ambient.cpp
/// @brief Platform API type table

#include <attest/types/ambient.hpp>
#include <attest/types/capability.hpp>

#include <algorithm>
#include <mutex>

namespace attest_types {

namespace {

TypeDescriptor platform_type(std::string_view name,
                             TypeKind kind,
                             std::optional<std::string_view> super_name,
                             std::vector<std::string_view> interfaces = {}) {
    TypeDescriptor descriptor;
    descriptor.name = std::string(name);
    descriptor.kind = kind;
    if (super_name) {
        descriptor.super_name = std::string(*super_name);
    }
    for (auto interface_name : interfaces) {
        descriptor.interfaces.emplace_back(interface_name);
    }
    descriptor.origin = "ambient";
    return descriptor;
}

} // anonymous namespace

std::shared_ptr<AmbientTypeSpace> AmbientTypeSpace::with_platform_api() {
    auto space = std::make_shared<AmbientTypeSpace>();
    const auto object = std::optional<std::string_view>(api::k_object);

    space->add(platform_type(api::k_object, TypeKind::Class, std::nullopt));

    // Generation 1
    space->add(platform_type(api::k_v1_java_delegate, TypeKind::Interface, object));
    space->add(platform_type(api::k_v1_task_listener, TypeKind::Interface, object));
    space->add(platform_type(api::k_v1_execution_listener, TypeKind::Interface, object));
    space->add(platform_type(api::k_v1_abstract_service_delegate, TypeKind::AbstractClass, object,
        {api::k_v1_java_delegate}));
    space->add(platform_type(api::k_v1_abstract_task_message_send, TypeKind::AbstractClass, object,
        {api::k_v1_java_delegate}));
    space->add(platform_type(api::k_v1_default_user_task_listener, TypeKind::Class, object,
        {api::k_v1_task_listener}));
    space->add(platform_type(api::k_v1_plugin_definition, TypeKind::Interface, object));

    // Generation 2
    space->add(platform_type(api::k_v2_service_task, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_message_send_task, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_message_intermediate_throw_event, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_message_end_event, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_user_task_listener, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_execution_listener, TypeKind::Interface, object));
    space->add(platform_type(api::k_v2_default_user_task_listener, TypeKind::Class, object,
        {api::k_v2_user_task_listener}));
    space->add(platform_type(api::k_v2_plugin_definition, TypeKind::Interface, object));

    return space;
}

void AmbientTypeSpace::add(TypeDescriptor descriptor) {
    std::unique_lock lock(m_mutex);
    std::string key = descriptor.name;
    m_types.insert_or_assign(std::move(key), std::move(descriptor));
}

std::optional<TypeDescriptor> AmbientTypeSpace::find(std::string_view name) const {
    std::shared_lock lock(m_mutex);
    auto it = m_types.find(std::string(name));
    if (it == m_types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AmbientTypeSpace::size() const {
    std::shared_lock lock(m_mutex);
    return m_types.size();
}

std::vector<std::string> AmbientTypeSpace::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(m_mutex);
        result.reserve(m_types.size());
        for (const auto& [name, descriptor] : m_types) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace attest_types
