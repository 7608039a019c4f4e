/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/error_codes.h>
#include <busgen/internal/interface_builder.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/standard_interfaces.h>

namespace busgen
{
    namespace
    {
        interface_spec build_or_log(const interface_builder& builder)
        {
            interface_spec spec;
            std::string diagnostic;
            auto ret = builder.build(spec, diagnostic);
            if (ret != error::OK())
                BUSGEN_ERROR("standard interface rejected: {}", diagnostic);
            return spec;
        }

        std::vector<interface_spec> make_standard_interfaces()
        {
            std::vector<interface_spec> specs;

            interface_builder peer(peer_interface);
            peer.add_method("ping");
            peer.add_method("get_machine_id").returns("s", "machine_uuid");
            specs.push_back(build_or_log(peer));

            interface_builder introspectable(introspectable_interface);
            introspectable.add_method("introspect").returns("s", "xml_data");
            specs.push_back(build_or_log(introspectable));

            interface_builder properties(properties_interface);
            properties.add_method("get").param("interface_name", "s").param("property_name", "s").returns("v", "value");
            properties.add_method("set").param("interface_name", "s").param("property_name", "s").param("value", "v");
            properties.add_method("get_all").param("interface_name", "s").returns("a{sv}", "props");
            properties.add_signal("properties_changed")
                .arg("interface_name", "s")
                .arg("changed_properties", "a{sv}")
                .arg("invalidated_properties", "as");
            specs.push_back(build_or_log(properties));

            interface_builder object_manager(object_manager_interface);
            object_manager.add_method("get_managed_objects").returns("a{oa{sa{sv}}}", "object_paths_interfaces_and_properties");
            object_manager.add_signal("interfaces_added").arg("object_path", "o").arg("interfaces_and_properties", "a{sa{sv}}");
            object_manager.add_signal("interfaces_removed").arg("object_path", "o").arg("interfaces", "as");
            specs.push_back(build_or_log(object_manager));

            return specs;
        }
    }

    const std::vector<interface_spec>& standard_interfaces()
    {
        static const std::vector<interface_spec> specs = make_standard_interfaces();
        return specs;
    }

    const interface_spec* find_standard_interface(const std::string& name)
    {
        for (auto& spec : standard_interfaces())
        {
            if (spec.name == name)
                return &spec;
        }
        return nullptr;
    }

    namespace fdo
    {
        introspectable_proxy::introspectable_proxy(std::shared_ptr<transport> t, std::string destination, std::string path)
            : proxy_base(std::move(t), std::move(destination), std::move(path), introspectable_interface)
        {
        }

        CORO_TASK(int) introspectable_proxy::introspect(std::string& xml_data)
        {
            CO_RETURN CO_AWAIT call_method_returning("Introspect", xml_data);
        }

        properties_proxy::properties_proxy(std::shared_ptr<transport> t, std::string destination, std::string path)
            : proxy_base(std::move(t), std::move(destination), std::move(path), properties_interface)
        {
        }

        CORO_TASK(int) properties_proxy::get(const std::string& interface_name, const std::string& property_name, value& result)
        {
            CO_RETURN CO_AWAIT call_method_returning("Get", result, interface_name, property_name);
        }

        CORO_TASK(int)
        properties_proxy::set(const std::string& interface_name, const std::string& property_name, const value& new_value)
        {
            CO_RETURN CO_AWAIT call_method("Set", interface_name, property_name, new_value);
        }

        CORO_TASK(int) properties_proxy::get_all(const std::string& interface_name, std::map<std::string, value>& result)
        {
            CO_RETURN CO_AWAIT call_method_returning("GetAll", result, interface_name);
        }

        int properties_proxy::receive_properties_changed(signal_subscription& subscription)
        {
            subscription = make_signal_subscription("PropertiesChanged");
            return subscription.subscribe();
        }

        peer_proxy::peer_proxy(std::shared_ptr<transport> t, std::string destination, std::string path)
            : proxy_base(std::move(t), std::move(destination), std::move(path), peer_interface)
        {
        }

        CORO_TASK(int) peer_proxy::ping()
        {
            CO_RETURN CO_AWAIT call_method("Ping");
        }

        CORO_TASK(int) peer_proxy::get_machine_id(std::string& machine_uuid)
        {
            CO_RETURN CO_AWAIT call_method_returning("GetMachineId", machine_uuid);
        }

        object_manager_proxy::object_manager_proxy(std::shared_ptr<transport> t, std::string destination, std::string path)
            : proxy_base(std::move(t), std::move(destination), std::move(path), object_manager_interface)
        {
        }

        CORO_TASK(int) object_manager_proxy::get_managed_objects(managed_objects& result)
        {
            CO_RETURN CO_AWAIT call_method_returning("GetManagedObjects", result);
        }

        int object_manager_proxy::receive_interfaces_added(signal_subscription& subscription)
        {
            subscription = make_signal_subscription("InterfacesAdded");
            return subscription.subscribe();
        }

        int object_manager_proxy::receive_interfaces_removed(signal_subscription& subscription)
        {
            subscription = make_signal_subscription("InterfacesRemoved");
            return subscription.subscribe();
        }
    }
}
