/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <busgen/internal/interface_spec.h>
#include <busgen/internal/proxy.h>

namespace busgen
{
    constexpr const char* introspectable_interface = "org.freedesktop.DBus.Introspectable";
    constexpr const char* peer_interface = "org.freedesktop.DBus.Peer";
    constexpr const char* object_manager_interface = "org.freedesktop.DBus.ObjectManager";

    // org.freedesktop.DBus.Introspectable, Properties, Peer and ObjectManager
    const std::vector<interface_spec>& standard_interfaces();
    const interface_spec* find_standard_interface(const std::string& name);

    namespace fdo
    {
        // The standard interfaces are bound once here, generated modules refer to these
        // instead of generating their own.

        class introspectable_proxy : public proxy_base
        {
        public:
            introspectable_proxy(std::shared_ptr<transport> t, std::string destination, std::string path);

            CORO_TASK(int) introspect(std::string& xml_data);
        };

        class properties_proxy : public proxy_base
        {
        public:
            properties_proxy(std::shared_ptr<transport> t, std::string destination, std::string path);

            CORO_TASK(int) get(const std::string& interface_name, const std::string& property_name, value& result);
            CORO_TASK(int) set(const std::string& interface_name, const std::string& property_name, const value& new_value);
            CORO_TASK(int) get_all(const std::string& interface_name, std::map<std::string, value>& result);

            int receive_properties_changed(signal_subscription& subscription);
        };

        // decoded PropertiesChanged arguments
        struct properties_changed_args
        {
            std::string interface_name;
            std::map<std::string, value> changed_properties;
            std::vector<std::string> invalidated_properties;

            int decode(received_signal& signal) { return signal.args(interface_name, changed_properties, invalidated_properties); }
        };

        class peer_proxy : public proxy_base
        {
        public:
            peer_proxy(std::shared_ptr<transport> t, std::string destination, std::string path);

            CORO_TASK(int) ping();
            CORO_TASK(int) get_machine_id(std::string& machine_uuid);
        };

        using managed_objects = std::map<object_path, std::map<std::string, std::map<std::string, value>>>;

        class object_manager_proxy : public proxy_base
        {
        public:
            object_manager_proxy(std::shared_ptr<transport> t, std::string destination, std::string path);

            CORO_TASK(int) get_managed_objects(managed_objects& result);

            int receive_interfaces_added(signal_subscription& subscription);
            int receive_interfaces_removed(signal_subscription& subscription);
        };

        struct interfaces_added_args
        {
            object_path path;
            std::map<std::string, std::map<std::string, value>> interfaces_and_properties;

            int decode(received_signal& signal) { return signal.args(path, interfaces_and_properties); }
        };

        struct interfaces_removed_args
        {
            object_path path;
            std::vector<std::string> interfaces;

            int decode(received_signal& signal) { return signal.args(path, interfaces); }
        };
    }
}
