/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <busgen/internal/coroutine_support.h>
#include <busgen/internal/interface_spec.h>
#include <busgen/internal/marshal.h>
#include <busgen/internal/message.h>
#include <busgen/internal/transport.h>

namespace busgen
{
    using method_handler = std::function<CORO_TASK(int)(const message& call, std::vector<value>& reply_body)>;
    using property_getter = std::function<CORO_TASK(int)(value& result)>;
    using property_setter = std::function<CORO_TASK(int)(const value& new_value)>;

    // Server side of one interface on one object: a routing table from wire member name to
    // handler kept in declaration order, property accessors and signal emission.
    class interface_dispatcher
    {
        struct method_entry
        {
            std::string wire_name;
            method_handler handler;
        };

        struct property_entry
        {
            std::string wire_name;
            property_getter getter;
            property_setter setter;
        };

        interface_spec spec_;
        std::shared_ptr<transport> transport_;
        std::string path_;
        std::vector<method_entry> methods_;
        std::vector<property_entry> properties_;

        const property_entry* find_property_entry(const std::string& wire_name) const;
        CORO_TASK(int) send_properties_changed(std::map<std::string, value> changed, std::vector<std::string> invalidated);

    public:
        interface_dispatcher(interface_spec spec, std::shared_ptr<transport> t, std::string path);

        const interface_spec& spec() const { return spec_; }
        const std::string& interface_name() const { return spec_.name; }
        const std::string& path() const { return path_; }

        // UNKNOWN_METHOD when the interface has no such method, MODEL_DUPLICATE_MEMBER when a
        // handler is already bound
        int add_method(const std::string& wire_name, method_handler handler);

        // the setter is ignored for read-only and constant properties
        int add_property(const std::string& wire_name, property_getter getter, property_setter setter = {});

        bool has_handler(const std::string& wire_name) const;

        // Routes a method call to its handler. The call's body signature must equal the
        // method's inputs and the handler's reply must equal its outputs.
        CORO_TASK(int) dispatch(const message& call, std::vector<value>& reply_body);

        CORO_TASK(int) get_property(const std::string& wire_name, value& result);
        CORO_TASK(int) get_all_properties(std::map<std::string, value>& result);

        // Stores a new value through the bound setter and announces it as the property's
        // change_notify policy requires: the value itself, an invalidation or nothing.
        CORO_TASK(int) set_property(const std::string& wire_name, const value& new_value);

        // announces a change made behind the dispatcher's back, the getter supplies the value
        CORO_TASK(int) notify_property_changed(const std::string& wire_name);

        CORO_TASK(int) emit_signal(const std::string& wire_name, std::vector<value> body);

        template<typename... Ts> CORO_TASK(int) emit(const std::string& wire_name, const Ts&... args)
        {
            CO_RETURN CO_AWAIT emit_signal(wire_name, marshal_values(args...));
        }

        // the same text write_interface_xml produces for the interface
        std::string introspect() const;
    };
}
