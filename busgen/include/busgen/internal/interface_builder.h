/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <deque>
#include <string>
#include <vector>

#include <busgen/internal/interface_spec.h>

namespace busgen
{
    namespace detail
    {
        struct arg_entry
        {
            std::string name;
            std::string type;
            arg_direction direction = arg_direction::in;
        };

        struct method_entry
        {
            std::string native_name;
            std::string rename;
            std::vector<arg_entry> inputs;
            std::vector<arg_entry> outputs;
            std::string doc;
            std::vector<annotation> annotations;
        };

        struct property_entry
        {
            std::string native_name;
            std::string rename;
            std::string type;
            std::string conflicting_type; // set when a getter and setter disagree
            bool readable = false;
            bool writable = false;
            bool accessor = false; // declared through add_property_getter/setter
            change_notify notify = change_notify::yes;
            std::string doc;
            std::vector<annotation> annotations;
        };

        struct signal_entry
        {
            std::string native_name;
            std::string rename;
            std::vector<arg_entry> args;
            std::string doc;
            std::vector<annotation> annotations;
        };
    }

    // Declarative construction of an interface_spec. Member declarations are recorded as
    // given and only validated by build(), so a chain of calls never fails half way.
    //
    //   interface_builder b("org.example.Calc");
    //   b.add_method("add").param("a", "i").param("b", "i").returns("i");
    //   b.add_method("check_renaming").rename("CheckRENAMING");
    //   b.add_property_getter("level", "u");
    //   b.add_property_setter("set_level", "u");
    //   b.add_signal("overflow").arg("by", "u");
    //   interface_spec spec;
    //   std::string diagnostic;
    //   auto err = b.build(spec, diagnostic);
    class interface_builder
    {
    public:
        class method_builder
        {
            detail::method_entry* entry_;

        public:
            explicit method_builder(detail::method_entry& entry)
                : entry_(&entry)
            {
            }

            method_builder& param(const std::string& name, const std::string& type);

            // one output argument per call, several calls produce several out arguments
            method_builder& returns(const std::string& type, const std::string& name = {});

            // a single struct typed output, {"u", "s"} becomes one "(us)" out argument
            method_builder& returns_struct(const std::vector<std::string>& field_types, const std::string& name = {});

            method_builder& rename(const std::string& wire_name);
            method_builder& doc(const std::string& text);
            method_builder& annotate(const std::string& name, const std::string& value);
            method_builder& no_reply();
            method_builder& deprecated();
        };

        class property_builder
        {
            detail::property_entry* entry_;

        public:
            explicit property_builder(detail::property_entry& entry)
                : entry_(&entry)
            {
            }

            property_builder& rename(const std::string& wire_name);
            property_builder& doc(const std::string& text);
            property_builder& notify(change_notify policy);
            property_builder& annotate(const std::string& name, const std::string& value);
            property_builder& deprecated();
        };

        class signal_builder
        {
            detail::signal_entry* entry_;

        public:
            explicit signal_builder(detail::signal_entry& entry)
                : entry_(&entry)
            {
            }

            signal_builder& arg(const std::string& name, const std::string& type, arg_direction direction = arg_direction::in);
            signal_builder& rename(const std::string& wire_name);
            signal_builder& doc(const std::string& text);
            signal_builder& annotate(const std::string& name, const std::string& value);
            signal_builder& deprecated();
        };

    private:
        std::string name_;
        std::string doc_;
        std::vector<annotation> annotations_;

        // deques keep handed out builders valid while more members are added
        std::deque<detail::method_entry> methods_;
        std::deque<detail::property_entry> properties_;
        std::deque<detail::signal_entry> signals_;

        detail::property_entry& accessor_entry(const std::string& native_name, const std::string& type);

    public:
        explicit interface_builder(std::string name);

        interface_builder& doc(const std::string& text);
        interface_builder& annotate(const std::string& name, const std::string& value);

        method_builder add_method(const std::string& native_name);

        property_builder add_property(const std::string& native_name,
            const std::string& type,
            property_access access = property_access::read,
            change_notify notify = change_notify::yes);

        // getter/setter pairs merge into one readwrite property, a "set_" prefix on the
        // setter name is dropped
        property_builder add_property_getter(const std::string& native_name, const std::string& type);
        property_builder add_property_setter(const std::string& native_name, const std::string& type);

        signal_builder add_signal(const std::string& native_name);

        int build(interface_spec& out, std::string& diagnostic) const;
    };
}
