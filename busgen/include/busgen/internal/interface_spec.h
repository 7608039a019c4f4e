/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include <busgen/internal/signature.h>

namespace busgen
{
    constexpr const char* emits_changed_signal_annotation = "org.freedesktop.DBus.Property.EmitsChangedSignal";
    constexpr const char* deprecated_annotation = "org.freedesktop.DBus.Deprecated";
    constexpr const char* no_reply_annotation = "org.freedesktop.DBus.Method.NoReply";

    enum class arg_direction
    {
        in,
        out
    };

    enum class property_access
    {
        read,
        write,
        readwrite
    };

    // what a property change puts on the bus
    enum class change_notify
    {
        yes,         // PropertiesChanged carrying the new value
        invalidates, // PropertiesChanged naming the property as invalidated
        constant,    // never changes once the object exists
        no           // nothing is emitted
    };

    const char* to_string(arg_direction direction);
    const char* to_string(property_access access);
    const char* to_string(change_notify notify);

    bool parse_direction(const std::string& text, arg_direction& out);
    bool parse_access(const std::string& text, property_access& out);
    bool parse_change_notify(const std::string& text, change_notify& out);

    struct annotation
    {
        std::string name;
        std::string value;

        bool operator==(const annotation& other) const { return name == other.name && value == other.value; }
    };

    const annotation* find_annotation(const std::vector<annotation>& annotations, const std::string& name);

    struct arg_spec
    {
        std::string name; // empty when the argument is positional only
        arg_direction direction = arg_direction::in;
        type_signature type;
        std::vector<annotation> annotations;
    };

    struct method_spec
    {
        std::string wire_name;
        std::string native_name;
        std::vector<arg_spec> inputs;
        std::vector<arg_spec> outputs;
        std::string doc;
        std::vector<annotation> annotations;

        type_signature input_signature() const;

        // the reply body, one complete type per output argument
        type_signature output_signature() const;

        // Signature of the native return value: empty with no outputs, the output's type for a
        // single output, otherwise the outputs wrapped in one struct ("us" -> "(us)").
        std::string return_signature() const;

        bool is_no_reply() const;
        bool is_deprecated() const;
    };

    struct property_spec
    {
        std::string wire_name;
        std::string native_name;
        type_signature type;
        property_access access = property_access::read;
        change_notify notify = change_notify::yes;
        std::string doc;
        std::vector<annotation> annotations;

        bool readable() const { return access != property_access::write; }
        bool writable() const { return access != property_access::read; }

        // a setter binding exists only for writable, non-constant properties
        bool has_setter() const { return writable() && notify != change_notify::constant; }
        bool is_deprecated() const;
    };

    struct signal_spec
    {
        std::string wire_name;
        std::string native_name;
        std::vector<arg_spec> args;
        std::string doc;
        std::vector<annotation> annotations;

        type_signature signature() const;
        bool is_deprecated() const;
    };

    struct interface_spec
    {
        std::string name;
        std::vector<method_spec> methods;
        std::vector<property_spec> properties;
        std::vector<signal_spec> signals;
        std::string doc;
        std::vector<annotation> annotations;

        const method_spec* find_method(const std::string& wire_name) const;
        const property_spec* find_property(const std::string& wire_name) const;
        const signal_spec* find_signal(const std::string& wire_name) const;
    };

    struct introspection_node
    {
        std::string name; // empty for the root node
        std::vector<interface_spec> interfaces;
        std::vector<introspection_node> children;

        const interface_spec* find_interface(const std::string& interface_name) const;
    };

    // Checks the construction invariants of an interface: valid names, unique wire names per
    // member kind, input-only signal arguments and no writable constant property. The
    // offending member is named in diagnostic.
    int validate_interface(const interface_spec& spec, std::string& diagnostic);
}
