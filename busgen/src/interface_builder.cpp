/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/interface_builder.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/naming.h>

namespace busgen
{
    namespace
    {
        const std::string setter_prefix = "set_";

        int check_native_name(const char* kind, const std::string& native_name, std::string& diagnostic)
        {
            if (is_valid_native_identifier(native_name))
                return error::OK();
            diagnostic = fmt::format("{} '{}' does not have a valid native name", kind, native_name);
            return error::MODEL_INVALID_IDENTIFIER();
        }

        std::string wire_name_of(const std::string& native_name, const std::string& rename)
        {
            // explicit renames are kept verbatim
            return rename.empty() ? to_pascal_case(native_name) : rename;
        }

        int build_args(const char* kind,
            const std::string& member,
            const std::vector<detail::arg_entry>& entries,
            std::vector<arg_spec>& out,
            std::string& diagnostic)
        {
            for (auto& entry : entries)
            {
                if (!entry.name.empty() && !is_valid_native_identifier(entry.name))
                {
                    diagnostic = fmt::format("argument '{}' of {} '{}' is not a valid identifier", entry.name, kind, member);
                    return error::MODEL_INVALID_IDENTIFIER();
                }
                arg_spec arg;
                arg.name = entry.name;
                arg.direction = entry.direction;
                type_node node;
                auto ret = parse_single_type(entry.type, node);
                if (ret != error::OK())
                {
                    diagnostic = fmt::format(
                        "argument '{}' of {} '{}' has malformed type '{}': {}", entry.name, kind, member, entry.type, error::to_string(ret));
                    return ret;
                }
                arg.type = type_signature({std::move(node)});
                out.push_back(std::move(arg));
            }
            return error::OK();
        }
    }

    interface_builder::method_builder& interface_builder::method_builder::param(const std::string& name, const std::string& type)
    {
        entry_->inputs.push_back({name, type, arg_direction::in});
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::returns(const std::string& type, const std::string& name)
    {
        entry_->outputs.push_back({name, type, arg_direction::out});
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::returns_struct(
        const std::vector<std::string>& field_types, const std::string& name)
    {
        std::string type = "(";
        for (auto& field : field_types)
            type += field;
        type += ")";
        entry_->outputs.push_back({name, type, arg_direction::out});
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::rename(const std::string& wire_name)
    {
        entry_->rename = wire_name;
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::doc(const std::string& text)
    {
        entry_->doc = text;
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::annotate(const std::string& name, const std::string& value)
    {
        entry_->annotations.push_back({name, value});
        return *this;
    }

    interface_builder::method_builder& interface_builder::method_builder::no_reply()
    {
        return annotate(no_reply_annotation, "true");
    }

    interface_builder::method_builder& interface_builder::method_builder::deprecated()
    {
        return annotate(deprecated_annotation, "true");
    }

    interface_builder::property_builder& interface_builder::property_builder::rename(const std::string& wire_name)
    {
        entry_->rename = wire_name;
        return *this;
    }

    interface_builder::property_builder& interface_builder::property_builder::doc(const std::string& text)
    {
        entry_->doc = text;
        return *this;
    }

    interface_builder::property_builder& interface_builder::property_builder::notify(change_notify policy)
    {
        entry_->notify = policy;
        return *this;
    }

    interface_builder::property_builder& interface_builder::property_builder::annotate(
        const std::string& name, const std::string& value)
    {
        entry_->annotations.push_back({name, value});
        return *this;
    }

    interface_builder::property_builder& interface_builder::property_builder::deprecated()
    {
        return annotate(deprecated_annotation, "true");
    }

    interface_builder::signal_builder& interface_builder::signal_builder::arg(
        const std::string& name, const std::string& type, arg_direction direction)
    {
        entry_->args.push_back({name, type, direction});
        return *this;
    }

    interface_builder::signal_builder& interface_builder::signal_builder::rename(const std::string& wire_name)
    {
        entry_->rename = wire_name;
        return *this;
    }

    interface_builder::signal_builder& interface_builder::signal_builder::doc(const std::string& text)
    {
        entry_->doc = text;
        return *this;
    }

    interface_builder::signal_builder& interface_builder::signal_builder::annotate(const std::string& name, const std::string& value)
    {
        entry_->annotations.push_back({name, value});
        return *this;
    }

    interface_builder::signal_builder& interface_builder::signal_builder::deprecated()
    {
        return annotate(deprecated_annotation, "true");
    }

    interface_builder::interface_builder(std::string name)
        : name_(std::move(name))
    {
    }

    interface_builder& interface_builder::doc(const std::string& text)
    {
        doc_ = text;
        return *this;
    }

    interface_builder& interface_builder::annotate(const std::string& name, const std::string& value)
    {
        annotations_.push_back({name, value});
        return *this;
    }

    interface_builder::method_builder interface_builder::add_method(const std::string& native_name)
    {
        methods_.emplace_back();
        methods_.back().native_name = native_name;
        return method_builder(methods_.back());
    }

    interface_builder::property_builder interface_builder::add_property(
        const std::string& native_name, const std::string& type, property_access access, change_notify notify)
    {
        properties_.emplace_back();
        auto& entry = properties_.back();
        entry.native_name = native_name;
        entry.type = type;
        entry.readable = access != property_access::write;
        entry.writable = access != property_access::read;
        entry.notify = notify;
        return property_builder(entry);
    }

    detail::property_entry& interface_builder::accessor_entry(const std::string& native_name, const std::string& type)
    {
        for (auto& entry : properties_)
        {
            if (entry.accessor && entry.native_name == native_name)
            {
                if (entry.type != type && entry.conflicting_type.empty())
                    entry.conflicting_type = type;
                return entry;
            }
        }
        properties_.emplace_back();
        auto& entry = properties_.back();
        entry.native_name = native_name;
        entry.type = type;
        entry.accessor = true;
        return entry;
    }

    interface_builder::property_builder interface_builder::add_property_getter(const std::string& native_name, const std::string& type)
    {
        auto& entry = accessor_entry(native_name, type);
        entry.readable = true;
        return property_builder(entry);
    }

    interface_builder::property_builder interface_builder::add_property_setter(const std::string& native_name, const std::string& type)
    {
        auto name = native_name;
        if (name.size() > setter_prefix.size() && name.compare(0, setter_prefix.size(), setter_prefix) == 0)
            name = name.substr(setter_prefix.size());
        auto& entry = accessor_entry(name, type);
        entry.writable = true;
        return property_builder(entry);
    }

    interface_builder::signal_builder interface_builder::add_signal(const std::string& native_name)
    {
        signals_.emplace_back();
        signals_.back().native_name = native_name;
        return signal_builder(signals_.back());
    }

    int interface_builder::build(interface_spec& out, std::string& diagnostic) const
    {
        interface_spec spec;
        spec.name = name_;
        spec.doc = doc_;
        spec.annotations = annotations_;

        for (auto& entry : methods_)
        {
            auto ret = check_native_name("method", entry.native_name, diagnostic);
            if (ret != error::OK())
                return ret;
            method_spec method;
            method.native_name = entry.native_name;
            method.wire_name = wire_name_of(entry.native_name, entry.rename);
            method.doc = entry.doc;
            method.annotations = entry.annotations;
            ret = build_args("method", method.wire_name, entry.inputs, method.inputs, diagnostic);
            if (ret != error::OK())
                return ret;
            ret = build_args("method", method.wire_name, entry.outputs, method.outputs, diagnostic);
            if (ret != error::OK())
                return ret;
            spec.methods.push_back(std::move(method));
        }

        for (auto& entry : properties_)
        {
            auto ret = check_native_name("property", entry.native_name, diagnostic);
            if (ret != error::OK())
                return ret;
            if (!entry.conflicting_type.empty())
            {
                diagnostic = fmt::format("property '{}' has a getter of type '{}' and a setter of type '{}'",
                    entry.native_name,
                    entry.type,
                    entry.conflicting_type);
                return error::MODEL_CONFLICTING_PROPERTY();
            }
            property_spec property;
            property.native_name = entry.native_name;
            property.wire_name = wire_name_of(entry.native_name, entry.rename);
            if (entry.readable && entry.writable)
                property.access = property_access::readwrite;
            else if (entry.writable)
                property.access = property_access::write;
            else
                property.access = property_access::read;
            property.notify = entry.notify;
            property.doc = entry.doc;
            property.annotations = entry.annotations;
            type_node node;
            ret = parse_single_type(entry.type, node);
            if (ret != error::OK())
            {
                diagnostic = fmt::format(
                    "property '{}' has malformed type '{}': {}", property.wire_name, entry.type, error::to_string(ret));
                return ret;
            }
            property.type = type_signature({std::move(node)});
            spec.properties.push_back(std::move(property));
        }

        for (auto& entry : signals_)
        {
            auto ret = check_native_name("signal", entry.native_name, diagnostic);
            if (ret != error::OK())
                return ret;
            signal_spec signal;
            signal.native_name = entry.native_name;
            signal.wire_name = wire_name_of(entry.native_name, entry.rename);
            signal.doc = entry.doc;
            signal.annotations = entry.annotations;
            ret = build_args("signal", signal.wire_name, entry.args, signal.args, diagnostic);
            if (ret != error::OK())
                return ret;
            spec.signals.push_back(std::move(signal));
        }

        auto ret = validate_interface(spec, diagnostic);
        if (ret != error::OK())
        {
            BUSGEN_DEBUG("interface {} rejected: {}", name_, diagnostic);
            return ret;
        }
        out = std::move(spec);
        return error::OK();
    }
}
