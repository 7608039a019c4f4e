/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <set>

#include <fmt/format.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/interface_spec.h>
#include <busgen/internal/naming.h>

namespace busgen
{
    namespace
    {
        type_signature concat_types(const std::vector<arg_spec>& args)
        {
            std::vector<type_node> types;
            for (auto& arg : args)
                types.insert(types.end(), arg.type.types().begin(), arg.type.types().end());
            return type_signature(std::move(types));
        }

        bool has_true_annotation(const std::vector<annotation>& annotations, const char* name)
        {
            auto* a = find_annotation(annotations, name);
            return a && a->value == "true";
        }

        template<typename Member>
        int check_unique_names(const std::string& kind,
            const std::vector<Member>& members,
            const std::string& interface_name,
            std::string& diagnostic)
        {
            std::set<std::string> seen;
            for (auto& member : members)
            {
                if (!is_valid_member_name(member.wire_name))
                {
                    diagnostic = fmt::format("{} '{}' of {} has an invalid wire name", kind, member.wire_name, interface_name);
                    return error::MODEL_INVALID_IDENTIFIER();
                }
                if (!member.native_name.empty() && !is_valid_native_identifier(member.native_name))
                {
                    diagnostic
                        = fmt::format("{} '{}' of {} has an invalid native name", kind, member.native_name, interface_name);
                    return error::MODEL_INVALID_IDENTIFIER();
                }
                if (!seen.insert(member.wire_name).second)
                {
                    diagnostic = fmt::format("duplicate {} '{}' in {}", kind, member.wire_name, interface_name);
                    return error::MODEL_DUPLICATE_MEMBER();
                }
            }
            return error::OK();
        }
    }

    const char* to_string(arg_direction direction)
    {
        return direction == arg_direction::in ? "in" : "out";
    }

    const char* to_string(property_access access)
    {
        switch (access)
        {
        case property_access::read:
            return "read";
        case property_access::write:
            return "write";
        case property_access::readwrite:
            return "readwrite";
        }
        return "read";
    }

    const char* to_string(change_notify notify)
    {
        switch (notify)
        {
        case change_notify::yes:
            return "true";
        case change_notify::invalidates:
            return "invalidates";
        case change_notify::constant:
            return "const";
        case change_notify::no:
            return "false";
        }
        return "true";
    }

    bool parse_direction(const std::string& text, arg_direction& out)
    {
        if (text == "in")
            out = arg_direction::in;
        else if (text == "out")
            out = arg_direction::out;
        else
            return false;
        return true;
    }

    bool parse_access(const std::string& text, property_access& out)
    {
        if (text == "read")
            out = property_access::read;
        else if (text == "write")
            out = property_access::write;
        else if (text == "readwrite")
            out = property_access::readwrite;
        else
            return false;
        return true;
    }

    bool parse_change_notify(const std::string& text, change_notify& out)
    {
        if (text == "true")
            out = change_notify::yes;
        else if (text == "invalidates")
            out = change_notify::invalidates;
        else if (text == "const")
            out = change_notify::constant;
        else if (text == "false")
            out = change_notify::no;
        else
            return false;
        return true;
    }

    const annotation* find_annotation(const std::vector<annotation>& annotations, const std::string& name)
    {
        for (auto& a : annotations)
        {
            if (a.name == name)
                return &a;
        }
        return nullptr;
    }

    type_signature method_spec::input_signature() const
    {
        return concat_types(inputs);
    }

    type_signature method_spec::output_signature() const
    {
        return concat_types(outputs);
    }

    std::string method_spec::return_signature() const
    {
        auto outs = output_signature();
        if (outs.size() <= 1)
            return outs.to_string();
        return outs.as_struct().to_string();
    }

    bool method_spec::is_no_reply() const
    {
        return has_true_annotation(annotations, no_reply_annotation);
    }

    bool method_spec::is_deprecated() const
    {
        return has_true_annotation(annotations, deprecated_annotation);
    }

    bool property_spec::is_deprecated() const
    {
        return has_true_annotation(annotations, deprecated_annotation);
    }

    type_signature signal_spec::signature() const
    {
        return concat_types(args);
    }

    bool signal_spec::is_deprecated() const
    {
        return has_true_annotation(annotations, deprecated_annotation);
    }

    const method_spec* interface_spec::find_method(const std::string& wire_name) const
    {
        for (auto& method : methods)
        {
            if (method.wire_name == wire_name)
                return &method;
        }
        return nullptr;
    }

    const property_spec* interface_spec::find_property(const std::string& wire_name) const
    {
        for (auto& property : properties)
        {
            if (property.wire_name == wire_name)
                return &property;
        }
        return nullptr;
    }

    const signal_spec* interface_spec::find_signal(const std::string& wire_name) const
    {
        for (auto& signal : signals)
        {
            if (signal.wire_name == wire_name)
                return &signal;
        }
        return nullptr;
    }

    const interface_spec* introspection_node::find_interface(const std::string& interface_name) const
    {
        for (auto& iface : interfaces)
        {
            if (iface.name == interface_name)
                return &iface;
        }
        return nullptr;
    }

    int validate_interface(const interface_spec& spec, std::string& diagnostic)
    {
        if (!is_valid_interface_name(spec.name))
        {
            diagnostic = fmt::format("'{}' is not a valid interface name", spec.name);
            return error::MODEL_INVALID_IDENTIFIER();
        }

        auto ret = check_unique_names("method", spec.methods, spec.name, diagnostic);
        if (ret != error::OK())
            return ret;
        ret = check_unique_names("property", spec.properties, spec.name, diagnostic);
        if (ret != error::OK())
            return ret;
        ret = check_unique_names("signal", spec.signals, spec.name, diagnostic);
        if (ret != error::OK())
            return ret;

        for (auto& method : spec.methods)
        {
            for (auto& arg : method.inputs)
            {
                if (arg.direction != arg_direction::in)
                {
                    diagnostic = fmt::format("input argument '{}' of method '{}' is not 'in'", arg.name, method.wire_name);
                    return error::MODEL_INVALID_DIRECTION();
                }
            }
            for (auto& arg : method.outputs)
            {
                if (arg.direction != arg_direction::out)
                {
                    diagnostic = fmt::format("output argument '{}' of method '{}' is not 'out'", arg.name, method.wire_name);
                    return error::MODEL_INVALID_DIRECTION();
                }
            }
        }

        for (auto& property : spec.properties)
        {
            if (!property.type.is_single_complete_type())
            {
                diagnostic = fmt::format("property '{}' must have exactly one complete type", property.wire_name);
                return error::MODEL_CONFLICTING_PROPERTY();
            }
            if (property.notify == change_notify::constant && property.writable())
            {
                diagnostic = fmt::format("property '{}' is constant but declared writable", property.wire_name);
                return error::MODEL_CONST_PROPERTY_WRITABLE();
            }
        }

        for (auto& signal : spec.signals)
        {
            for (auto& arg : signal.args)
            {
                if (arg.direction != arg_direction::in)
                {
                    diagnostic = fmt::format("argument '{}' of signal '{}' has direction 'out'", arg.name, signal.wire_name);
                    return error::MODEL_INVALID_DIRECTION();
                }
            }
        }
        return error::OK();
    }
}
