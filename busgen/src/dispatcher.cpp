/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/dispatcher.h>
#include <busgen/internal/error_codes.h>
#include <busgen/internal/introspection.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/proxy.h>

namespace busgen
{
    interface_dispatcher::interface_dispatcher(interface_spec spec, std::shared_ptr<transport> t, std::string path)
        : spec_(std::move(spec))
        , transport_(std::move(t))
        , path_(std::move(path))
    {
    }

    int interface_dispatcher::add_method(const std::string& wire_name, method_handler handler)
    {
        if (!spec_.find_method(wire_name))
        {
            BUSGEN_ERROR("{} has no method {}", spec_.name, wire_name);
            return error::UNKNOWN_METHOD();
        }
        if (has_handler(wire_name))
            return error::MODEL_DUPLICATE_MEMBER();
        methods_.push_back({wire_name, std::move(handler)});
        return error::OK();
    }

    int interface_dispatcher::add_property(const std::string& wire_name, property_getter getter, property_setter setter)
    {
        auto* property = spec_.find_property(wire_name);
        if (!property)
        {
            BUSGEN_ERROR("{} has no property {}", spec_.name, wire_name);
            return error::UNKNOWN_PROPERTY();
        }
        if (find_property_entry(wire_name))
            return error::MODEL_DUPLICATE_MEMBER();
        if (!property->has_setter())
            setter = {};
        properties_.push_back({wire_name, std::move(getter), std::move(setter)});
        return error::OK();
    }

    bool interface_dispatcher::has_handler(const std::string& wire_name) const
    {
        for (auto& entry : methods_)
        {
            if (entry.wire_name == wire_name)
                return true;
        }
        return false;
    }

    const interface_dispatcher::property_entry* interface_dispatcher::find_property_entry(const std::string& wire_name) const
    {
        for (auto& entry : properties_)
        {
            if (entry.wire_name == wire_name)
                return &entry;
        }
        return nullptr;
    }

    CORO_TASK(int) interface_dispatcher::dispatch(const message& call, std::vector<value>& reply_body)
    {
        auto* method = spec_.find_method(call.member);
        const method_entry* entry = nullptr;
        for (auto& candidate : methods_)
        {
            if (candidate.wire_name == call.member)
            {
                entry = &candidate;
                break;
            }
        }
        if (!method || !entry)
            CO_RETURN error::UNKNOWN_METHOD();

        auto expected = method->input_signature().to_string();
        if (call.signature() != expected)
        {
            BUSGEN_DEBUG("{}.{} called with '{}', expected '{}'", spec_.name, call.member, call.signature(), expected);
            CO_RETURN error::INVALID_ARGS();
        }

        std::vector<value> body;
        auto ret = CO_AWAIT entry->handler(call, body);
        if (ret != error::OK())
            CO_RETURN ret;

        auto produced = body_signature(body);
        auto declared = method->output_signature().to_string();
        if (produced != declared)
        {
            BUSGEN_ERROR("{}.{} produced '{}', declared '{}'", spec_.name, call.member, produced, declared);
            CO_RETURN error::TYPE_MISMATCH();
        }
        reply_body = std::move(body);
        CO_RETURN error::OK();
    }

    CORO_TASK(int) interface_dispatcher::get_property(const std::string& wire_name, value& result)
    {
        auto* property = spec_.find_property(wire_name);
        auto* entry = find_property_entry(wire_name);
        if (!property || !entry)
            CO_RETURN error::UNKNOWN_PROPERTY();
        if (!property->readable() || !entry->getter)
            CO_RETURN error::CALL_FAILED();
        value current;
        auto ret = CO_AWAIT entry->getter(current);
        if (ret != error::OK())
            CO_RETURN ret;
        if (current.signature() != property->type.to_string())
        {
            BUSGEN_ERROR("property {}.{} produced '{}', declared '{}'", spec_.name, wire_name, current.signature(), property->type.to_string());
            CO_RETURN error::TYPE_MISMATCH();
        }
        result = std::move(current);
        CO_RETURN error::OK();
    }

    CORO_TASK(int) interface_dispatcher::get_all_properties(std::map<std::string, value>& result)
    {
        std::map<std::string, value> values;
        for (auto& property : spec_.properties)
        {
            if (!property.readable() || !find_property_entry(property.wire_name))
                continue;
            value current;
            auto ret = CO_AWAIT get_property(property.wire_name, current);
            if (ret != error::OK())
                CO_RETURN ret;
            values.emplace(property.wire_name, std::move(current));
        }
        result = std::move(values);
        CO_RETURN error::OK();
    }

    CORO_TASK(int) interface_dispatcher::set_property(const std::string& wire_name, const value& new_value)
    {
        auto* property = spec_.find_property(wire_name);
        auto* entry = find_property_entry(wire_name);
        if (!property || !entry)
            CO_RETURN error::UNKNOWN_PROPERTY();
        if (!property->has_setter() || !entry->setter)
            CO_RETURN error::PROPERTY_READ_ONLY();
        if (new_value.signature() != property->type.to_string())
        {
            BUSGEN_DEBUG("property {}.{} set to '{}', declared '{}'", spec_.name, wire_name, new_value.signature(), property->type.to_string());
            CO_RETURN error::INVALID_ARGS();
        }

        auto ret = CO_AWAIT entry->setter(new_value);
        if (ret != error::OK())
            CO_RETURN ret;

        switch (property->notify)
        {
        case change_notify::yes:
        {
            std::map<std::string, value> changed;
            changed.emplace(wire_name, new_value);
            CO_RETURN CO_AWAIT send_properties_changed(std::move(changed), {});
        }
        case change_notify::invalidates:
            CO_RETURN CO_AWAIT send_properties_changed({}, {wire_name});
        case change_notify::constant:
        case change_notify::no:
            break;
        }
        CO_RETURN error::OK();
    }

    CORO_TASK(int) interface_dispatcher::notify_property_changed(const std::string& wire_name)
    {
        auto* property = spec_.find_property(wire_name);
        if (!property)
            CO_RETURN error::UNKNOWN_PROPERTY();
        switch (property->notify)
        {
        case change_notify::yes:
        {
            value current;
            auto ret = CO_AWAIT get_property(wire_name, current);
            if (ret != error::OK())
                CO_RETURN ret;
            std::map<std::string, value> changed;
            changed.emplace(wire_name, std::move(current));
            CO_RETURN CO_AWAIT send_properties_changed(std::move(changed), {});
        }
        case change_notify::invalidates:
            CO_RETURN CO_AWAIT send_properties_changed({}, {wire_name});
        case change_notify::constant:
        case change_notify::no:
            break;
        }
        CO_RETURN error::OK();
    }

    CORO_TASK(int)
    interface_dispatcher::send_properties_changed(std::map<std::string, value> changed, std::vector<std::string> invalidated)
    {
        if (!transport_)
            CO_RETURN error::TRANSPORT_ERROR();
        auto msg = message::signal(path_, properties_interface, "PropertiesChanged", marshal_values(spec_.name, changed, invalidated));
        CO_RETURN CO_AWAIT transport_->send(std::move(msg));
    }

    CORO_TASK(int) interface_dispatcher::emit_signal(const std::string& wire_name, std::vector<value> body)
    {
        auto* signal = spec_.find_signal(wire_name);
        if (!signal)
        {
            BUSGEN_ERROR("{} has no signal {}", spec_.name, wire_name);
            CO_RETURN error::UNKNOWN_METHOD();
        }
        auto declared = signal->signature().to_string();
        if (body_signature(body) != declared)
        {
            BUSGEN_ERROR("signal {}.{} emitted as '{}', declared '{}'", spec_.name, wire_name, body_signature(body), declared);
            CO_RETURN error::INVALID_ARGS();
        }
        if (!transport_)
            CO_RETURN error::TRANSPORT_ERROR();
        CO_RETURN CO_AWAIT transport_->send(message::signal(path_, spec_.name, wire_name, std::move(body)));
    }

    std::string interface_dispatcher::introspect() const
    {
        return interface_xml(spec_);
    }
}
