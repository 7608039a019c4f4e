/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/proxy.h>

namespace busgen
{
    proxy_base::proxy_base(std::shared_ptr<transport> t, std::string destination, std::string path, std::string interface_name)
        : transport_(std::move(t))
        , destination_(std::move(destination))
        , path_(std::move(path))
        , interface_name_(std::move(interface_name))
    {
    }

    CORO_TASK(int)
    proxy_base::call_raw(
        const std::string& interface_name, const std::string& member, std::vector<value> body, std::vector<value>& reply_body)
    {
        if (!transport_)
            CO_RETURN error::TRANSPORT_ERROR();
        auto msg = message::method_call(destination_, path_, interface_name, member, std::move(body));
        message reply;
        auto ret = CO_AWAIT transport_->call(std::move(msg), reply);
        if (ret != error::OK())
        {
            BUSGEN_WARNING("call to {}.{} on {} failed: {}", interface_name, member, path_, error::to_string(ret));
            CO_RETURN ret;
        }
        ret = reply_status(reply);
        if (ret != error::OK())
        {
            BUSGEN_DEBUG("{}.{} on {} replied {}: {}", interface_name, member, path_, reply.error_name, reply.error_text());
            CO_RETURN ret;
        }
        reply_body = std::move(reply.body);
        CO_RETURN error::OK();
    }

    CORO_TASK(int) proxy_base::send_raw(const std::string& member, std::vector<value> body)
    {
        if (!transport_)
            CO_RETURN error::TRANSPORT_ERROR();
        auto msg = message::method_call(destination_, path_, interface_name_, member, std::move(body));
        msg.no_reply = true;
        CO_RETURN CO_AWAIT transport_->send(std::move(msg));
    }

    CORO_TASK(int) proxy_base::get_property_value(const std::string& name, value& result)
    {
        std::vector<value> reply;
        auto ret = CO_AWAIT call_raw(properties_interface, "Get", marshal_values(interface_name_, name), reply);
        if (ret != error::OK())
            CO_RETURN ret;
        value inner;
        ret = unmarshal_values(reply, inner);
        if (ret != error::OK())
            CO_RETURN ret;
        result = std::move(inner);
        CO_RETURN error::OK();
    }

    CORO_TASK(int) proxy_base::set_property_value(const std::string& name, const value& new_value)
    {
        std::vector<value> reply;
        auto ret = CO_AWAIT call_raw(properties_interface, "Set", marshal_values(interface_name_, name, new_value), reply);
        if (ret != error::OK())
            CO_RETURN ret;
        CO_RETURN reply.empty() ? error::OK() : error::TYPE_MISMATCH();
    }

    CORO_TASK(int) proxy_base::get_all_properties(std::map<std::string, value>& result)
    {
        std::vector<value> reply;
        auto ret = CO_AWAIT call_raw(properties_interface, "GetAll", marshal_values(interface_name_), reply);
        if (ret != error::OK())
            CO_RETURN ret;
        CO_RETURN unmarshal_values(reply, result);
    }

    signal_subscription proxy_base::make_signal_subscription(const std::string& member) const
    {
        return signal_subscription(transport_, signal_matcher(interface_name_, member, path_));
    }
}
