/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <busgen/internal/coroutine_support.h>
#include <busgen/internal/error_codes.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/marshal.h>
#include <busgen/internal/message.h>
#include <busgen/internal/signal_matcher.h>
#include <busgen/internal/transport.h>

namespace busgen
{
    constexpr const char* properties_interface = "org.freedesktop.DBus.Properties";

    // Base of every generated client proxy. It addresses one interface of one object and
    // turns calls into method call messages on the shared transport.
    class proxy_base
    {
    protected:
        std::shared_ptr<transport> transport_;
        std::string destination_;
        std::string path_;
        std::string interface_name_;

    public:
        proxy_base(std::shared_ptr<transport> t, std::string destination, std::string path, std::string interface_name);
        virtual ~proxy_base() = default;

        const std::shared_ptr<transport>& get_transport() const { return transport_; }
        const std::string& destination() const { return destination_; }
        const std::string& path() const { return path_; }
        const std::string& interface_name() const { return interface_name_; }

        // Sends member of interface_name with the given body and returns the reply body.
        // Error replies come back as their mapped error code.
        CORO_TASK(int) call_raw(const std::string& interface_name,
            const std::string& member,
            std::vector<value> body,
            std::vector<value>& reply_body);

        // no reply is requested or awaited
        CORO_TASK(int) send_raw(const std::string& member, std::vector<value> body);

        // a method without outputs, the reply must be empty
        template<typename... Ins> CORO_TASK(int) call_method(const std::string& member, const Ins&... ins)
        {
            std::vector<value> reply;
            auto ret = CO_AWAIT call_raw(interface_name_, member, marshal_values(ins...), reply);
            if (ret != error::OK())
                CO_RETURN ret;
            if (!reply.empty())
            {
                BUSGEN_WARNING("{}.{} replied with '{}', expected an empty body", interface_name_, member, body_signature(reply));
                CO_RETURN error::TYPE_MISMATCH();
            }
            CO_RETURN error::OK();
        }

        // a method with exactly one output
        template<typename R, typename... Ins>
        CORO_TASK(int) call_method_returning(const std::string& member, R& result, const Ins&... ins)
        {
            std::vector<value> reply;
            auto ret = CO_AWAIT call_raw(interface_name_, member, marshal_values(ins...), reply);
            if (ret != error::OK())
                CO_RETURN ret;
            ret = unmarshal_values(reply, result);
            if (ret != error::OK())
                BUSGEN_WARNING("{}.{} replied with '{}', expected '{}'",
                    interface_name_,
                    member,
                    body_signature(reply),
                    signature_of<R>());
            CO_RETURN ret;
        }

        // several outputs, unpacked positionally into one tuple
        template<typename... Rs, typename... Ins>
        CORO_TASK(int) call_method_returning_tuple(const std::string& member, std::tuple<Rs...>& result, const Ins&... ins)
        {
            std::vector<value> reply;
            auto ret = CO_AWAIT call_raw(interface_name_, member, marshal_values(ins...), reply);
            if (ret != error::OK())
                CO_RETURN ret;
            ret = std::apply([&reply](Rs&... outs) { return unmarshal_values(reply, outs...); }, result);
            if (ret != error::OK())
                BUSGEN_WARNING("{}.{} replied with '{}', expected '{}'",
                    interface_name_,
                    member,
                    body_signature(reply),
                    signature_of<Rs...>());
            CO_RETURN ret;
        }

        template<typename... Ins> CORO_TASK(int) call_method_no_reply(const std::string& member, const Ins&... ins)
        {
            CO_RETURN CO_AWAIT send_raw(member, marshal_values(ins...));
        }

        // Properties.Get, the variant is unwrapped and checked against T
        template<typename T> CORO_TASK(int) get_property(const std::string& name, T& result)
        {
            value variant_value;
            auto ret = CO_AWAIT get_property_value(name, variant_value);
            if (ret != error::OK())
                CO_RETURN ret;
            ret = wire_type<T>::from_value(variant_value, result);
            if (ret != error::OK())
                BUSGEN_WARNING("property {}.{} is '{}', expected '{}'",
                    interface_name_,
                    name,
                    variant_value.signature(),
                    wire_type<T>::signature());
            CO_RETURN ret;
        }

        template<typename T> CORO_TASK(int) set_property(const std::string& name, const T& new_value)
        {
            CO_RETURN CO_AWAIT set_property_value(name, wire_type<T>::to_value(new_value));
        }

        CORO_TASK(int) get_property_value(const std::string& name, value& result);
        CORO_TASK(int) set_property_value(const std::string& name, const value& new_value);
        CORO_TASK(int) get_all_properties(std::map<std::string, value>& result);

        // an unsubscribed subscription to one signal of this interface on this object
        signal_subscription make_signal_subscription(const std::string& member) const;
    };
}
