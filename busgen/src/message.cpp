/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/message.h>

namespace busgen
{
    const char* to_string(message_type type)
    {
        switch (type)
        {
        case message_type::method_call:
            return "method_call";
        case message_type::method_return:
            return "method_return";
        case message_type::error:
            return "error";
        case message_type::signal:
            return "signal";
        }
        return "method_call";
    }

    std::string message::error_text() const
    {
        if (type != message_type::error || body.empty())
            return {};
        if (auto* text = body.front().get_if<std::string>(); text && body.front().code() == 's')
            return *text;
        return {};
    }

    message message::method_call(const std::string& destination,
        const std::string& path,
        const std::string& interface_name,
        const std::string& member,
        std::vector<value> body)
    {
        message msg;
        msg.type = message_type::method_call;
        msg.destination = destination;
        msg.path = path;
        msg.interface_name = interface_name;
        msg.member = member;
        msg.body = std::move(body);
        return msg;
    }

    message message::signal(
        const std::string& path, const std::string& interface_name, const std::string& member, std::vector<value> body)
    {
        message msg;
        msg.type = message_type::signal;
        msg.path = path;
        msg.interface_name = interface_name;
        msg.member = member;
        msg.body = std::move(body);
        return msg;
    }

    message message::method_return(const message& call, std::vector<value> body)
    {
        message msg;
        msg.type = message_type::method_return;
        msg.reply_serial = call.serial;
        msg.destination = call.sender;
        msg.body = std::move(body);
        return msg;
    }

    message message::error_reply(const message& call, const std::string& error_name, const std::string& text)
    {
        message msg;
        msg.type = message_type::error;
        msg.reply_serial = call.serial;
        msg.destination = call.sender;
        msg.error_name = error_name;
        if (!text.empty())
            msg.body.emplace_back(text);
        return msg;
    }

    int reply_status(const message& reply)
    {
        switch (reply.type)
        {
        case message_type::method_return:
            return error::OK();
        case message_type::error:
            return error::from_dbus_error_name(reply.error_name);
        default:
            return error::CALL_FAILED();
        }
    }

    bool match_rule::matches(const message& msg) const
    {
        if (type && *type != msg.type)
            return false;
        if (!sender.empty() && sender != msg.sender)
            return false;
        if (!path.empty() && path != msg.path)
            return false;
        if (!interface_name.empty() && interface_name != msg.interface_name)
            return false;
        if (!member.empty() && member != msg.member)
            return false;
        return true;
    }

    std::string match_rule::to_string() const
    {
        std::string rule;
        auto append = [&rule](const char* key, const std::string& val)
        {
            if (!rule.empty())
                rule += ',';
            rule += fmt::format("{}='{}'", key, val);
        };
        if (type)
            append("type", busgen::to_string(*type));
        if (!sender.empty())
            append("sender", sender);
        if (!path.empty())
            append("path", path);
        if (!interface_name.empty())
            append("interface", interface_name);
        if (!member.empty())
            append("member", member);
        return rule;
    }
}
