/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <busgen/internal/value.h>

namespace busgen
{
    enum class message_type
    {
        method_call,
        method_return,
        error,
        signal
    };

    const char* to_string(message_type type);

    // A bus message with its body already decoded. Serials are assigned by the transport
    // that sends the message.
    struct message
    {
        message_type type = message_type::method_call;
        uint32_t serial = 0;
        uint32_t reply_serial = 0;
        std::string path;
        std::string interface_name;
        std::string member;
        std::string destination;
        std::string sender;
        std::string error_name;
        bool no_reply = false;
        std::vector<value> body;

        std::string signature() const { return body_signature(body); }

        // the human readable text of an error reply, empty when there is none
        std::string error_text() const;

        static message method_call(const std::string& destination,
            const std::string& path,
            const std::string& interface_name,
            const std::string& member,
            std::vector<value> body = {});
        static message signal(
            const std::string& path, const std::string& interface_name, const std::string& member, std::vector<value> body = {});
        static message method_return(const message& call, std::vector<value> body = {});
        static message error_reply(const message& call, const std::string& error_name, const std::string& text);
    };

    // error::OK() for a method return, otherwise the code an error reply maps onto
    int reply_status(const message& reply);

    // Selects inbound messages, empty fields match anything.
    struct match_rule
    {
        std::optional<message_type> type;
        std::string sender;
        std::string path;
        std::string interface_name;
        std::string member;

        bool matches(const message& msg) const;

        // bus daemon AddMatch syntax
        std::string to_string() const;
    };
}
