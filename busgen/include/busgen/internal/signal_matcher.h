/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <string>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/marshal.h>
#include <busgen/internal/message.h>
#include <busgen/internal/transport.h>

namespace busgen
{
    enum class signal_state
    {
        not_matched,
        matched_pending,
        decoded,
        decode_failed
    };

    const char* to_string(signal_state state);

    // Structural identity of a declared signal. Matching compares header fields only and
    // never looks at the body.
    class signal_matcher
    {
        std::string interface_name_;
        std::string member_;
        std::string path_; // empty matches any object

    public:
        signal_matcher() = default;
        signal_matcher(std::string interface_name, std::string member, std::string path = {});

        const std::string& interface_name() const { return interface_name_; }
        const std::string& member() const { return member_; }
        const std::string& path() const { return path_; }

        // not_matched or matched_pending
        signal_state match(const message& msg) const;

        match_rule to_match_rule() const;
    };

    // a signal that matched structurally, its arguments are decoded on request
    class received_signal
    {
        message message_;
        signal_state state_ = signal_state::matched_pending;

    public:
        received_signal() = default;
        explicit received_signal(message msg)
            : message_(std::move(msg))
        {
        }

        const message& get_message() const { return message_; }
        signal_state state() const { return state_; }

        // Decodes the body against the native argument types. A body of any other shape
        // leaves the outputs untouched and reports DECODE_FAILED.
        template<typename... Ts> int args(Ts&... out)
        {
            auto ret = unmarshal_values(message_.body, out...);
            if (ret != error::OK())
            {
                BUSGEN_DEBUG("signal {}.{} carries '{}', expected '{}'",
                    message_.interface_name,
                    message_.member,
                    message_.signature(),
                    signature_of<Ts...>());
                state_ = signal_state::decode_failed;
                return error::DECODE_FAILED();
            }
            state_ = signal_state::decoded;
            return error::OK();
        }
    };

    enum class subscription_state
    {
        unsubscribed,
        subscribed
    };

    // Subscribe, poll and cancel over one signal. A cancelled subscription can be
    // subscribed again.
    class signal_subscription
    {
        std::shared_ptr<transport> transport_;
        signal_matcher matcher_;
        std::shared_ptr<message_stream> stream_;

    public:
        signal_subscription() = default;
        signal_subscription(std::shared_ptr<transport> t, signal_matcher matcher);
        signal_subscription(const signal_subscription&) = delete;
        signal_subscription& operator=(const signal_subscription&) = delete;
        signal_subscription(signal_subscription&& other) noexcept;
        signal_subscription& operator=(signal_subscription&& other) noexcept;
        ~signal_subscription();

        int subscribe();

        // Returns the next structurally matching signal. Messages that do not match are
        // discarded and false is returned when nothing matching is buffered.
        bool poll(received_signal& out);

        // drops the transport subscription and any buffered messages
        void cancel();

        subscription_state state() const { return stream_ ? subscription_state::subscribed : subscription_state::unsubscribed; }
        const signal_matcher& matcher() const { return matcher_; }
    };
}
