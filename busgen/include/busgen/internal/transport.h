/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <busgen/internal/coroutine_support.h>
#include <busgen/internal/message.h>

namespace busgen
{
    // Buffered inbound messages selected by one match rule. Transports push from whatever
    // thread reads the connection, consumers drain with try_next.
    class message_stream
    {
        match_rule rule_;
        mutable std::mutex mutex_;
        std::deque<message> queue_;
        bool cancelled_ = false;

    public:
        explicit message_stream(match_rule rule)
            : rule_(std::move(rule))
        {
        }

        const match_rule& rule() const { return rule_; }

        // returns false once the stream is cancelled or when the rule does not match
        bool push(const message& msg);
        bool try_next(message& out);
        std::size_t size() const;

        // drops every buffered message, later pushes are ignored
        void cancel();
        bool is_cancelled() const;
    };

    // the streams of one connection, used by transports to fan out inbound messages
    class stream_registry
    {
        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<message_stream>> streams_;

    public:
        void add(const std::shared_ptr<message_stream>& stream);
        bool remove(const std::shared_ptr<message_stream>& stream);

        // returns the number of streams that accepted the message
        std::size_t deliver(const message& msg) const;
        std::size_t size() const;
    };

    // Correlates replies with outstanding calls by serial, replies may arrive in any order.
    class pending_calls
    {
        mutable std::mutex mutex_;
        std::map<uint32_t, std::optional<message>> calls_;

    public:
        void register_call(uint32_t serial);

        // stores a reply for its call, false when nobody is waiting for that serial
        bool on_reply(const message& reply);

        // hands over the reply once it has arrived and forgets the call
        bool take(uint32_t serial, message& out);
        bool is_pending(uint32_t serial) const;
        void abandon(uint32_t serial);
        std::size_t size() const;
    };

    using call_handler = std::function<void(const message& call)>;

    // The connection capability handed to proxies, dispatchers and object servers. It is
    // shared, never owned exclusively and never recreated by its users.
    class transport
    {
    public:
        virtual ~transport() = default;

        // the unique bus name of this connection (":1.42")
        virtual std::string unique_name() const = 0;

        // assigns a serial and sends, no reply is awaited
        virtual CORO_TASK(int) send(message msg) = 0;

        // sends a method call and waits for the reply carrying its serial
        virtual CORO_TASK(int) call(message msg, message& reply) = 0;

        virtual int subscribe(const match_rule& rule, std::shared_ptr<message_stream>& stream) = 0;
        virtual int unsubscribe(const std::shared_ptr<message_stream>& stream) = 0;

        // method calls addressed to this connection are passed to the handler
        virtual int set_call_handler(call_handler handler) = 0;

        // reads and routes whatever is waiting on the connection without blocking
        virtual int process_events() = 0;
    };
}
