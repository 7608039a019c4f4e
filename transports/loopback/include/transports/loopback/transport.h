/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <busgen/busgen.h>

namespace busgen
{
    namespace loopback
    {
        class connection;

        // An in-process message bus. Connections get unique names, may own well-known names
        // and everything is routed synchronously on the sending thread.
        class bus : public std::enable_shared_from_this<bus>
        {
            mutable std::mutex mutex_;
            std::map<std::string, std::weak_ptr<connection>> connections_;
            std::map<std::string, std::string> owners_; // well-known name -> unique name
            uint64_t next_id_ = 1;

            bus() = default;

            std::shared_ptr<connection> resolve(const std::string& name) const;
            int reply_error(const message& call, const std::string& error_name, const std::string& text);

            // drops a closed connection and the names it owned
            void forget(const std::string& unique_name);

            friend class connection;

        public:
            static std::shared_ptr<bus> create();

            std::shared_ptr<connection> connect();

            // OBJECT_ALREADY_REGISTERED when another live connection owns the name
            int request_name(const std::string& name, const std::shared_ptr<connection>& owner);
            int release_name(const std::string& name);

            int route(const message& msg);
            std::size_t connection_count() const;
        };

        class connection : public transport
        {
            std::weak_ptr<bus> bus_;
            std::string unique_name_;
            std::atomic<uint32_t> next_serial_{1};
            stream_registry streams_;
            pending_calls pending_;
            mutable std::mutex handler_mutex_;
            call_handler handler_;

            connection(const std::shared_ptr<bus>& owner, std::string unique_name);

            friend class bus;

            void deliver(const message& msg);
            uint32_t stamp(message& msg);

        public:
            ~connection() override;

            std::string unique_name() const override { return unique_name_; }

            CORO_TASK(int) send(message msg) override;
            CORO_TASK(int) call(message msg, message& reply) override;

            int subscribe(const match_rule& rule, std::shared_ptr<message_stream>& stream) override;
            int unsubscribe(const std::shared_ptr<message_stream>& stream) override;

            int set_call_handler(call_handler handler) override;

            // everything is delivered while sending, there is never anything to read
            int process_events() override;

            std::size_t subscription_count() const { return streams_.size(); }
        };
    }
}
