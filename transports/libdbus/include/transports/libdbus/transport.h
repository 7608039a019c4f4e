/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <busgen/busgen.h>

struct DBusConnection;
struct DBusMessage;

namespace busgen
{
    namespace libdbus
    {
        enum class bus_type
        {
            session,
            system
        };

        // converts between decoded messages and libdbus messages, unix fds are not carried
        int to_dbus_message(const message& msg, DBusMessage*& out);
        int from_dbus_message(DBusMessage* msg, message& out);

        // A connection to a real message bus through libdbus. Calls block the calling
        // thread until the reply arrives or the timeout expires.
        class connection : public transport
        {
            DBusConnection* conn_ = nullptr;
            bool private_ = false;
            int timeout_ms_ = -1; // libdbus default
            stream_registry streams_;
            mutable std::mutex handler_mutex_;
            call_handler handler_;

            connection(DBusConnection* conn, bool is_private);

        public:
            // the shared session or system bus connection
            static int connect(bus_type type, std::shared_ptr<connection>& out);

            // a private connection to the bus at address, registered with the daemon
            static int connect_address(const std::string& address, std::shared_ptr<connection>& out);

            connection(const connection&) = delete;
            connection& operator=(const connection&) = delete;
            ~connection() override;

            std::string unique_name() const override;

            CORO_TASK(int) send(message msg) override;
            CORO_TASK(int) call(message msg, message& reply) override;

            int subscribe(const match_rule& rule, std::shared_ptr<message_stream>& stream) override;
            int unsubscribe(const std::shared_ptr<message_stream>& stream) override;

            int set_call_handler(call_handler handler) override;
            int process_events() override;

            // milliseconds, -1 selects the libdbus default
            void set_timeout(int timeout_ms) { timeout_ms_ = timeout_ms; }
        };
    }
}
