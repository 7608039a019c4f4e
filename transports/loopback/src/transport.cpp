/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <transports/loopback/transport.h>

namespace busgen
{
    namespace loopback
    {
        namespace
        {
            const char* service_unknown_error = "org.freedesktop.DBus.Error.ServiceUnknown";
        }

        std::shared_ptr<bus> bus::create()
        {
            return std::shared_ptr<bus>(new bus());
        }

        std::shared_ptr<connection> bus::connect()
        {
            std::lock_guard lock(mutex_);
            auto name = fmt::format(":1.{}", next_id_++);
            auto conn = std::shared_ptr<connection>(new connection(shared_from_this(), name));
            connections_[name] = conn;
            BUSGEN_DEBUG("loopback connection {} opened", name);
            return conn;
        }

        int bus::request_name(const std::string& name, const std::shared_ptr<connection>& owner)
        {
            if (!owner || !is_valid_bus_name(name) || name[0] == ':')
                return error::INVALID_ARGS();
            std::lock_guard lock(mutex_);
            auto it = owners_.find(name);
            if (it != owners_.end() && it->second != owner->unique_name())
            {
                auto current = connections_.find(it->second);
                if (current != connections_.end() && !current->second.expired())
                    return error::OBJECT_ALREADY_REGISTERED();
            }
            owners_[name] = owner->unique_name();
            return error::OK();
        }

        int bus::release_name(const std::string& name)
        {
            std::lock_guard lock(mutex_);
            return owners_.erase(name) ? error::OK() : error::INVALID_ARGS();
        }

        std::size_t bus::connection_count() const
        {
            std::lock_guard lock(mutex_);
            return connections_.size();
        }

        void bus::forget(const std::string& unique_name)
        {
            std::lock_guard lock(mutex_);
            connections_.erase(unique_name);
            for (auto it = owners_.begin(); it != owners_.end();)
            {
                if (it->second == unique_name)
                    it = owners_.erase(it);
                else
                    ++it;
            }
            BUSGEN_DEBUG("loopback connection {} closed", unique_name);
        }

        std::shared_ptr<connection> bus::resolve(const std::string& name) const
        {
            std::lock_guard lock(mutex_);
            auto unique = name;
            if (!name.empty() && name[0] != ':')
            {
                auto owner = owners_.find(name);
                if (owner == owners_.end())
                    return nullptr;
                unique = owner->second;
            }
            auto it = connections_.find(unique);
            return it == connections_.end() ? nullptr : it->second.lock();
        }

        int bus::reply_error(const message& call, const std::string& error_name, const std::string& text)
        {
            if (call.no_reply)
                return error::OK();
            auto reply = message::error_reply(call, error_name, text);
            reply.sender = "org.freedesktop.DBus";
            auto caller = resolve(call.sender);
            if (!caller)
                return error::TRANSPORT_ERROR();
            caller->deliver(reply);
            return error::OK();
        }

        int bus::route(const message& msg)
        {
            switch (msg.type)
            {
            case message_type::signal:
            {
                std::vector<std::shared_ptr<connection>> receivers;
                {
                    std::lock_guard lock(mutex_);
                    for (auto& entry : connections_)
                    {
                        if (auto conn = entry.second.lock())
                            receivers.push_back(std::move(conn));
                    }
                }
                for (auto& receiver : receivers)
                    receiver->deliver(msg);
                return error::OK();
            }
            case message_type::method_call:
            {
                auto target = resolve(msg.destination);
                if (!target)
                    return reply_error(msg, service_unknown_error, fmt::format("the name {} was not provided by any connection", msg.destination));
                target->deliver(msg);
                return error::OK();
            }
            case message_type::method_return:
            case message_type::error:
            {
                auto target = resolve(msg.destination);
                if (!target)
                {
                    BUSGEN_DEBUG("reply {} for vanished connection {}", msg.reply_serial, msg.destination);
                    return error::OK();
                }
                target->deliver(msg);
                return error::OK();
            }
            }
            return error::TRANSPORT_ERROR();
        }

        connection::connection(const std::shared_ptr<bus>& owner, std::string unique_name)
            : bus_(owner)
            , unique_name_(std::move(unique_name))
        {
        }

        connection::~connection()
        {
            if (auto owner = bus_.lock())
                owner->forget(unique_name_);
        }

        uint32_t connection::stamp(message& msg)
        {
            msg.serial = next_serial_++;
            msg.sender = unique_name_;
            return msg.serial;
        }

        void connection::deliver(const message& msg)
        {
            switch (msg.type)
            {
            case message_type::method_return:
            case message_type::error:
                pending_.on_reply(msg);
                return;
            case message_type::method_call:
            {
                call_handler handler;
                {
                    std::lock_guard lock(handler_mutex_);
                    handler = handler_;
                }
                if (handler)
                {
                    handler(msg);
                    return;
                }
                auto owner = bus_.lock();
                if (!owner)
                    return;
                auto ret = owner->reply_error(msg,
                    error::to_dbus_error_name(error::UNKNOWN_OBJECT()),
                    fmt::format("{} does not export any objects", unique_name_));
                if (ret != error::OK())
                    BUSGEN_DEBUG("unable to reject call from {}: {}", msg.sender, error::to_string(ret));
                return;
            }
            case message_type::signal:
                streams_.deliver(msg);
                return;
            }
        }

        CORO_TASK(int) connection::send(message msg)
        {
            auto owner = bus_.lock();
            if (!owner)
                CO_RETURN error::TRANSPORT_ERROR();
            stamp(msg);
            CO_RETURN owner->route(msg);
        }

        CORO_TASK(int) connection::call(message msg, message& reply)
        {
            auto owner = bus_.lock();
            if (!owner)
                CO_RETURN error::TRANSPORT_ERROR();
            if (msg.type != message_type::method_call)
                CO_RETURN error::INVALID_ARGS();
            msg.no_reply = false;
            auto serial = stamp(msg);
            pending_.register_call(serial);
            auto ret = owner->route(msg);
            if (ret != error::OK())
            {
                pending_.abandon(serial);
                CO_RETURN ret;
            }
            if (!pending_.take(serial, reply))
            {
                pending_.abandon(serial);
                BUSGEN_WARNING("no reply to {}.{} (serial {})", msg.interface_name, msg.member, serial);
                CO_RETURN error::CALL_FAILED();
            }
            CO_RETURN error::OK();
        }

        int connection::subscribe(const match_rule& rule, std::shared_ptr<message_stream>& stream)
        {
            stream = std::make_shared<message_stream>(rule);
            streams_.add(stream);
            BUSGEN_DEBUG("{} subscribed to {}", unique_name_, rule.to_string());
            return error::OK();
        }

        int connection::unsubscribe(const std::shared_ptr<message_stream>& stream)
        {
            return streams_.remove(stream) ? error::OK() : error::NOT_SUBSCRIBED();
        }

        int connection::set_call_handler(call_handler handler)
        {
            std::lock_guard lock(handler_mutex_);
            handler_ = std::move(handler);
            return error::OK();
        }

        int connection::process_events()
        {
            return error::OK();
        }
    }
}
