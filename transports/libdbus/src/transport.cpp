/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <dbus/dbus.h>

#include <transports/libdbus/transport.h>

namespace busgen
{
    namespace libdbus
    {
        namespace
        {
            struct message_deleter
            {
                void operator()(DBusMessage* msg) const
                {
                    if (msg)
                        dbus_message_unref(msg);
                }
            };
            using message_ptr = std::unique_ptr<DBusMessage, message_deleter>;

            // owns a DBusError for the duration of one libdbus call
            struct scoped_error
            {
                DBusError err;
                scoped_error() { dbus_error_init(&err); }
                ~scoped_error() { dbus_error_free(&err); }
                scoped_error(const scoped_error&) = delete;
                scoped_error& operator=(const scoped_error&) = delete;

                bool is_set() const { return dbus_error_is_set(&err); }
                std::string name() const { return err.name ? err.name : DBUS_ERROR_FAILED; }
                std::string text() const { return err.message ? err.message : ""; }
            };

            std::string safe_string(const char* text)
            {
                return text ? text : "";
            }

            int append_value(DBusMessageIter* it, const value& v);

            template<typename T, typename Wire> int append_scalar(DBusMessageIter* it, int dbus_type, const value& v)
            {
                auto* p = v.get_if<T>();
                if (!p)
                    return error::TYPE_MISMATCH();
                Wire wire = static_cast<Wire>(*p);
                return dbus_message_iter_append_basic(it, dbus_type, &wire) ? error::OK() : error::TRANSPORT_ERROR();
            }

            int append_string(DBusMessageIter* it, int dbus_type, const value& v)
            {
                auto* p = v.get_if<std::string>();
                if (!p)
                    return error::TYPE_MISMATCH();
                const char* text = p->c_str();
                return dbus_message_iter_append_basic(it, dbus_type, &text) ? error::OK() : error::TRANSPORT_ERROR();
            }

            int append_container(DBusMessageIter* it, int dbus_type, const char* contained_signature, const value& v)
            {
                DBusMessageIter sub;
                if (!dbus_message_iter_open_container(it, dbus_type, contained_signature, &sub))
                    return error::TRANSPORT_ERROR();
                for (auto& child : v.children())
                {
                    auto ret = append_value(&sub, child);
                    if (ret != error::OK())
                    {
                        dbus_message_iter_abandon_container(it, &sub);
                        return ret;
                    }
                }
                return dbus_message_iter_close_container(it, &sub) ? error::OK() : error::TRANSPORT_ERROR();
            }

            int append_value(DBusMessageIter* it, const value& v)
            {
                switch (v.code())
                {
                case 'y':
                    return append_scalar<uint8_t, uint8_t>(it, DBUS_TYPE_BYTE, v);
                case 'b':
                    return append_scalar<bool, dbus_bool_t>(it, DBUS_TYPE_BOOLEAN, v);
                case 'n':
                    return append_scalar<int16_t, dbus_int16_t>(it, DBUS_TYPE_INT16, v);
                case 'q':
                    return append_scalar<uint16_t, dbus_uint16_t>(it, DBUS_TYPE_UINT16, v);
                case 'i':
                    return append_scalar<int32_t, dbus_int32_t>(it, DBUS_TYPE_INT32, v);
                case 'u':
                    return append_scalar<uint32_t, dbus_uint32_t>(it, DBUS_TYPE_UINT32, v);
                case 'x':
                    return append_scalar<int64_t, dbus_int64_t>(it, DBUS_TYPE_INT64, v);
                case 't':
                    return append_scalar<uint64_t, dbus_uint64_t>(it, DBUS_TYPE_UINT64, v);
                case 'd':
                    return append_scalar<double, double>(it, DBUS_TYPE_DOUBLE, v);
                case 's':
                    return append_string(it, DBUS_TYPE_STRING, v);
                case 'o':
                    return append_string(it, DBUS_TYPE_OBJECT_PATH, v);
                case 'g':
                    return append_string(it, DBUS_TYPE_SIGNATURE, v);
                case 'a':
                {
                    auto element = v.element_signature();
                    return append_container(it, DBUS_TYPE_ARRAY, element.c_str(), v);
                }
                case '(':
                    return append_container(it, DBUS_TYPE_STRUCT, nullptr, v);
                case '{':
                    return append_container(it, DBUS_TYPE_DICT_ENTRY, nullptr, v);
                case 'v':
                {
                    if (v.children().size() != 1)
                        return error::TYPE_MISMATCH();
                    auto inner = v.children()[0].signature();
                    return append_container(it, DBUS_TYPE_VARIANT, inner.c_str(), v);
                }
                case 'h':
                    BUSGEN_ERROR("unix file descriptors cannot be sent over this transport");
                    return error::TRANSPORT_ERROR();
                default:
                    return error::TYPE_MISMATCH();
                }
            }

            int read_value(DBusMessageIter* it, value& out);

            int read_children(DBusMessageIter* it, std::vector<value>& children)
            {
                DBusMessageIter sub;
                dbus_message_iter_recurse(it, &sub);
                while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID)
                {
                    value child;
                    auto ret = read_value(&sub, child);
                    if (ret != error::OK())
                        return ret;
                    children.push_back(std::move(child));
                    dbus_message_iter_next(&sub);
                }
                return error::OK();
            }

            template<typename Wire, typename T> value read_scalar(DBusMessageIter* it)
            {
                Wire wire{};
                dbus_message_iter_get_basic(it, &wire);
                return value(static_cast<T>(wire));
            }

            std::string read_text(DBusMessageIter* it)
            {
                const char* text = nullptr;
                dbus_message_iter_get_basic(it, &text);
                return safe_string(text);
            }

            int read_value(DBusMessageIter* it, value& out)
            {
                switch (dbus_message_iter_get_arg_type(it))
                {
                case DBUS_TYPE_BYTE:
                    out = read_scalar<uint8_t, uint8_t>(it);
                    return error::OK();
                case DBUS_TYPE_BOOLEAN:
                {
                    dbus_bool_t wire = FALSE;
                    dbus_message_iter_get_basic(it, &wire);
                    out = value(wire != FALSE);
                    return error::OK();
                }
                case DBUS_TYPE_INT16:
                    out = read_scalar<dbus_int16_t, int16_t>(it);
                    return error::OK();
                case DBUS_TYPE_UINT16:
                    out = read_scalar<dbus_uint16_t, uint16_t>(it);
                    return error::OK();
                case DBUS_TYPE_INT32:
                    out = read_scalar<dbus_int32_t, int32_t>(it);
                    return error::OK();
                case DBUS_TYPE_UINT32:
                    out = read_scalar<dbus_uint32_t, uint32_t>(it);
                    return error::OK();
                case DBUS_TYPE_INT64:
                    out = read_scalar<dbus_int64_t, int64_t>(it);
                    return error::OK();
                case DBUS_TYPE_UINT64:
                    out = read_scalar<dbus_uint64_t, uint64_t>(it);
                    return error::OK();
                case DBUS_TYPE_DOUBLE:
                    out = read_scalar<double, double>(it);
                    return error::OK();
                case DBUS_TYPE_STRING:
                    out = value(read_text(it));
                    return error::OK();
                case DBUS_TYPE_OBJECT_PATH:
                    out = value(object_path{read_text(it)});
                    return error::OK();
                case DBUS_TYPE_SIGNATURE:
                    out = value(signature_text{read_text(it)});
                    return error::OK();
                case DBUS_TYPE_ARRAY:
                {
                    char* signature = dbus_message_iter_get_signature(it);
                    if (!signature)
                        return error::TRANSPORT_ERROR();
                    std::string element = signature + 1;
                    dbus_free(signature);
                    std::vector<value> elements;
                    auto ret = read_children(it, elements);
                    if (ret != error::OK())
                        return ret;
                    out = value::make_array(element, std::move(elements));
                    return error::OK();
                }
                case DBUS_TYPE_STRUCT:
                {
                    std::vector<value> fields;
                    auto ret = read_children(it, fields);
                    if (ret != error::OK())
                        return ret;
                    out = value::make_struct(std::move(fields));
                    return error::OK();
                }
                case DBUS_TYPE_DICT_ENTRY:
                {
                    std::vector<value> pair;
                    auto ret = read_children(it, pair);
                    if (ret != error::OK())
                        return ret;
                    if (pair.size() != 2)
                        return error::TYPE_MISMATCH();
                    out = value::make_dict_entry(std::move(pair[0]), std::move(pair[1]));
                    return error::OK();
                }
                case DBUS_TYPE_VARIANT:
                {
                    std::vector<value> inner;
                    auto ret = read_children(it, inner);
                    if (ret != error::OK())
                        return ret;
                    if (inner.size() != 1)
                        return error::TYPE_MISMATCH();
                    out = value::make_variant(std::move(inner[0]));
                    return error::OK();
                }
                case DBUS_TYPE_UNIX_FD:
                    BUSGEN_ERROR("unix file descriptors cannot be received over this transport");
                    return error::TRANSPORT_ERROR();
                default:
                    return error::TYPE_MISMATCH();
                }
            }

            message_type to_message_type(int dbus_type)
            {
                switch (dbus_type)
                {
                case DBUS_MESSAGE_TYPE_METHOD_RETURN:
                    return message_type::method_return;
                case DBUS_MESSAGE_TYPE_ERROR:
                    return message_type::error;
                case DBUS_MESSAGE_TYPE_SIGNAL:
                    return message_type::signal;
                default:
                    return message_type::method_call;
                }
            }

            std::once_flag threads_once;
        }

        int to_dbus_message(const message& msg, DBusMessage*& out)
        {
            DBusMessage* raw = nullptr;
            switch (msg.type)
            {
            case message_type::method_call:
                raw = dbus_message_new_method_call(msg.destination.empty() ? nullptr : msg.destination.c_str(),
                    msg.path.c_str(),
                    msg.interface_name.empty() ? nullptr : msg.interface_name.c_str(),
                    msg.member.c_str());
                break;
            case message_type::signal:
                raw = dbus_message_new_signal(msg.path.c_str(), msg.interface_name.c_str(), msg.member.c_str());
                break;
            case message_type::method_return:
                raw = dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN);
                break;
            case message_type::error:
                raw = dbus_message_new(DBUS_MESSAGE_TYPE_ERROR);
                break;
            }
            if (!raw)
                return error::TRANSPORT_ERROR();
            message_ptr dmsg(raw);

            if (msg.type == message_type::method_return || msg.type == message_type::error)
            {
                if (!dbus_message_set_reply_serial(raw, msg.reply_serial))
                    return error::TRANSPORT_ERROR();
                if (!msg.destination.empty() && !dbus_message_set_destination(raw, msg.destination.c_str()))
                    return error::TRANSPORT_ERROR();
            }
            if (msg.type == message_type::error && !dbus_message_set_error_name(raw, msg.error_name.c_str()))
                return error::TRANSPORT_ERROR();
            if (msg.type == message_type::method_call)
                dbus_message_set_no_reply(raw, msg.no_reply ? TRUE : FALSE);

            DBusMessageIter it;
            dbus_message_iter_init_append(raw, &it);
            for (auto& arg : msg.body)
            {
                auto ret = append_value(&it, arg);
                if (ret != error::OK())
                    return ret;
            }
            out = dmsg.release();
            return error::OK();
        }

        int from_dbus_message(DBusMessage* msg, message& out)
        {
            message result;
            result.type = to_message_type(dbus_message_get_type(msg));
            result.serial = dbus_message_get_serial(msg);
            result.reply_serial = dbus_message_get_reply_serial(msg);
            result.path = safe_string(dbus_message_get_path(msg));
            result.interface_name = safe_string(dbus_message_get_interface(msg));
            result.member = safe_string(dbus_message_get_member(msg));
            result.destination = safe_string(dbus_message_get_destination(msg));
            result.sender = safe_string(dbus_message_get_sender(msg));
            result.error_name = safe_string(dbus_message_get_error_name(msg));
            result.no_reply = dbus_message_get_no_reply(msg);

            DBusMessageIter it;
            if (dbus_message_iter_init(msg, &it))
            {
                while (dbus_message_iter_get_arg_type(&it) != DBUS_TYPE_INVALID)
                {
                    value arg;
                    auto ret = read_value(&it, arg);
                    if (ret != error::OK())
                        return ret;
                    result.body.push_back(std::move(arg));
                    dbus_message_iter_next(&it);
                }
            }
            out = std::move(result);
            return error::OK();
        }

        connection::connection(DBusConnection* conn, bool is_private)
            : conn_(conn)
            , private_(is_private)
        {
            dbus_connection_set_exit_on_disconnect(conn_, FALSE);
        }

        connection::~connection()
        {
            if (!conn_)
                return;
            // shared connections belong to libdbus and are never closed here
            if (private_)
                dbus_connection_close(conn_);
            dbus_connection_unref(conn_);
        }

        int connection::connect(bus_type type, std::shared_ptr<connection>& out)
        {
            std::call_once(threads_once, [] { dbus_threads_init_default(); });
            scoped_error err;
            auto* conn = dbus_bus_get(type == bus_type::system ? DBUS_BUS_SYSTEM : DBUS_BUS_SESSION, &err.err);
            if (!conn)
            {
                BUSGEN_ERROR("cannot connect to the {} bus: {}", type == bus_type::system ? "system" : "session", err.text());
                return error::TRANSPORT_ERROR();
            }
            out = std::shared_ptr<connection>(new connection(conn, false));
            return error::OK();
        }

        int connection::connect_address(const std::string& address, std::shared_ptr<connection>& out)
        {
            std::call_once(threads_once, [] { dbus_threads_init_default(); });
            scoped_error err;
            auto* conn = dbus_connection_open_private(address.c_str(), &err.err);
            if (!conn)
            {
                BUSGEN_ERROR("cannot open {}: {}", address, err.text());
                return error::TRANSPORT_ERROR();
            }
            std::shared_ptr<connection> result(new connection(conn, true));
            if (!dbus_bus_register(conn, &err.err))
            {
                BUSGEN_ERROR("cannot register with the bus at {}: {}", address, err.text());
                return error::TRANSPORT_ERROR();
            }
            out = std::move(result);
            return error::OK();
        }

        std::string connection::unique_name() const
        {
            return safe_string(dbus_bus_get_unique_name(conn_));
        }

        CORO_TASK(int) connection::send(message msg)
        {
            DBusMessage* raw = nullptr;
            auto ret = to_dbus_message(msg, raw);
            if (ret != error::OK())
                CO_RETURN ret;
            message_ptr dmsg(raw);
            dbus_uint32_t serial = 0;
            if (!dbus_connection_send(conn_, raw, &serial))
                CO_RETURN error::TRANSPORT_ERROR();
            dbus_connection_flush(conn_);
            BUSGEN_DEBUG("sent {} {}.{} serial {}", to_string(msg.type), msg.interface_name, msg.member, serial);
            CO_RETURN error::OK();
        }

        CORO_TASK(int) connection::call(message msg, message& reply)
        {
            DBusMessage* raw = nullptr;
            auto ret = to_dbus_message(msg, raw);
            if (ret != error::OK())
                CO_RETURN ret;
            message_ptr dmsg(raw);

            scoped_error err;
            message_ptr dreply(dbus_connection_send_with_reply_and_block(conn_, raw, timeout_ms_, &err.err));
            if (!dreply)
            {
                auto name = err.name();
                if (name == DBUS_ERROR_DISCONNECTED || name == DBUS_ERROR_NO_MEMORY)
                {
                    BUSGEN_ERROR("{}.{} failed: {}", msg.interface_name, msg.member, err.text());
                    CO_RETURN error::TRANSPORT_ERROR();
                }
                // error replies and timeouts are reported to the caller as an error message
                reply = message::error_reply(msg, name, err.text());
                CO_RETURN error::OK();
            }
            CO_RETURN from_dbus_message(dreply.get(), reply);
        }

        int connection::subscribe(const match_rule& rule, std::shared_ptr<message_stream>& stream)
        {
            scoped_error err;
            auto text = rule.to_string();
            dbus_bus_add_match(conn_, text.c_str(), &err.err);
            if (err.is_set())
            {
                BUSGEN_ERROR("AddMatch {} failed: {}", text, err.text());
                return error::TRANSPORT_ERROR();
            }
            stream = std::make_shared<message_stream>(rule);
            streams_.add(stream);
            return error::OK();
        }

        int connection::unsubscribe(const std::shared_ptr<message_stream>& stream)
        {
            if (!stream || !streams_.remove(stream))
                return error::NOT_SUBSCRIBED();
            stream->cancel();
            auto text = stream->rule().to_string();
            // no error object, the daemon's reply is not waited for
            dbus_bus_remove_match(conn_, text.c_str(), nullptr);
            return error::OK();
        }

        int connection::set_call_handler(call_handler handler)
        {
            std::lock_guard lock(handler_mutex_);
            handler_ = std::move(handler);
            return error::OK();
        }

        int connection::process_events()
        {
            if (!dbus_connection_read_write(conn_, 0))
                return error::TRANSPORT_ERROR();
            while (true)
            {
                message_ptr raw(dbus_connection_pop_message(conn_));
                if (!raw)
                    break;
                message msg;
                auto ret = from_dbus_message(raw.get(), msg);
                if (ret != error::OK())
                {
                    BUSGEN_WARNING("dropping undecodable message: {}", error::to_string(ret));
                    continue;
                }
                if (msg.type == message_type::signal)
                {
                    streams_.deliver(msg);
                }
                else if (msg.type == message_type::method_call)
                {
                    call_handler handler;
                    {
                        std::lock_guard lock(handler_mutex_);
                        handler = handler_;
                    }
                    if (handler)
                        handler(msg);
                    else if (!msg.no_reply)
                    {
                        auto reply = message::error_reply(msg, "org.freedesktop.DBus.Error.UnknownObject", "no object is served here");
                        ret = SYNC_WAIT(send(std::move(reply)));
                        if (ret != error::OK())
                            BUSGEN_WARNING("could not reject {}.{}: {}", msg.interface_name, msg.member, error::to_string(ret));
                    }
                }
            }
            return error::OK();
        }
    }
}
