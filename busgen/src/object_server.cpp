/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <fstream>
#include <set>

#include <fmt/format.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/introspection.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/naming.h>
#include <busgen/internal/object_server.h>
#include <busgen/internal/standard_interfaces.h>

namespace busgen
{
    namespace
    {
        std::string read_machine_id()
        {
            for (auto* file_name : {"/etc/machine-id", "/var/lib/dbus/machine-id"})
            {
                std::ifstream file(file_name);
                std::string id;
                if (file && std::getline(file, id) && !id.empty())
                    return id;
            }
            return {};
        }

        std::string child_prefix(const std::string& path)
        {
            return path == "/" ? path : path + "/";
        }
    }

    object_server::object_server(std::shared_ptr<transport> t)
        : transport_(std::move(t))
        , machine_id_(read_machine_id())
    {
    }

    object_server::~object_server()
    {
        detach();
    }

    int object_server::attach()
    {
        if (!transport_)
            return error::TRANSPORT_ERROR();
        auto ret = transport_->set_call_handler(
            [this](const message& call)
            {
                auto err = SYNC_WAIT(handle_call(call));
                if (err != error::OK())
                    BUSGEN_WARNING("unable to answer {}.{} on {}: {}", call.interface_name, call.member, call.path, error::to_string(err));
            });
        if (ret == error::OK())
            attached_ = true;
        return ret;
    }

    void object_server::detach()
    {
        if (!attached_ || !transport_)
            return;
        auto ret = transport_->set_call_handler({});
        if (ret != error::OK())
            BUSGEN_DEBUG("detaching object server returned {}", error::to_string(ret));
        attached_ = false;
    }

    int object_server::add(std::shared_ptr<interface_dispatcher> dispatcher)
    {
        if (!dispatcher)
            return error::INVALID_ARGS();
        if (!is_valid_object_path(dispatcher->path()))
        {
            BUSGEN_ERROR("'{}' is not a valid object path", dispatcher->path());
            return error::INVALID_ARGS();
        }
        std::lock_guard lock(mutex_);
        auto& dispatchers = objects_[dispatcher->path()];
        for (auto& existing : dispatchers)
        {
            if (existing->interface_name() == dispatcher->interface_name())
                return error::OBJECT_ALREADY_REGISTERED();
        }
        BUSGEN_DEBUG("serving {} at {}", dispatcher->interface_name(), dispatcher->path());
        dispatchers.push_back(std::move(dispatcher));
        return error::OK();
    }

    int object_server::remove(const std::string& path, const std::string& interface_name)
    {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(path);
        if (it == objects_.end())
            return error::UNKNOWN_OBJECT();
        auto& dispatchers = it->second;
        auto found = std::find_if(dispatchers.begin(),
            dispatchers.end(),
            [&](const std::shared_ptr<interface_dispatcher>& d) { return d->interface_name() == interface_name; });
        if (found == dispatchers.end())
            return error::UNKNOWN_INTERFACE();
        dispatchers.erase(found);
        if (dispatchers.empty())
            objects_.erase(it);
        return error::OK();
    }

    std::shared_ptr<interface_dispatcher> object_server::find(const std::string& path, const std::string& interface_name) const
    {
        for (auto& dispatcher : dispatchers_at(path))
        {
            if (dispatcher->interface_name() == interface_name)
                return dispatcher;
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<interface_dispatcher>> object_server::dispatchers_at(const std::string& path) const
    {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(path);
        if (it == objects_.end())
            return {};
        return it->second;
    }

    bool object_server::has_children(const std::string& path) const
    {
        return !child_names(path).empty();
    }

    std::vector<std::string> object_server::child_names(const std::string& path) const
    {
        auto prefix = child_prefix(path);
        std::set<std::string> names;
        std::lock_guard lock(mutex_);
        for (auto& object : objects_)
        {
            auto& candidate = object.first;
            if (candidate.size() <= prefix.size() || candidate.compare(0, prefix.size(), prefix) != 0)
                continue;
            auto rest = candidate.substr(prefix.size());
            names.insert(rest.substr(0, rest.find('/')));
        }
        return {names.begin(), names.end()};
    }

    introspection_node object_server::describe(const std::string& path) const
    {
        introspection_node node;
        auto dispatchers = dispatchers_at(path);
        if (!dispatchers.empty())
        {
            for (auto* name : {peer_interface, introspectable_interface, properties_interface})
            {
                if (auto* spec = find_standard_interface(name))
                    node.interfaces.push_back(*spec);
            }
            for (auto& dispatcher : dispatchers)
                node.interfaces.push_back(dispatcher->spec());
        }
        for (auto& name : child_names(path))
        {
            introspection_node child;
            child.name = name;
            node.children.push_back(std::move(child));
        }
        return node;
    }

    std::string object_server::introspect(const std::string& path) const
    {
        return introspect_xml(describe(path));
    }

    CORO_TASK(int) object_server::route_properties(const message& call, std::vector<value>& reply_body)
    {
        std::string interface_name;
        if (call.member == "Get")
        {
            std::string property_name;
            if (unmarshal_values(call.body, interface_name, property_name) != error::OK())
                CO_RETURN error::INVALID_ARGS();
            auto dispatcher = find(call.path, interface_name);
            if (!dispatcher)
                CO_RETURN error::UNKNOWN_INTERFACE();
            value result;
            auto ret = CO_AWAIT dispatcher->get_property(property_name, result);
            if (ret != error::OK())
                CO_RETURN ret;
            reply_body = marshal_values(result);
            CO_RETURN error::OK();
        }
        if (call.member == "Set")
        {
            std::string property_name;
            value new_value;
            if (unmarshal_values(call.body, interface_name, property_name, new_value) != error::OK())
                CO_RETURN error::INVALID_ARGS();
            auto dispatcher = find(call.path, interface_name);
            if (!dispatcher)
                CO_RETURN error::UNKNOWN_INTERFACE();
            CO_RETURN CO_AWAIT dispatcher->set_property(property_name, new_value);
        }
        if (call.member == "GetAll")
        {
            if (unmarshal_values(call.body, interface_name) != error::OK())
                CO_RETURN error::INVALID_ARGS();
            auto dispatcher = find(call.path, interface_name);
            if (!dispatcher)
                CO_RETURN error::UNKNOWN_INTERFACE();
            std::map<std::string, value> values;
            auto ret = CO_AWAIT dispatcher->get_all_properties(values);
            if (ret != error::OK())
                CO_RETURN ret;
            reply_body = marshal_values(values);
            CO_RETURN error::OK();
        }
        CO_RETURN error::UNKNOWN_METHOD();
    }

    CORO_TASK(int) object_server::route_peer(const message& call, std::vector<value>& reply_body)
    {
        if (call.member == "Ping")
            CO_RETURN call.body.empty() ? error::OK() : error::INVALID_ARGS();
        if (call.member == "GetMachineId")
        {
            if (machine_id_.empty())
                CO_RETURN error::CALL_FAILED();
            reply_body = marshal_values(machine_id_);
            CO_RETURN error::OK();
        }
        CO_RETURN error::UNKNOWN_METHOD();
    }

    CORO_TASK(int) object_server::route(const message& call, std::vector<value>& reply_body)
    {
        auto dispatchers = dispatchers_at(call.path);
        if (dispatchers.empty() && !has_children(call.path) && call.path != "/")
            CO_RETURN error::UNKNOWN_OBJECT();

        if (call.interface_name == introspectable_interface)
        {
            if (call.member != "Introspect")
                CO_RETURN error::UNKNOWN_METHOD();
            reply_body = marshal_values(introspect(call.path));
            CO_RETURN error::OK();
        }
        if (call.interface_name == peer_interface)
            CO_RETURN CO_AWAIT route_peer(call, reply_body);
        if (call.interface_name == properties_interface)
            CO_RETURN CO_AWAIT route_properties(call, reply_body);

        if (call.interface_name.empty())
        {
            // without an interface the first one declaring the member takes the call
            for (auto& dispatcher : dispatchers)
            {
                if (dispatcher->has_handler(call.member))
                    CO_RETURN CO_AWAIT dispatcher->dispatch(call, reply_body);
            }
            CO_RETURN error::UNKNOWN_METHOD();
        }

        for (auto& dispatcher : dispatchers)
        {
            if (dispatcher->interface_name() == call.interface_name)
                CO_RETURN CO_AWAIT dispatcher->dispatch(call, reply_body);
        }
        CO_RETURN error::UNKNOWN_INTERFACE();
    }

    CORO_TASK(int) object_server::handle_call(const message& call)
    {
        std::vector<value> reply_body;
        auto ret = CO_AWAIT route(call, reply_body);
        if (call.no_reply)
        {
            if (ret != error::OK())
                BUSGEN_DEBUG("{}.{} on {} failed without a reply: {}", call.interface_name, call.member, call.path, error::to_string(ret));
            CO_RETURN error::OK();
        }

        message reply;
        if (ret == error::OK())
            reply = message::method_return(call, std::move(reply_body));
        else
        {
            BUSGEN_DEBUG("{}.{} on {} failed: {}", call.interface_name, call.member, call.path, error::to_string(ret));
            reply = message::error_reply(call,
                error::to_dbus_error_name(ret),
                fmt::format("{}.{} on {}: {}", call.interface_name, call.member, call.path, error::to_string(ret)));
        }
        CO_RETURN CO_AWAIT transport_->send(std::move(reply));
    }

    void object_server::set_machine_id(std::string machine_id)
    {
        machine_id_ = std::move(machine_id);
    }
}
