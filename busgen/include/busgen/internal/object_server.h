/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <busgen/internal/coroutine_support.h>
#include <busgen/internal/dispatcher.h>
#include <busgen/internal/interface_spec.h>
#include <busgen/internal/transport.h>

namespace busgen
{
    // Hosts interface dispatchers at object paths. Besides routing calls to them it answers
    // the standard Introspectable, Properties and Peer interfaces for every object and
    // turns failures into error replies.
    class object_server
    {
        std::shared_ptr<transport> transport_;
        mutable std::mutex mutex_;
        std::map<std::string, std::vector<std::shared_ptr<interface_dispatcher>>> objects_;
        std::string machine_id_;
        bool attached_ = false;

        std::vector<std::shared_ptr<interface_dispatcher>> dispatchers_at(const std::string& path) const;
        bool has_children(const std::string& path) const;
        std::vector<std::string> child_names(const std::string& path) const;

        CORO_TASK(int) route_properties(const message& call, std::vector<value>& reply_body);
        CORO_TASK(int) route_peer(const message& call, std::vector<value>& reply_body);

    public:
        explicit object_server(std::shared_ptr<transport> t);
        ~object_server();
        object_server(const object_server&) = delete;
        object_server& operator=(const object_server&) = delete;

        // starts receiving the method calls addressed to the transport's connection
        int attach();
        void detach();

        // OBJECT_ALREADY_REGISTERED when the path already serves that interface
        int add(std::shared_ptr<interface_dispatcher> dispatcher);
        int remove(const std::string& path, const std::string& interface_name);
        std::shared_ptr<interface_dispatcher> find(const std::string& path, const std::string& interface_name) const;

        // the introspection document of one path, empty nodes list their children only
        std::string introspect(const std::string& path) const;
        introspection_node describe(const std::string& path) const;

        // Finds the handler for a call. Returns error::OK() with the reply body filled in or
        // the error the reply has to carry.
        CORO_TASK(int) route(const message& call, std::vector<value>& reply_body);

        // routes and sends the reply, nothing is sent when the caller asked for no reply
        CORO_TASK(int) handle_call(const message& call);

        // overrides the id answered by Peer.GetMachineId
        void set_machine_id(std::string machine_id);
        const std::string& machine_id() const { return machine_id_; }
    };
}
