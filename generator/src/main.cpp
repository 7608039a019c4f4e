/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <args.hxx>

#include <busgen/busgen.h>

#ifdef BUSGEN_HAS_LIBDBUS
#include <transports/libdbus/transport.h>
#endif

#include "xmlgen.h"

namespace
{
    constexpr const char* usage = "Usage:\n"
                                  "  busgen-xmlgen <interface.xml>\n"
                                  "  busgen-xmlgen --system|--session <service> <object_path>\n"
                                  "  busgen-xmlgen --address <address> <service> <object_path>\n";

    bool read_file(const std::filesystem::path& path, std::string& data)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
            return false;
        std::stringstream buffer;
        buffer << file.rdbuf();
        data = buffer.str();
        return true;
    }

    bool is_different(const std::string& generated, const std::filesystem::path& path)
    {
        std::string existing;
        if (!read_file(path, existing))
            return true;
        return existing != generated;
    }

    int check_target(const std::string& service, const std::string& path)
    {
        if (!busgen::is_valid_bus_name(service))
        {
            std::cerr << "invalid service name '" << service << "'\n";
            return 1;
        }
        if (!busgen::is_valid_object_path(path))
        {
            std::cerr << "invalid object path '" << path << "'\n";
            return 1;
        }
        return 0;
    }

#ifdef BUSGEN_HAS_LIBDBUS
    int introspect_live(const std::shared_ptr<busgen::libdbus::connection>& conn,
        const std::string& service,
        const std::string& path,
        std::string& xml)
    {
        busgen::fdo::introspectable_proxy proxy(conn, service, path);
        auto ret = SYNC_WAIT(proxy.introspect(xml));
        if (ret != busgen::error::OK())
            std::cerr << "Introspect on " << service << " " << path << " failed: " << busgen::error::to_string(ret) << '\n';
        return ret;
    }
#endif
}

int main(const int argc, char* argv[])
{
    try
    {
        args::ArgumentParser args_parser("Generate C++ D-Bus proxies from introspection data");
        args::HelpFlag h(args_parser, "help", "help", {"help"});

        args::Flag system_arg(args_parser, "system", "introspect a service on the system bus", {"system"});
        args::Flag session_arg(args_parser, "session", "introspect a service on the session bus", {"session"});
        args::ValueFlag<std::string> address_arg(
            args_parser, "address", "introspect a service on the bus at this address", {"address"});
        args::ValueFlag<std::string> output_arg(
            args_parser, "file", "write the generated header here instead of stdout", {'o', "output"});
        args::ValueFlag<std::string> namespace_arg(
            args_parser, "namespace", "namespace of the generated classes", {'n', "namespace"});
        args::Flag dispatcher_arg(
            args_parser, "dispatcher", "also generate server skeletons", {'d', "dispatcher"});
        args::Flag verbose_arg(args_parser, "verbose", "log debug output", {'v', "verbose"});
        args::PositionalList<std::string> inputs_arg(
            args_parser, "inputs", "an introspection file, or the service and object path to introspect");

        try
        {
            args_parser.ParseCLI(argc, argv);
        }
        catch (const args::Help&)
        {
            std::cout << args_parser;
            return 0;
        }
        catch (const args::ParseError& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << args_parser;
            return 1;
        }

        busgen::set_log_level(verbose_arg ? busgen::log_level::debug : busgen::log_level::warning);

        std::vector<std::string> inputs = args::get(inputs_arg);
        bool live = system_arg || session_arg || address_arg;
        if (!live && inputs.empty())
        {
            std::cerr << usage;
            return 0;
        }

        busgen::generator::xmlgen::generation_options options;
        options.dispatchers = dispatcher_arg;
        options.namespace_name = args::get(namespace_arg);

        std::string xml;
        if (live)
        {
            if ((system_arg && session_arg) || ((system_arg || session_arg) && address_arg))
            {
                std::cerr << "--system, --session and --address are mutually exclusive\n" << usage;
                return 1;
            }
            if (inputs.size() != 2)
            {
                std::cerr << "expected a service and an object path\n" << usage;
                return 1;
            }
            const auto& service = inputs[0];
            const auto& path = inputs[1];
            if (check_target(service, path))
                return 1;

#ifdef BUSGEN_HAS_LIBDBUS
            std::shared_ptr<busgen::libdbus::connection> conn;
            int ret = busgen::error::OK();
            if (address_arg)
            {
                ret = busgen::libdbus::connection::connect_address(args::get(address_arg), conn);
                options.source = "Interface '" + path + "' from service '" + service + "'";
            }
            else
            {
                ret = busgen::libdbus::connection::connect(
                    system_arg ? busgen::libdbus::bus_type::system : busgen::libdbus::bus_type::session, conn);
                options.source = "Interface '" + path + "' from service '" + service + "' on "
                                 + (system_arg ? "system" : "session") + " bus";
            }
            if (ret != busgen::error::OK())
            {
                std::cerr << "cannot connect: " << busgen::error::to_string(ret) << '\n';
                return 1;
            }
            if (introspect_live(conn, service, path, xml) != busgen::error::OK())
                return 1;
            options.default_service = service;
            options.default_path = path;
#else
            std::cerr << "this build of busgen-xmlgen has no D-Bus connection support\n";
            return 1;
#endif
        }
        else
        {
            if (inputs.size() != 1)
            {
                std::cerr << "expected exactly one introspection file\n" << usage;
                return 1;
            }
            std::filesystem::path input = inputs[0];
            if (!read_file(input, xml))
            {
                std::cerr << "Error file " << input << " does not exist\n";
                return 1;
            }
            options.source = input.filename().string();
        }

        busgen::introspection_node node;
        std::string diagnostic;
        std::vector<std::string> rejected;
        auto ret = busgen::parse_introspection(xml, node, diagnostic, &rejected);
        if (ret != busgen::error::OK())
        {
            std::cerr << options.source << ": " << busgen::error::to_string(ret) << ": " << diagnostic << '\n';
            return 1;
        }
        for (auto& reason : rejected)
            BUSGEN_WARNING("skipping interface {}", reason);

        auto generated = busgen::generator::xmlgen::generate_module(node, options);

        if (output_arg)
        {
            std::filesystem::path output = args::get(output_arg);
            if (!output.parent_path().empty())
                std::filesystem::create_directories(output.parent_path());
            // only touch the file when the content changes so dependent builds stay quiet
            if (is_different(generated, output))
            {
                std::ofstream file(output, std::ios::binary);
                if (!file)
                {
                    std::cerr << "cannot write " << output << '\n';
                    return 1;
                }
                file << generated;
            }
        }
        else
            std::cout << generated;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
