/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <map>
#include <sstream>

#include <busgen/internal/naming.h>
#include <busgen/internal/standard_interfaces.h>
#include <busgen/version.h>

#include "dispatcher_generator.h"
#include "proxy_generator.h"
#include "type_utils.h"
#include "writer.h"
#include "xmlgen.h"

namespace busgen
{
    namespace generator
    {
        namespace xmlgen
        {
            namespace
            {
                void write_header_comment(const interface_partition& partition, const generation_options& options, std::ostream& os)
                {
                    os << "/*\n";
                    if (!partition.needed.empty())
                    {
                        os << (partition.needed.size() == 1 ? " * D-Bus interface proxy for: " : " * D-Bus interface proxies for: ");
                        for (std::size_t i = 0; i < partition.needed.size(); ++i)
                            os << (i ? ", `" : "`") << partition.needed[i]->name << "`";
                        os << "\n *\n";
                    }
                    os << " * This code was generated by `" << tool_name << "` `" << BUSGEN_VERSION
                       << "` from D-Bus introspection data.\n";
                    os << " * Source: `" << options.source << "`.\n";
                    os << " *\n";
                    os << " * You may prefer to adapt it, instead of using it verbatim.\n";
                    if (!partition.standard.empty())
                    {
                        os << " *\n";
                        os << " * This D-Bus object implements standard D-Bus interfaces (`" << options.standard_prefix
                           << ".*`)\n";
                        os << " * for which the following busgen proxies can be used:\n";
                        os << " *\n";
                        for (auto* iface : partition.standard)
                        {
                            if (find_standard_interface(iface->name))
                                os << " * * busgen::fdo::" << interface_stem(iface->name) << "_proxy\n";
                            else
                                os << " * * `" << iface->name << "`\n";
                        }
                        os << " *\n";
                        os << " * ...consequently `" << tool_name << "` did not generate code for the above interfaces.\n";
                    }
                    os << " */\n";
                }
            }

            std::vector<std::string> class_stems(const std::vector<const interface_spec*>& interfaces)
            {
                std::map<std::string, int> counts;
                for (auto* iface : interfaces)
                    counts[interface_stem(iface->name)]++;

                std::vector<std::string> stems;
                stems.reserve(interfaces.size());
                for (auto* iface : interfaces)
                {
                    auto stem = interface_stem(iface->name);
                    if (counts[stem] > 1)
                        stem = to_snake_case(iface->name);
                    stems.push_back(escape_native_identifier(stem));
                }
                return stems;
            }

            void write_module(const introspection_node& node, const generation_options& options, std::ostream& os)
            {
                auto partition = partition_interfaces(node, options.standard_prefix);
                write_header_comment(partition, options, os);

                writer header(os);
                header("");
                header("#pragma once");
                header("");
                header("#include <cstdint>");
                header("#include <map>");
                header("#include <memory>");
                header("#include <string>");
                header("#include <tuple>");
                header("#include <vector>");
                header("");
                header("#include <busgen/busgen.h>");

                bool namespaced = !options.namespace_name.empty();
                if (namespaced)
                {
                    header("");
                    header("namespace {}", options.namespace_name);
                    header("{{");
                }

                proxy_generator::options proxy_options{options.default_service, options.default_path};
                auto stems = class_stems(partition.needed);
                for (std::size_t i = 0; i < partition.needed.size(); ++i)
                {
                    header("");
                    proxy_generator::write_proxy(*partition.needed[i], stems[i] + "_proxy", proxy_options, header);
                    if (options.dispatchers)
                    {
                        header("");
                        dispatcher_generator::write_dispatcher(*partition.needed[i], stems[i] + "_skeleton", header);
                    }
                }

                if (namespaced)
                    header("}}");
            }

            std::string generate_module(const introspection_node& node, const generation_options& options)
            {
                std::stringstream os;
                write_module(node, options, os);
                return os.str();
            }
        }
    }
}
