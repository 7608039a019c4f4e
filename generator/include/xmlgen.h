/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <busgen/internal/interface_spec.h>
#include <busgen/internal/introspection.h>

namespace busgen
{
    namespace generator
    {
        namespace xmlgen
        {
            constexpr const char* tool_name = "busgen-xmlgen";

            struct generation_options
            {
                std::string source;          // where the introspection data came from
                std::string default_service; // only known when introspected from a live bus
                std::string default_path;
                std::string standard_prefix = standard_interface_prefix;
                std::string namespace_name; // optional namespace around the generated classes
                bool dispatchers = false;   // emit server skeletons next to the proxies
            };

            // "org.example.FooBar" gives "foo_bar". Interfaces whose last components collide
            // are named after their full dotted name instead.
            std::vector<std::string> class_stems(const std::vector<const interface_spec*>& interfaces);

            // A complete header: doc block, includes and one proxy (and optionally one
            // skeleton) per interface that is not a standard one.
            void write_module(const introspection_node& node, const generation_options& options, std::ostream& os);
            std::string generate_module(const introspection_node& node, const generation_options& options);
        }
    }
}
