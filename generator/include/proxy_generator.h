/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <set>
#include <string>

#include <busgen/internal/interface_spec.h>

#include "writer.h"

namespace busgen
{
    namespace generator
    {
        // members of proxy_base and the generated skeleton that bindings must not shadow
        const std::set<std::string>& reserved_member_names();

        // local names used inside generated bodies, arguments are renamed around them
        const std::set<std::string>& reserved_local_names();

        namespace proxy_generator
        {
            struct options
            {
                std::string default_service; // destination used when the caller gives none
                std::string default_path;
            };

            // one client proxy class deriving from busgen::proxy_base
            void write_proxy(const interface_spec& spec, const std::string& class_name, const options& opts, writer& proxy);
        }
    }
}
