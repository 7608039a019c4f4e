/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <busgen/internal/interface_spec.h>

#include "writer.h"

namespace busgen
{
    namespace generator
    {
        namespace dispatcher_generator
        {
            // An abstract server skeleton: one pure virtual per method and property accessor,
            // a bind() that registers them on a busgen::interface_dispatcher in declaration
            // order and emit helpers for the signals and property change announcements.
            void write_dispatcher(const interface_spec& spec, const std::string& class_name, writer& stub);
        }
    }
}
