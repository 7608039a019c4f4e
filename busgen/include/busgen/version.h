/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

// the build passes the project version, this is only for builds that do not
#ifndef BUSGEN_VERSION
#define BUSGEN_VERSION "0.1.0"
#endif

namespace busgen
{
    constexpr const char* version_string = BUSGEN_VERSION;
}
