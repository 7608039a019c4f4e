/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <string_view>

namespace busgen
{
    // "a_test" -> "ATest", "str_u32" -> "StrU32". Never fails, characters other than '_' are
    // kept as they are.
    std::string to_pascal_case(std::string_view native_name);

    // "CheckRENAMING" -> "check_renaming", "GetIPAddress" -> "get_ip_address"
    std::string to_snake_case(std::string_view wire_name);

    // [A-Za-z_][A-Za-z0-9_]*
    bool is_valid_native_identifier(std::string_view name);

    // member (method, signal, property) names: [A-Za-z_][A-Za-z0-9_]*, at most 255 characters
    bool is_valid_member_name(std::string_view name);

    // two or more dot separated elements that do not start with a digit
    bool is_valid_interface_name(std::string_view name);

    bool is_valid_object_path(std::string_view path);

    // unique (":1.42") or well-known ("org.example.Service") bus names
    bool is_valid_bus_name(std::string_view name);

    // reserved words of the generated language get a trailing underscore
    std::string escape_native_identifier(const std::string& name);
}
