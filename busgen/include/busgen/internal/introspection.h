/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <busgen/internal/interface_spec.h>

namespace busgen
{
    constexpr const char* introspection_doctype
        = "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
          " \"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n";

    constexpr const char* standard_interface_prefix = "org.freedesktop.DBus";

    // Parses an introspection document. Malformed XML and missing or invalid required
    // attributes fail the whole document. An interface that parses but breaks a model rule
    // (duplicate member, out-direction signal argument, ...) is dropped, its name and the
    // reason are appended to rejected (or logged as a warning when rejected is null) and its
    // siblings are still returned. A child node without a name is skipped with a warning.
    int parse_introspection(std::string_view xml,
        introspection_node& out,
        std::string& diagnostic,
        std::vector<std::string>* rejected = nullptr);

    // Writes one <interface> element, indented by two spaces per level. The output only
    // depends on the interface so parse followed by write is a fixed point after the first cycle.
    void write_interface_xml(const interface_spec& spec, std::ostream& os, int indent_level = 0);
    std::string interface_xml(const interface_spec& spec, int indent_level = 0);

    // a complete document, DOCTYPE included
    std::string introspect_xml(const introspection_node& node);

    struct interface_partition
    {
        std::vector<const interface_spec*> standard; // names starting with the prefix
        std::vector<const interface_spec*> needed;
    };

    interface_partition partition_interfaces(
        const introspection_node& node, const std::string& prefix = standard_interface_prefix);

    // Turns XML comment text into doc text: leading and trailing blank lines are dropped,
    // the indentation common to all lines is removed as is trailing whitespace.
    std::string normalise_doc_comment(std::string_view comment);
}
