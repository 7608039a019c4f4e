/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <set>
#include <string>
#include <vector>

#include <busgen/internal/interface_spec.h>
#include <busgen/internal/signature.h>

namespace busgen
{
    namespace generator
    {
        // "a{sv}" -> "std::map<std::string, busgen::value>"
        std::string native_type_name(const type_node& node);
        std::string native_type_name(const type_signature& signature);

        // how an input is passed into a generated function
        std::string native_param_type(const type_node& node);

        // the out parameter of a method: the single output's type or a tuple of all outputs
        std::string native_result_type(const method_spec& method);

        // std::tuple<...> of all arguments' types
        std::string native_tuple_type(const std::vector<arg_spec>& args);

        // Identifiers for the arguments of one member. Names are snake cased, characters that
        // are not allowed in an identifier become '_', unnamed arguments are called arg_N and
        // anything in taken gets a trailing underscore.
        std::vector<std::string> make_param_names(const std::vector<arg_spec>& args, const std::set<std::string>& taken);

        // function names of one interface's bindings, parallel to the interface's member vectors
        struct binding_names
        {
            std::vector<std::string> methods;
            std::vector<std::string> getters;
            std::vector<std::string> setters;
            std::vector<std::string> change_notifiers;
            std::vector<std::string> receivers;
            std::vector<std::string> signal_args;
            std::vector<std::string> emitters;
        };

        // names colliding with each other or with reserved get a trailing underscore
        binding_names make_binding_names(const interface_spec& spec, const std::set<std::string>& reserved);

        // the wire name cannot be recovered from the native name by pascal casing
        bool needs_explicit_wire_name(const std::string& native_name, const std::string& wire_name);

        // the last component of an interface name in snake case: "org.example.FooBar" -> "foo_bar"
        std::string interface_stem(const std::string& interface_name);

        // doc text as comment lines, trailing whitespace and backslashes removed
        std::vector<std::string> doc_lines(const std::string& doc);

        // a C++ string literal with quotes and backslashes escaped
        std::string quoted(const std::string& text);
    }
}
