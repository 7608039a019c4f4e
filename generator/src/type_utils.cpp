/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>

#include <busgen/internal/naming.h>

#include "type_utils.h"

namespace busgen
{
    namespace generator
    {
        namespace
        {
            bool is_identifier_char(char c)
            {
                return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            }

            std::string make_unique(std::string name, std::set<std::string>& used)
            {
                name = escape_native_identifier(name);
                while (used.count(name))
                    name += "_";
                used.insert(name);
                return name;
            }
        }

        std::string native_type_name(const type_node& node)
        {
            switch (node.code)
            {
            case type_code::byte:
                return "uint8_t";
            case type_code::boolean:
                return "bool";
            case type_code::int16:
                return "int16_t";
            case type_code::uint16:
                return "uint16_t";
            case type_code::int32:
                return "int32_t";
            case type_code::uint32:
                return "uint32_t";
            case type_code::int64:
                return "int64_t";
            case type_code::uint64:
                return "uint64_t";
            case type_code::double_:
                return "double";
            case type_code::unix_fd:
                return "busgen::unix_fd";
            case type_code::string:
                return "std::string";
            case type_code::object_path:
                return "busgen::object_path";
            case type_code::signature:
                return "busgen::signature_text";
            case type_code::variant:
                return "busgen::value";
            case type_code::array:
            {
                const auto& element = node.children.front();
                if (element.code == type_code::dict_entry)
                    return "std::map<" + native_type_name(element.children[0]) + ", "
                           + native_type_name(element.children[1]) + ">";
                return "std::vector<" + native_type_name(element) + ">";
            }
            case type_code::struct_:
            {
                std::string out = "std::tuple<";
                for (std::size_t i = 0; i < node.children.size(); ++i)
                {
                    if (i)
                        out += ", ";
                    out += native_type_name(node.children[i]);
                }
                return out + ">";
            }
            case type_code::dict_entry:
                // only reachable inside an array
                return "std::pair<" + native_type_name(node.children[0]) + ", " + native_type_name(node.children[1])
                       + ">";
            }
            return "busgen::value";
        }

        std::string native_type_name(const type_signature& signature)
        {
            if (signature.is_single_complete_type())
                return native_type_name(signature.front());
            return native_type_name(signature.as_struct().front());
        }

        std::string native_param_type(const type_node& node)
        {
            if (node.is_basic() && node.code != type_code::string && node.code != type_code::object_path
                && node.code != type_code::signature && node.code != type_code::unix_fd)
                return native_type_name(node);
            return "const " + native_type_name(node) + "&";
        }

        std::string native_result_type(const method_spec& method)
        {
            if (method.outputs.size() == 1)
                return native_type_name(method.outputs.front().type);
            return native_tuple_type(method.outputs);
        }

        std::string native_tuple_type(const std::vector<arg_spec>& args)
        {
            std::string out = "std::tuple<";
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += native_type_name(args[i].type);
            }
            return out + ">";
        }

        std::vector<std::string> make_param_names(const std::vector<arg_spec>& args, const std::set<std::string>& taken)
        {
            std::set<std::string> used = taken;
            std::vector<std::string> names;
            names.reserve(args.size());
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                std::string cleaned;
                for (char c : to_snake_case(args[i].name))
                    cleaned += is_identifier_char(c) ? c : '_';
                if (cleaned.find_first_not_of('_') == std::string::npos)
                    cleaned = "arg_" + std::to_string(i);
                else if (cleaned[0] >= '0' && cleaned[0] <= '9')
                    cleaned = "_" + cleaned;
                names.push_back(make_unique(cleaned, used));
            }
            return names;
        }

        binding_names make_binding_names(const interface_spec& spec, const std::set<std::string>& reserved)
        {
            std::set<std::string> used = reserved;
            binding_names names;
            // methods are named first so they keep their natural names
            for (auto& method : spec.methods)
                names.methods.push_back(make_unique(method.native_name, used));
            for (auto& property : spec.properties)
            {
                names.getters.push_back(make_unique("get_" + property.native_name, used));
                names.setters.push_back(make_unique("set_" + property.native_name, used));
                names.change_notifiers.push_back(make_unique(property.native_name + "_changed", used));
            }
            for (auto& signal : spec.signals)
            {
                names.receivers.push_back(make_unique("receive_" + signal.native_name, used));
                names.signal_args.push_back(make_unique(signal.native_name + "_args", used));
                names.emitters.push_back(make_unique("emit_" + signal.native_name, used));
            }
            return names;
        }

        bool needs_explicit_wire_name(const std::string& native_name, const std::string& wire_name)
        {
            return to_pascal_case(native_name) != wire_name;
        }

        std::string interface_stem(const std::string& interface_name)
        {
            auto dot = interface_name.rfind('.');
            auto last = dot == std::string::npos ? interface_name : interface_name.substr(dot + 1);
            std::string cleaned;
            for (char c : to_snake_case(last))
                cleaned += is_identifier_char(c) ? c : '_';
            return cleaned;
        }

        std::vector<std::string> doc_lines(const std::string& doc)
        {
            std::vector<std::string> lines;
            if (doc.empty())
                return lines;
            std::istringstream in(doc);
            std::string line;
            while (std::getline(in, line))
            {
                // a trailing backslash would splice the next generated line into the comment
                auto end = line.find_last_not_of(" \t\r\\");
                line.erase(end == std::string::npos ? 0 : end + 1);
                lines.push_back(line);
            }
            return lines;
        }

        std::string quoted(const std::string& text)
        {
            std::string out = "\"";
            for (char c : text)
            {
                if (c == '"' || c == '\\')
                    out += '\\';
                out += c;
            }
            return out + "\"";
        }
    }
}
