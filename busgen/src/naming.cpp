/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cctype>

#include <busgen/internal/naming.h>

namespace busgen
{
    namespace
    {
        constexpr std::size_t max_name_length = 255;

        bool is_alpha(char c)
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }
        bool is_digit(char c)
        {
            return c >= '0' && c <= '9';
        }
        bool is_upper(char c)
        {
            return c >= 'A' && c <= 'Z';
        }
        bool is_lower(char c)
        {
            return c >= 'a' && c <= 'z';
        }

        // element of a dotted name, bus name elements may also contain '-'
        bool is_valid_element(std::string_view element, bool allow_dash, bool allow_leading_digit)
        {
            if (element.empty())
                return false;
            if (!allow_leading_digit && is_digit(element[0]))
                return false;
            for (char c : element)
            {
                if (!is_alpha(c) && !is_digit(c) && c != '_' && !(allow_dash && c == '-'))
                    return false;
            }
            return true;
        }

        constexpr const char* reserved_words[] = {"alignas", "alignof", "and", "asm", "auto", "bool", "break",
            "case", "catch", "char", "class", "const", "constexpr", "continue", "default", "delete", "do", "double",
            "else", "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if", "inline",
            "int", "long", "mutable", "namespace", "new", "noexcept", "not", "nullptr", "operator", "or", "private",
            "protected", "public", "register", "return", "short", "signed", "sizeof", "static", "struct", "switch",
            "template", "this", "throw", "true", "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
            "virtual", "void", "volatile", "while", "xor"};
    }

    std::string to_pascal_case(std::string_view native_name)
    {
        std::string out;
        out.reserve(native_name.size());
        bool capitalise = true;
        for (char c : native_name)
        {
            if (c == '_')
            {
                capitalise = true;
                continue;
            }
            if (capitalise)
            {
                out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                capitalise = false;
            }
            else
                out += c;
        }
        return out;
    }

    std::string to_snake_case(std::string_view wire_name)
    {
        std::string out;
        out.reserve(wire_name.size() + 4);
        for (std::size_t i = 0; i < wire_name.size(); ++i)
        {
            char c = wire_name[i];
            if (c == '-' || c == '.')
                c = '_';
            if (is_upper(c) && i > 0 && !out.empty() && out.back() != '_')
            {
                char prev = wire_name[i - 1];
                bool next_is_lower = i + 1 < wire_name.size() && is_lower(wire_name[i + 1]);
                if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_is_lower))
                    out += '_';
            }
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    bool is_valid_native_identifier(std::string_view name)
    {
        if (name.empty() || is_digit(name[0]))
            return false;
        return std::all_of(name.begin(), name.end(), [](char c) { return is_alpha(c) || is_digit(c) || c == '_'; });
    }

    bool is_valid_member_name(std::string_view name)
    {
        return name.size() <= max_name_length && is_valid_native_identifier(name);
    }

    bool is_valid_interface_name(std::string_view name)
    {
        if (name.empty() || name.size() > max_name_length)
            return false;
        std::size_t elements = 0;
        std::size_t start = 0;
        while (true)
        {
            auto dot = name.find('.', start);
            auto element = name.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
            if (!is_valid_element(element, false, false))
                return false;
            ++elements;
            if (dot == std::string_view::npos)
                break;
            start = dot + 1;
        }
        return elements >= 2;
    }

    bool is_valid_object_path(std::string_view path)
    {
        if (path.empty() || path[0] != '/')
            return false;
        if (path.size() == 1)
            return true;
        if (path.back() == '/')
            return false;
        char prev = '/';
        for (std::size_t i = 1; i < path.size(); ++i)
        {
            char c = path[i];
            if (c == '/')
            {
                if (prev == '/')
                    return false;
            }
            else if (!is_alpha(c) && !is_digit(c) && c != '_')
                return false;
            prev = c;
        }
        return true;
    }

    bool is_valid_bus_name(std::string_view name)
    {
        if (name.empty() || name.size() > max_name_length)
            return false;
        bool unique = name[0] == ':';
        if (unique)
            name.remove_prefix(1);
        std::size_t elements = 0;
        std::size_t start = 0;
        while (true)
        {
            auto dot = name.find('.', start);
            auto element = name.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
            if (!is_valid_element(element, true, unique))
                return false;
            ++elements;
            if (dot == std::string_view::npos)
                break;
            start = dot + 1;
        }
        return elements >= 2;
    }

    std::string escape_native_identifier(const std::string& name)
    {
        for (auto* word : reserved_words)
        {
            if (name == word)
                return name + "_";
        }
        return name;
    }
}
