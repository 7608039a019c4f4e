/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace busgen
{
    // protocol limits on a signature
    constexpr std::size_t max_signature_length = 255;
    constexpr int max_array_nesting = 32;
    constexpr int max_struct_nesting = 32;
    constexpr int max_total_nesting = 64;

    enum class type_code : char
    {
        byte = 'y',
        boolean = 'b',
        int16 = 'n',
        uint16 = 'q',
        int32 = 'i',
        uint32 = 'u',
        int64 = 'x',
        uint64 = 't',
        double_ = 'd',
        unix_fd = 'h',
        string = 's',
        object_path = 'o',
        signature = 'g',
        variant = 'v',
        array = 'a',
        struct_ = '(',
        dict_entry = '{'
    };

    bool is_basic_type_code(char code);
    bool is_fixed_type_code(char code);

    // one complete type, containers own their element types
    struct type_node
    {
        type_code code = type_code::byte;
        std::vector<type_node> children;

        bool is_basic() const;
        bool is_container() const { return !children.empty(); }
        bool is_dict() const;

        bool operator==(const type_node& other) const;
        bool operator!=(const type_node& other) const { return !(*this == other); }
    };

    class type_signature
    {
        std::vector<type_node> types_;

    public:
        type_signature() = default;
        explicit type_signature(std::vector<type_node> types)
            : types_(std::move(types))
        {
        }

        const std::vector<type_node>& types() const { return types_; }
        bool empty() const { return types_.empty(); }
        std::size_t size() const { return types_.size(); }
        bool is_single_complete_type() const { return types_.size() == 1; }
        const type_node& front() const { return types_.front(); }

        std::string to_string() const;

        // wraps all complete types into a single struct, "us" becomes "(us)"
        type_signature as_struct() const;

        bool operator==(const type_signature& other) const { return types_ == other.types_; }
        bool operator!=(const type_signature& other) const { return !(*this == other); }
    };

    // Parses a wire signature. On failure out is left untouched and, if error_position is
    // given, it receives the index of the offending character (or the text length when the
    // text ended too early).
    int parse_signature(std::string_view text, type_signature& out, std::size_t* error_position = nullptr);

    // parses text that must contain exactly one complete type
    int parse_single_type(std::string_view text, type_node& out, std::size_t* error_position = nullptr);

    std::string to_text(const type_signature& signature);
    std::string to_text(const type_node& node);

    bool is_valid_signature(std::string_view text);
}
