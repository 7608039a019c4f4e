/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace busgen
{
    struct object_path
    {
        std::string value;

        bool operator==(const object_path& other) const { return value == other.value; }
        bool operator!=(const object_path& other) const { return value != other.value; }
        bool operator<(const object_path& other) const { return value < other.value; }
    };

    // a signature carried as a message argument ('g')
    struct signature_text
    {
        std::string value;

        bool operator==(const signature_text& other) const { return value == other.value; }
        bool operator!=(const signature_text& other) const { return value != other.value; }
        bool operator<(const signature_text& other) const { return value < other.value; }
    };

    // index into the message's out-of-band file descriptor array ('h')
    struct unix_fd
    {
        uint32_t index = 0;

        bool operator==(const unix_fd& other) const { return index == other.index; }
        bool operator!=(const unix_fd& other) const { return index != other.index; }
        bool operator<(const unix_fd& other) const { return index < other.index; }
    };

    // A decoded message argument tagged with its single complete type signature. Basic
    // types hold a scalar; arrays, structs, dict entries and variants hold child values.
    class value
    {
    public:
        using scalar_type = std::
            variant<std::monostate, bool, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t, double, std::string>;

    private:
        std::string signature_;
        scalar_type scalar_;
        std::vector<value> children_;

        value(std::string signature, scalar_type scalar)
            : signature_(std::move(signature))
            , scalar_(std::move(scalar))
        {
        }

    public:
        value() = default;
        explicit value(bool v);
        explicit value(uint8_t v);
        explicit value(int16_t v);
        explicit value(uint16_t v);
        explicit value(int32_t v);
        explicit value(uint32_t v);
        explicit value(int64_t v);
        explicit value(uint64_t v);
        explicit value(double v);
        explicit value(std::string v);
        explicit value(const char* v);
        explicit value(const object_path& v);
        explicit value(const signature_text& v);
        explicit value(const unix_fd& v);

        static value make_array(const std::string& element_signature, std::vector<value> elements);
        static value make_struct(std::vector<value> fields);
        static value make_dict_entry(value key, value val);
        static value make_variant(value inner);

        bool is_valid() const { return !signature_.empty(); }
        const std::string& signature() const { return signature_; }
        char code() const { return signature_.empty() ? '\0' : signature_[0]; }

        template<typename T> const T* get_if() const { return std::get_if<T>(&scalar_); }
        const scalar_type& scalar() const { return scalar_; }

        // array elements, struct fields, dict entry key/value or the variant's content
        const std::vector<value>& children() const { return children_; }

        // element type of an array, empty for any other value
        std::string element_signature() const;

        std::string to_string() const;

        bool operator==(const value& other) const;
        bool operator!=(const value& other) const { return !(*this == other); }
    };

    // concatenated signature of a message body
    std::string body_signature(const std::vector<value>& body);
}
