/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/value.h>

namespace busgen
{
    // wire_type<T> maps a native argument type onto its wire signature and converts between
    // T and the decoded value representation
    template<typename T, typename Enable = void> struct wire_type;

    namespace detail
    {
        template<typename T, char Code> struct scalar_wire_type
        {
            static std::string signature() { return std::string(1, Code); }
            static value to_value(const T& v) { return value(v); }
            static int from_value(const value& v, T& out)
            {
                if (v.code() != Code)
                    return error::TYPE_MISMATCH();
                auto* p = v.get_if<T>();
                if (!p)
                    return error::TYPE_MISMATCH();
                out = *p;
                return error::OK();
            }
        };

        template<typename T, char Code> struct string_like_wire_type
        {
            static std::string signature() { return std::string(1, Code); }
            static value to_value(const T& v) { return value(v); }
            static int from_value(const value& v, T& out)
            {
                if (v.code() != Code)
                    return error::TYPE_MISMATCH();
                auto* p = v.get_if<std::string>();
                if (!p)
                    return error::TYPE_MISMATCH();
                out.value = *p;
                return error::OK();
            }
        };
    }

    template<> struct wire_type<uint8_t> : detail::scalar_wire_type<uint8_t, 'y'>
    {
    };
    template<> struct wire_type<bool> : detail::scalar_wire_type<bool, 'b'>
    {
    };
    template<> struct wire_type<int16_t> : detail::scalar_wire_type<int16_t, 'n'>
    {
    };
    template<> struct wire_type<uint16_t> : detail::scalar_wire_type<uint16_t, 'q'>
    {
    };
    template<> struct wire_type<int32_t> : detail::scalar_wire_type<int32_t, 'i'>
    {
    };
    template<> struct wire_type<uint32_t> : detail::scalar_wire_type<uint32_t, 'u'>
    {
    };
    template<> struct wire_type<int64_t> : detail::scalar_wire_type<int64_t, 'x'>
    {
    };
    template<> struct wire_type<uint64_t> : detail::scalar_wire_type<uint64_t, 't'>
    {
    };
    template<> struct wire_type<double> : detail::scalar_wire_type<double, 'd'>
    {
    };
    template<> struct wire_type<std::string> : detail::scalar_wire_type<std::string, 's'>
    {
    };
    template<> struct wire_type<object_path> : detail::string_like_wire_type<object_path, 'o'>
    {
    };
    template<> struct wire_type<signature_text> : detail::string_like_wire_type<signature_text, 'g'>
    {
    };

    template<> struct wire_type<unix_fd>
    {
        static std::string signature() { return "h"; }
        static value to_value(const unix_fd& v) { return value(v); }
        static int from_value(const value& v, unix_fd& out)
        {
            auto* p = v.get_if<uint32_t>();
            if (v.code() != 'h' || !p)
                return error::TYPE_MISMATCH();
            out.index = *p;
            return error::OK();
        }
    };

    // a value passed natively is sent as a variant
    template<> struct wire_type<value>
    {
        static std::string signature() { return "v"; }
        static value to_value(const value& v) { return value::make_variant(v); }
        static int from_value(const value& v, value& out)
        {
            if (v.code() != 'v' || v.children().size() != 1)
                return error::TYPE_MISMATCH();
            out = v.children()[0];
            return error::OK();
        }
    };

    template<typename T> struct wire_type<std::vector<T>>
    {
        static std::string signature() { return "a" + wire_type<T>::signature(); }
        static value to_value(const std::vector<T>& v)
        {
            std::vector<value> elements;
            elements.reserve(v.size());
            for (const auto& item : v)
                elements.push_back(wire_type<T>::to_value(item));
            return value::make_array(wire_type<T>::signature(), std::move(elements));
        }
        static int from_value(const value& v, std::vector<T>& out)
        {
            if (v.signature() != signature())
                return error::TYPE_MISMATCH();
            std::vector<T> items;
            items.reserve(v.children().size());
            for (auto& element : v.children())
            {
                T item{};
                auto ret = wire_type<T>::from_value(element, item);
                if (ret != error::OK())
                    return ret;
                items.push_back(std::move(item));
            }
            out = std::move(items);
            return error::OK();
        }
    };

    template<typename K, typename V> struct wire_type<std::map<K, V>>
    {
        static std::string entry_signature() { return "{" + wire_type<K>::signature() + wire_type<V>::signature() + "}"; }
        static std::string signature() { return "a" + entry_signature(); }
        static value to_value(const std::map<K, V>& v)
        {
            std::vector<value> entries;
            entries.reserve(v.size());
            for (const auto& item : v)
                entries.push_back(value::make_dict_entry(wire_type<K>::to_value(item.first), wire_type<V>::to_value(item.second)));
            return value::make_array(entry_signature(), std::move(entries));
        }
        static int from_value(const value& v, std::map<K, V>& out)
        {
            if (v.signature() != signature())
                return error::TYPE_MISMATCH();
            std::map<K, V> items;
            for (auto& entry : v.children())
            {
                if (entry.children().size() != 2)
                    return error::TYPE_MISMATCH();
                K key{};
                V val{};
                auto ret = wire_type<K>::from_value(entry.children()[0], key);
                if (ret != error::OK())
                    return ret;
                ret = wire_type<V>::from_value(entry.children()[1], val);
                if (ret != error::OK())
                    return ret;
                items.emplace(std::move(key), std::move(val));
            }
            out = std::move(items);
            return error::OK();
        }
    };

    template<typename... Ts> struct wire_type<std::tuple<Ts...>>
    {
        static_assert(sizeof...(Ts) > 0, "an empty struct has no wire representation");

        static std::string signature()
        {
            std::string sig = "(";
            (sig.append(wire_type<Ts>::signature()), ...);
            sig += ")";
            return sig;
        }
        static value to_value(const std::tuple<Ts...>& v)
        {
            return to_value_impl(v, std::index_sequence_for<Ts...>{});
        }
        static int from_value(const value& v, std::tuple<Ts...>& out)
        {
            if (v.signature() != signature() || v.children().size() != sizeof...(Ts))
                return error::TYPE_MISMATCH();
            return from_value_impl(v, out, std::index_sequence_for<Ts...>{});
        }

    private:
        template<std::size_t... Is> static value to_value_impl(const std::tuple<Ts...>& v, std::index_sequence<Is...>)
        {
            return value::make_struct({wire_type<Ts>::to_value(std::get<Is>(v))...});
        }
        template<std::size_t... Is>
        static int from_value_impl(const value& v, std::tuple<Ts...>& out, std::index_sequence<Is...>)
        {
            int ret = error::OK();
            ((ret = (ret == error::OK() ? wire_type<Ts>::from_value(v.children()[Is], std::get<Is>(out)) : ret)), ...);
            return ret;
        }
    };

    template<typename... Ts> std::string signature_of()
    {
        std::string sig;
        (sig.append(wire_type<Ts>::signature()), ...);
        return sig;
    }

    template<typename... Ts> std::vector<value> marshal_values(const Ts&... args)
    {
        std::vector<value> body;
        body.reserve(sizeof...(Ts));
        (body.push_back(wire_type<Ts>::to_value(args)), ...);
        return body;
    }

    // Unpacks a message body positionally. The whole body signature is checked before any
    // output is written.
    template<typename... Ts> int unmarshal_values(const std::vector<value>& body, Ts&... out)
    {
        if (body.size() != sizeof...(Ts) || body_signature(body) != signature_of<Ts...>())
            return error::TYPE_MISMATCH();
        std::size_t index = 0;
        int ret = error::OK();
        ((ret = (ret == error::OK() ? wire_type<Ts>::from_value(body[index++], out) : ret)), ...);
        return ret;
    }
}
