/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <busgen/internal/value.h>

namespace busgen
{
    value::value(bool v)
        : value("b", v)
    {
    }
    value::value(uint8_t v)
        : value("y", v)
    {
    }
    value::value(int16_t v)
        : value("n", v)
    {
    }
    value::value(uint16_t v)
        : value("q", v)
    {
    }
    value::value(int32_t v)
        : value("i", v)
    {
    }
    value::value(uint32_t v)
        : value("u", v)
    {
    }
    value::value(int64_t v)
        : value("x", v)
    {
    }
    value::value(uint64_t v)
        : value("t", v)
    {
    }
    value::value(double v)
        : value("d", v)
    {
    }
    value::value(std::string v)
        : value("s", scalar_type(std::move(v)))
    {
    }
    value::value(const char* v)
        : value("s", scalar_type(std::string(v)))
    {
    }
    value::value(const object_path& v)
        : value("o", scalar_type(v.value))
    {
    }
    value::value(const signature_text& v)
        : value("g", scalar_type(v.value))
    {
    }
    value::value(const unix_fd& v)
        : value("h", scalar_type(v.index))
    {
    }

    value value::make_array(const std::string& element_signature, std::vector<value> elements)
    {
        value ret("a" + element_signature, scalar_type());
        ret.children_ = std::move(elements);
        return ret;
    }

    value value::make_struct(std::vector<value> fields)
    {
        std::string sig = "(";
        for (auto& field : fields)
            sig += field.signature();
        sig += ")";
        value ret(std::move(sig), scalar_type());
        ret.children_ = std::move(fields);
        return ret;
    }

    value value::make_dict_entry(value key, value val)
    {
        value ret("{" + key.signature() + val.signature() + "}", scalar_type());
        ret.children_.push_back(std::move(key));
        ret.children_.push_back(std::move(val));
        return ret;
    }

    value value::make_variant(value inner)
    {
        value ret("v", scalar_type());
        ret.children_.push_back(std::move(inner));
        return ret;
    }

    std::string value::element_signature() const
    {
        if (code() != 'a')
            return {};
        return signature_.substr(1);
    }

    std::string value::to_string() const
    {
        switch (code())
        {
        case 'b':
            return std::get<bool>(scalar_) ? "true" : "false";
        case 'y':
            return std::to_string(std::get<uint8_t>(scalar_));
        case 'n':
            return std::to_string(std::get<int16_t>(scalar_));
        case 'q':
            return std::to_string(std::get<uint16_t>(scalar_));
        case 'i':
            return std::to_string(std::get<int32_t>(scalar_));
        case 'u':
        case 'h':
            return std::to_string(std::get<uint32_t>(scalar_));
        case 'x':
            return std::to_string(std::get<int64_t>(scalar_));
        case 't':
            return std::to_string(std::get<uint64_t>(scalar_));
        case 'd':
            return fmt::format("{}", std::get<double>(scalar_));
        case 's':
        case 'o':
        case 'g':
            return fmt::format("\"{}\"", std::get<std::string>(scalar_));
        case 'v':
            return fmt::format("<{}>", children_.empty() ? std::string() : children_[0].to_string());
        case 'a':
        case '(':
        case '{':
        {
            std::string out(1, code() == 'a' ? '[' : code());
            for (std::size_t i = 0; i < children_.size(); ++i)
            {
                if (i)
                    out += code() == '{' ? ": " : ", ";
                out += children_[i].to_string();
            }
            out += code() == 'a' ? ']' : (code() == '(' ? ')' : '}');
            return out;
        }
        default:
            return "<invalid>";
        }
    }

    bool value::operator==(const value& other) const
    {
        return signature_ == other.signature_ && scalar_ == other.scalar_ && children_ == other.children_;
    }

    std::string body_signature(const std::vector<value>& body)
    {
        std::string sig;
        for (auto& arg : body)
            sig += arg.signature();
        return sig;
    }
}
