/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/error_codes.h>
#include <busgen/internal/signature.h>

namespace busgen
{
    namespace
    {
        struct nesting
        {
            int array = 0;
            int paren = 0;

            int total() const { return array + paren; }
        };

        class signature_parser
        {
            std::string_view text_;
            std::size_t pos_ = 0;
            nesting nest_;

        public:
            explicit signature_parser(std::string_view text)
                : text_(text)
            {
            }

            std::size_t position() const { return pos_; }
            bool at_end() const { return pos_ >= text_.size(); }

            int parse_complete_type(type_node& out)
            {
                if (at_end())
                    return error::SIGNATURE_UNEXPECTED_END();

                char c = text_[pos_];
                if (is_basic_type_code(c) || c == 'v')
                {
                    out.code = static_cast<type_code>(c);
                    ++pos_;
                    return error::OK();
                }
                if (c == 'a')
                    return parse_array(out);
                if (c == '(')
                    return parse_struct(out);
                if (c == ')' || c == '}')
                    return error::SIGNATURE_UNMATCHED_CONTAINER();
                if (c == '{')
                    return error::SIGNATURE_INVALID_DICT_ENTRY();
                return error::SIGNATURE_UNKNOWN_TYPE_CODE();
            }

        private:
            int parse_array(type_node& out)
            {
                if (++nest_.array > max_array_nesting || nest_.total() > max_total_nesting)
                    return error::SIGNATURE_NESTING_TOO_DEEP();
                ++pos_;
                out.code = type_code::array;

                type_node element;
                int ret = at_end()                 ? error::SIGNATURE_UNEXPECTED_END()
                          : (text_[pos_] == '{') ? parse_dict_entry(element)
                                                 : parse_complete_type(element);
                if (ret != error::OK())
                    return ret;
                out.children.push_back(std::move(element));
                --nest_.array;
                return error::OK();
            }

            int parse_struct(type_node& out)
            {
                if (++nest_.paren > max_struct_nesting || nest_.total() > max_total_nesting)
                    return error::SIGNATURE_NESTING_TOO_DEEP();
                ++pos_;
                out.code = type_code::struct_;

                while (true)
                {
                    if (at_end())
                        return error::SIGNATURE_UNMATCHED_CONTAINER();
                    if (text_[pos_] == ')')
                        break;
                    type_node field;
                    auto ret = parse_complete_type(field);
                    if (ret != error::OK())
                        return ret;
                    out.children.push_back(std::move(field));
                }
                if (out.children.empty())
                    return error::SIGNATURE_EMPTY_STRUCT();
                ++pos_;
                --nest_.paren;
                return error::OK();
            }

            // only reachable directly after an 'a'
            int parse_dict_entry(type_node& out)
            {
                if (++nest_.paren > max_struct_nesting || nest_.total() > max_total_nesting)
                    return error::SIGNATURE_NESTING_TOO_DEEP();
                ++pos_;
                out.code = type_code::dict_entry;

                if (at_end())
                    return error::SIGNATURE_UNMATCHED_CONTAINER();
                if (!is_basic_type_code(text_[pos_]))
                {
                    if (text_[pos_] == '}')
                        return error::SIGNATURE_INVALID_DICT_ENTRY();
                    type_node probe;
                    auto ret = parse_complete_type(probe);
                    return ret != error::OK() ? ret : error::SIGNATURE_INVALID_DICT_ENTRY();
                }
                type_node key;
                key.code = static_cast<type_code>(text_[pos_++]);

                if (at_end())
                    return error::SIGNATURE_UNMATCHED_CONTAINER();
                if (text_[pos_] == '}')
                    return error::SIGNATURE_INVALID_DICT_ENTRY();
                type_node val;
                auto ret = parse_complete_type(val);
                if (ret != error::OK())
                    return ret;

                if (at_end())
                    return error::SIGNATURE_UNMATCHED_CONTAINER();
                if (text_[pos_] != '}')
                    return error::SIGNATURE_INVALID_DICT_ENTRY();
                ++pos_;
                --nest_.paren;
                out.children.push_back(std::move(key));
                out.children.push_back(std::move(val));
                return error::OK();
            }
        };

        void append_text(const type_node& node, std::string& out)
        {
            switch (node.code)
            {
            case type_code::array:
                out += 'a';
                for (auto& child : node.children)
                    append_text(child, out);
                break;
            case type_code::struct_:
                out += '(';
                for (auto& child : node.children)
                    append_text(child, out);
                out += ')';
                break;
            case type_code::dict_entry:
                out += '{';
                for (auto& child : node.children)
                    append_text(child, out);
                out += '}';
                break;
            default:
                out += static_cast<char>(node.code);
                break;
            }
        }
    }

    bool is_basic_type_code(char code)
    {
        switch (code)
        {
        case 'y':
        case 'b':
        case 'n':
        case 'q':
        case 'i':
        case 'u':
        case 'x':
        case 't':
        case 'd':
        case 'h':
        case 's':
        case 'o':
        case 'g':
            return true;
        default:
            return false;
        }
    }

    bool is_fixed_type_code(char code)
    {
        return is_basic_type_code(code) && code != 's' && code != 'o' && code != 'g';
    }

    bool type_node::is_basic() const
    {
        return is_basic_type_code(static_cast<char>(code));
    }

    bool type_node::is_dict() const
    {
        return code == type_code::array && children.size() == 1 && children[0].code == type_code::dict_entry;
    }

    bool type_node::operator==(const type_node& other) const
    {
        return code == other.code && children == other.children;
    }

    std::string type_signature::to_string() const
    {
        return to_text(*this);
    }

    type_signature type_signature::as_struct() const
    {
        type_node node;
        node.code = type_code::struct_;
        node.children = types_;
        return type_signature({node});
    }

    int parse_signature(std::string_view text, type_signature& out, std::size_t* error_position)
    {
        if (text.size() > max_signature_length)
        {
            if (error_position)
                *error_position = max_signature_length;
            return error::SIGNATURE_TOO_LONG();
        }

        signature_parser parser(text);
        std::vector<type_node> types;
        while (!parser.at_end())
        {
            type_node node;
            auto ret = parser.parse_complete_type(node);
            if (ret != error::OK())
            {
                if (error_position)
                    *error_position = parser.position();
                return ret;
            }
            types.push_back(std::move(node));
        }
        out = type_signature(std::move(types));
        return error::OK();
    }

    int parse_single_type(std::string_view text, type_node& out, std::size_t* error_position)
    {
        type_signature sig;
        auto ret = parse_signature(text, sig, error_position);
        if (ret != error::OK())
            return ret;
        if (sig.empty())
        {
            if (error_position)
                *error_position = 0;
            return error::SIGNATURE_UNEXPECTED_END();
        }
        if (!sig.is_single_complete_type())
        {
            if (error_position)
                *error_position = to_text(sig.front()).size();
            return error::INVALID_ARGS();
        }
        out = sig.front();
        return error::OK();
    }

    std::string to_text(const type_signature& signature)
    {
        std::string out;
        for (auto& node : signature.types())
            append_text(node, out);
        return out;
    }

    std::string to_text(const type_node& node)
    {
        std::string out;
        append_text(node, out);
        return out;
    }

    bool is_valid_signature(std::string_view text)
    {
        type_signature sig;
        return parse_signature(text, sig) == error::OK();
    }
}
