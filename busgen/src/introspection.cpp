/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>

#include <fmt/format.h>
#include <pugixml.hpp>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/introspection.h>
#include <busgen/internal/logger.h>
#include <busgen/internal/naming.h>

namespace busgen
{
    namespace
    {
        std::vector<std::string> split_lines(std::string_view text)
        {
            std::vector<std::string> lines;
            std::size_t start = 0;
            while (true)
            {
                auto end = text.find('\n', start);
                auto line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                lines.emplace_back(line);
                if (end == std::string_view::npos)
                    break;
                start = end + 1;
            }
            return lines;
        }

        bool is_blank(const std::string& line)
        {
            return line.find_first_not_of(" \t") == std::string::npos;
        }

        std::string escape_attribute(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());
            for (auto c : text)
            {
                switch (c)
                {
                case '&':
                    out += "&amp;";
                    break;
                case '<':
                    out += "&lt;";
                    break;
                case '>':
                    out += "&gt;";
                    break;
                case '"':
                    out += "&quot;";
                    break;
                default:
                    out += c;
                }
            }
            return out;
        }

        std::string pad(int level)
        {
            return std::string(static_cast<std::size_t>(level) * 2, ' ');
        }

        // "--" may not appear inside an XML comment, each one is written as "- -" so a doc
        // containing it does not survive a write and parse unchanged
        std::string escape_comment(std::string line)
        {
            std::size_t pos = 0;
            while ((pos = line.find("--", pos)) != std::string::npos)
            {
                line.insert(pos + 1, " ");
                pos += 2;
            }
            return line;
        }

        void write_doc(std::ostream& os, const std::string& doc, int level)
        {
            if (doc.empty())
                return;
            auto indent = pad(level);
            os << indent << "<!--\n";
            for (auto& line : split_lines(doc))
            {
                if (line.empty())
                    os << "\n";
                else
                    os << indent << " " << escape_comment(line) << "\n";
            }
            os << indent << " -->\n";
        }

        void write_annotations(std::ostream& os, const std::vector<annotation>& annotations, int level)
        {
            for (auto& a : annotations)
            {
                // carried by property_spec::notify instead
                if (a.name == emits_changed_signal_annotation)
                    continue;
                os << pad(level) << "<annotation name=\"" << escape_attribute(a.name) << "\" value=\""
                   << escape_attribute(a.value) << "\"/>\n";
            }
        }

        std::size_t written_annotation_count(const std::vector<annotation>& annotations)
        {
            std::size_t count = 0;
            for (auto& a : annotations)
            {
                if (a.name != emits_changed_signal_annotation)
                    ++count;
            }
            return count;
        }

        void write_arg(std::ostream& os, const arg_spec& arg, bool with_direction, int level)
        {
            os << pad(level) << "<arg";
            if (!arg.name.empty())
                os << " name=\"" << escape_attribute(arg.name) << "\"";
            os << " type=\"" << escape_attribute(arg.type.to_string()) << "\"";
            if (with_direction)
                os << " direction=\"" << to_string(arg.direction) << "\"";
            if (arg.annotations.empty())
            {
                os << "/>\n";
                return;
            }
            os << ">\n";
            write_annotations(os, arg.annotations, level + 1);
            os << pad(level) << "</arg>\n";
        }

        change_notify interface_default_notify(const interface_spec& spec)
        {
            change_notify notify = change_notify::yes;
            if (auto* a = find_annotation(spec.annotations, emits_changed_signal_annotation))
                parse_change_notify(a->value, notify);
            return notify;
        }

        void write_node(std::ostream& os, const introspection_node& node, int level)
        {
            os << pad(level) << "<node";
            if (!node.name.empty())
                os << " name=\"" << escape_attribute(node.name) << "\"";
            if (level > 0 && node.interfaces.empty() && node.children.empty())
            {
                os << "/>\n";
                return;
            }
            os << ">\n";
            for (auto& iface : node.interfaces)
                write_interface_xml(iface, os, level + 1);
            for (auto& child : node.children)
                write_node(os, child, level + 1);
            os << pad(level) << "</node>\n";
        }

        // parse side

        class document_parser
        {
            std::string& diagnostic_;
            std::vector<std::string>* rejected_;

            int missing(const pugi::xml_node& element, const char* attribute)
            {
                diagnostic_ = fmt::format("<{}> at offset {} is missing the '{}' attribute",
                    element.name(),
                    static_cast<long long>(element.offset_debug()),
                    attribute);
                return error::XML_MISSING_ATTRIBUTE();
            }

            int required(const pugi::xml_node& element, const char* attribute, std::string& out)
            {
                auto attr = element.attribute(attribute);
                if (!attr)
                    return missing(element, attribute);
                out = attr.value();
                return error::OK();
            }

            int parse_annotation(const pugi::xml_node& element, std::vector<annotation>& out)
            {
                annotation a;
                auto ret = required(element, "name", a.name);
                if (ret != error::OK())
                    return ret;
                a.value = element.attribute("value").value();
                out.push_back(std::move(a));
                return error::OK();
            }

            int parse_arg(const pugi::xml_node& element, const std::string& member, arg_spec& out)
            {
                out.name = element.attribute("name").value();
                std::string type_text;
                auto ret = required(element, "type", type_text);
                if (ret != error::OK())
                    return ret;
                type_node node;
                std::size_t position = 0;
                ret = parse_single_type(type_text, node, &position);
                if (ret != error::OK())
                {
                    diagnostic_ = fmt::format("argument '{}' of '{}' has an invalid type '{}' ({} at {})",
                        out.name,
                        member,
                        type_text,
                        error::to_string(ret),
                        position);
                    return error::XML_INVALID_ATTRIBUTE();
                }
                out.type = type_signature({std::move(node)});

                auto direction = element.attribute("direction");
                if (direction && !parse_direction(direction.value(), out.direction))
                {
                    diagnostic_
                        = fmt::format("argument '{}' of '{}' has an invalid direction '{}'", out.name, member, direction.value());
                    return error::XML_INVALID_ATTRIBUTE();
                }

                for (auto child : element.children("annotation"))
                {
                    ret = parse_annotation(child, out.annotations);
                    if (ret != error::OK())
                        return ret;
                }
                return error::OK();
            }

            int parse_method(const pugi::xml_node& element, method_spec& out)
            {
                auto ret = required(element, "name", out.wire_name);
                if (ret != error::OK())
                    return ret;
                out.native_name = to_snake_case(out.wire_name);
                for (auto child : element.children())
                {
                    std::string_view name = child.name();
                    if (name == "arg")
                    {
                        arg_spec arg;
                        ret = parse_arg(child, out.wire_name, arg);
                        if (ret != error::OK())
                            return ret;
                        if (arg.direction == arg_direction::in)
                            out.inputs.push_back(std::move(arg));
                        else
                            out.outputs.push_back(std::move(arg));
                    }
                    else if (name == "annotation")
                    {
                        ret = parse_annotation(child, out.annotations);
                        if (ret != error::OK())
                            return ret;
                    }
                }
                return error::OK();
            }

            int parse_signal(const pugi::xml_node& element, signal_spec& out)
            {
                auto ret = required(element, "name", out.wire_name);
                if (ret != error::OK())
                    return ret;
                out.native_name = to_snake_case(out.wire_name);
                for (auto child : element.children())
                {
                    std::string_view name = child.name();
                    if (name == "arg")
                    {
                        arg_spec arg;
                        ret = parse_arg(child, out.wire_name, arg);
                        if (ret != error::OK())
                            return ret;
                        out.args.push_back(std::move(arg));
                    }
                    else if (name == "annotation")
                    {
                        ret = parse_annotation(child, out.annotations);
                        if (ret != error::OK())
                            return ret;
                    }
                }
                return error::OK();
            }

            // explicit_notify reports whether the property carried its own EmitsChangedSignal
            int parse_property(const pugi::xml_node& element, property_spec& out, bool& explicit_notify)
            {
                auto ret = required(element, "name", out.wire_name);
                if (ret != error::OK())
                    return ret;
                out.native_name = to_snake_case(out.wire_name);

                std::string type_text;
                ret = required(element, "type", type_text);
                if (ret != error::OK())
                    return ret;
                type_node node;
                if (parse_single_type(type_text, node) != error::OK())
                {
                    diagnostic_ = fmt::format("property '{}' has an invalid type '{}'", out.wire_name, type_text);
                    return error::XML_INVALID_ATTRIBUTE();
                }
                out.type = type_signature({std::move(node)});

                std::string access;
                ret = required(element, "access", access);
                if (ret != error::OK())
                    return ret;
                if (!parse_access(access, out.access))
                {
                    diagnostic_ = fmt::format("property '{}' has an invalid access '{}'", out.wire_name, access);
                    return error::XML_INVALID_ATTRIBUTE();
                }

                explicit_notify = false;
                for (auto child : element.children("annotation"))
                {
                    std::vector<annotation> annotations;
                    ret = parse_annotation(child, annotations);
                    if (ret != error::OK())
                        return ret;
                    auto& a = annotations.front();
                    if (a.name == emits_changed_signal_annotation)
                    {
                        if (!parse_change_notify(a.value, out.notify))
                        {
                            diagnostic_ = fmt::format("property '{}' has an invalid {} value '{}'",
                                out.wire_name,
                                emits_changed_signal_annotation,
                                a.value);
                            return error::XML_INVALID_ATTRIBUTE();
                        }
                        explicit_notify = true;
                        continue;
                    }
                    out.annotations.push_back(std::move(a));
                }
                return error::OK();
            }

            int parse_interface(const pugi::xml_node& element, interface_spec& out)
            {
                auto ret = required(element, "name", out.name);
                if (ret != error::OK())
                    return ret;

                std::vector<bool> explicit_notify;
                std::string pending_doc;
                for (auto child : element.children())
                {
                    if (child.type() == pugi::node_comment)
                    {
                        pending_doc = normalise_doc_comment(child.value());
                        continue;
                    }
                    if (child.type() != pugi::node_element)
                    {
                        pending_doc.clear();
                        continue;
                    }

                    std::string_view name = child.name();
                    if (name == "method")
                    {
                        method_spec method;
                        method.doc = pending_doc;
                        ret = parse_method(child, method);
                        if (ret != error::OK())
                            return ret;
                        out.methods.push_back(std::move(method));
                    }
                    else if (name == "signal")
                    {
                        signal_spec signal;
                        signal.doc = pending_doc;
                        ret = parse_signal(child, signal);
                        if (ret != error::OK())
                            return ret;
                        out.signals.push_back(std::move(signal));
                    }
                    else if (name == "property")
                    {
                        property_spec property;
                        property.doc = pending_doc;
                        bool has_notify = false;
                        ret = parse_property(child, property, has_notify);
                        if (ret != error::OK())
                            return ret;
                        out.properties.push_back(std::move(property));
                        explicit_notify.push_back(has_notify);
                    }
                    else if (name == "annotation")
                    {
                        ret = parse_annotation(child, out.annotations);
                        if (ret != error::OK())
                            return ret;
                    }
                    pending_doc.clear();
                }

                if (auto* a = find_annotation(out.annotations, emits_changed_signal_annotation))
                {
                    change_notify inherited = change_notify::yes;
                    if (!parse_change_notify(a->value, inherited))
                    {
                        diagnostic_ = fmt::format(
                            "interface '{}' has an invalid {} value '{}'", out.name, emits_changed_signal_annotation, a->value);
                        return error::XML_INVALID_ATTRIBUTE();
                    }
                    for (std::size_t i = 0; i < out.properties.size(); ++i)
                    {
                        if (!explicit_notify[i])
                            out.properties[i].notify = inherited;
                    }
                }
                return error::OK();
            }

        public:
            document_parser(std::string& diagnostic, std::vector<std::string>* rejected)
                : diagnostic_(diagnostic)
                , rejected_(rejected)
            {
            }

            // the name is optional on the root, a child without one is skipped by the caller
            int parse_node(const pugi::xml_node& element, introspection_node& out)
            {
                out.name = element.attribute("name").value();

                std::string pending_doc;
                for (auto child : element.children())
                {
                    if (child.type() == pugi::node_comment)
                    {
                        pending_doc = normalise_doc_comment(child.value());
                        continue;
                    }
                    if (child.type() != pugi::node_element)
                    {
                        pending_doc.clear();
                        continue;
                    }

                    std::string_view name = child.name();
                    if (name == "interface")
                    {
                        interface_spec iface;
                        iface.doc = pending_doc;
                        auto ret = parse_interface(child, iface);
                        if (ret != error::OK())
                            return ret;

                        std::string reason;
                        ret = validate_interface(iface, reason);
                        if (ret != error::OK())
                        {
                            // reported by the caller when it collects the rejections
                            if (rejected_)
                                rejected_->push_back(fmt::format("{}: {}", iface.name, reason));
                            else
                                BUSGEN_WARNING("skipping interface {}: {}", iface.name, reason);
                        }
                        else
                            out.interfaces.push_back(std::move(iface));
                    }
                    else if (name == "node")
                    {
                        introspection_node sub_node;
                        auto ret = parse_node(child, sub_node);
                        if (ret != error::OK())
                            return ret;
                        if (sub_node.name.empty())
                            BUSGEN_WARNING("skipping a child node without a name under '{}'", out.name);
                        else
                            out.children.push_back(std::move(sub_node));
                    }
                    pending_doc.clear();
                }
                return error::OK();
            }
        };
    }

    std::string normalise_doc_comment(std::string_view comment)
    {
        auto lines = split_lines(comment);
        for (auto& line : lines)
        {
            auto end = line.find_last_not_of(" \t");
            line.erase(end == std::string::npos ? 0 : end + 1);
        }
        while (!lines.empty() && lines.front().empty())
            lines.erase(lines.begin());
        while (!lines.empty() && lines.back().empty())
            lines.pop_back();

        std::size_t common = std::string::npos;
        for (auto& line : lines)
        {
            if (is_blank(line))
                continue;
            auto indent = line.find_first_not_of(" \t");
            if (indent < common)
                common = indent;
        }

        std::string doc;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                doc += '\n';
            if (!lines[i].empty())
                doc += lines[i].substr(common);
        }
        return doc;
    }

    int parse_introspection(
        std::string_view xml, introspection_node& out, std::string& diagnostic, std::vector<std::string>* rejected)
    {
        pugi::xml_document doc;
        auto result = doc.load_buffer(xml.data(), xml.size(), pugi::parse_default | pugi::parse_comments);
        if (!result)
        {
            diagnostic = fmt::format("malformed introspection document: {} at offset {}",
                result.description(),
                static_cast<long long>(result.offset));
            return error::XML_PARSE_ERROR();
        }

        auto root = doc.document_element();
        if (std::string_view(root.name()) != "node")
        {
            diagnostic = fmt::format("expected a <node> root element, found <{}>", root.name());
            return error::XML_PARSE_ERROR();
        }

        introspection_node node;
        document_parser parser(diagnostic, rejected);
        auto ret = parser.parse_node(root, node);
        if (ret != error::OK())
            return ret;
        out = std::move(node);
        return error::OK();
    }

    void write_interface_xml(const interface_spec& spec, std::ostream& os, int indent_level)
    {
        auto level = indent_level + 1;
        write_doc(os, spec.doc, indent_level);
        os << pad(indent_level) << "<interface name=\"" << escape_attribute(spec.name) << "\">\n";

        // interface level annotations are written as given, EmitsChangedSignal included
        for (auto& a : spec.annotations)
        {
            os << pad(level) << "<annotation name=\"" << escape_attribute(a.name) << "\" value=\""
               << escape_attribute(a.value) << "\"/>\n";
        }

        for (auto& method : spec.methods)
        {
            write_doc(os, method.doc, level);
            os << pad(level) << "<method name=\"" << escape_attribute(method.wire_name) << "\">\n";
            for (auto& arg : method.inputs)
                write_arg(os, arg, true, level + 1);
            for (auto& arg : method.outputs)
                write_arg(os, arg, true, level + 1);
            write_annotations(os, method.annotations, level + 1);
            os << pad(level) << "</method>\n";
        }

        for (auto& signal : spec.signals)
        {
            write_doc(os, signal.doc, level);
            os << pad(level) << "<signal name=\"" << escape_attribute(signal.wire_name) << "\">\n";
            for (auto& arg : signal.args)
                write_arg(os, arg, false, level + 1);
            write_annotations(os, signal.annotations, level + 1);
            os << pad(level) << "</signal>\n";
        }

        auto default_notify = interface_default_notify(spec);
        for (auto& property : spec.properties)
        {
            write_doc(os, property.doc, level);
            os << pad(level) << "<property name=\"" << escape_attribute(property.wire_name) << "\" type=\""
               << escape_attribute(property.type.to_string()) << "\" access=\"" << to_string(property.access) << "\"";
            bool notify_annotation = property.notify != default_notify;
            if (!notify_annotation && written_annotation_count(property.annotations) == 0)
            {
                os << "/>\n";
                continue;
            }
            os << ">\n";
            if (notify_annotation)
            {
                os << pad(level + 1) << "<annotation name=\"" << emits_changed_signal_annotation << "\" value=\""
                   << to_string(property.notify) << "\"/>\n";
            }
            write_annotations(os, property.annotations, level + 1);
            os << pad(level) << "</property>\n";
        }

        os << pad(indent_level) << "</interface>\n";
    }

    std::string interface_xml(const interface_spec& spec, int indent_level)
    {
        std::ostringstream os;
        write_interface_xml(spec, os, indent_level);
        return os.str();
    }

    std::string introspect_xml(const introspection_node& node)
    {
        std::ostringstream os;
        os << introspection_doctype;
        write_node(os, node, 0);
        return os.str();
    }

    interface_partition partition_interfaces(const introspection_node& node, const std::string& prefix)
    {
        interface_partition partition;
        for (auto& iface : node.interfaces)
        {
            if (iface.name.compare(0, prefix.size(), prefix) == 0)
                partition.standard.push_back(&iface);
            else
                partition.needed.push_back(&iface);
        }
        return partition;
    }
}
