/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/introspection.h>

#include "dispatcher_generator.h"
#include "proxy_generator.h"
#include "type_utils.h"

namespace busgen
{
    namespace generator
    {
        namespace dispatcher_generator
        {
            namespace
            {
                std::set<std::string> argument_taken_names()
                {
                    auto taken = reserved_local_names();
                    taken.insert(reserved_member_names().begin(), reserved_member_names().end());
                    return taken;
                }

                std::string join(const std::vector<std::string>& items)
                {
                    std::string out;
                    for (std::size_t i = 0; i < items.size(); ++i)
                        out += (i ? ", " : "") + items[i];
                    return out;
                }

                void write_doc(writer& stub, const std::string& doc)
                {
                    for (auto& line : doc_lines(doc))
                        stub.write_line(line.empty() ? "//" : "// " + line);
                }

                std::string method_parameters(const method_spec& method, const std::vector<std::string>& params)
                {
                    std::vector<std::string> parts;
                    for (std::size_t i = 0; i < method.inputs.size(); ++i)
                        parts.push_back(native_param_type(method.inputs[i].type.front()) + " " + params[i]);
                    if (!method.outputs.empty())
                        parts.push_back(native_result_type(method) + "& result");
                    return join(parts);
                }

                void write_virtuals(const interface_spec& spec, const binding_names& names, writer& stub)
                {
                    auto taken = argument_taken_names();
                    for (std::size_t i = 0; i < spec.methods.size(); ++i)
                    {
                        auto& method = spec.methods[i];
                        write_doc(stub, method.doc);
                        stub("virtual CORO_TASK(int) {}({}) = 0;",
                            names.methods[i],
                            method_parameters(method, make_param_names(method.inputs, taken)));
                    }
                    for (std::size_t i = 0; i < spec.properties.size(); ++i)
                    {
                        auto& property = spec.properties[i];
                        write_doc(stub, property.doc);
                        if (property.readable())
                            stub("virtual CORO_TASK(int) {}({}& result) = 0;", names.getters[i], native_type_name(property.type));
                        if (property.has_setter())
                            stub("virtual CORO_TASK(int) {}({} new_value) = 0;",
                                names.setters[i],
                                native_param_type(property.type.front()));
                    }
                }

                void write_method_binding(const method_spec& method, const std::string& name, writer& stub)
                {
                    auto params = make_param_names(method.inputs, argument_taken_names());
                    bool has_inputs = !method.inputs.empty();
                    bool has_outputs = !method.outputs.empty();

                    stub("ret = dispatcher->add_method({},", quoted(method.wire_name));
                    stub.set_count(stub.get_count() + 1);
                    stub("[this](const busgen::message&{}, std::vector<busgen::value>&{}) -> CORO_TASK(int)",
                        has_inputs ? " call" : "",
                        has_outputs ? " reply" : "");
                    stub("{{");
                    for (std::size_t i = 0; i < method.inputs.size(); ++i)
                        stub("{} {}{{}};", native_type_name(method.inputs[i].type), params[i]);
                    if (has_inputs)
                    {
                        stub("if (busgen::unmarshal_values(call.body, {}) != busgen::error::OK())", join(params));
                        stub("    CO_RETURN busgen::error::INVALID_ARGS();");
                    }

                    auto args = params;
                    if (has_outputs)
                    {
                        stub("{} result{{}};", native_result_type(method));
                        args.push_back("result");
                    }
                    if (!has_outputs)
                    {
                        stub("CO_RETURN CO_AWAIT this->{}({});", name, join(args));
                    }
                    else
                    {
                        stub("auto ret = CO_AWAIT this->{}({});", name, join(args));
                        stub("if (ret != busgen::error::OK())");
                        stub("    CO_RETURN ret;");
                        if (method.outputs.size() == 1)
                            stub("reply = busgen::marshal_values(result);");
                        else
                            stub("reply = std::apply([](const auto&... outs) {{ return busgen::marshal_values(outs...); }}, "
                                 "result);");
                        stub("CO_RETURN busgen::error::OK();");
                    }
                    stub("}});");
                    stub.set_count(stub.get_count() - 1);
                    stub("if (ret != busgen::error::OK())");
                    stub("    return ret;");
                }

                void write_property_binding(const property_spec& property, const std::string& getter, const std::string& setter, writer& stub)
                {
                    auto type_name = native_type_name(property.type);
                    bool bind_setter = property.has_setter();

                    stub("ret = dispatcher->add_property({},", quoted(property.wire_name));
                    stub.set_count(stub.get_count() + 1);
                    if (property.readable())
                    {
                        stub("[this](busgen::value& result) -> CORO_TASK(int)");
                        stub("{{");
                        stub("{} current{{}};", type_name);
                        stub("auto ret = CO_AWAIT this->{}(current);", getter);
                        stub("if (ret != busgen::error::OK())");
                        stub("    CO_RETURN ret;");
                        stub("result = busgen::wire_type<{}>::to_value(current);", type_name);
                        stub("CO_RETURN busgen::error::OK();");
                        stub(bind_setter ? "}}," : "}});");
                    }
                    else
                        stub("busgen::property_getter{{}},");
                    if (bind_setter)
                    {
                        stub("[this](const busgen::value& new_value) -> CORO_TASK(int)");
                        stub("{{");
                        stub("{} native{{}};", type_name);
                        stub("if (busgen::wire_type<{}>::from_value(new_value, native) != busgen::error::OK())", type_name);
                        stub("    CO_RETURN busgen::error::INVALID_ARGS();");
                        stub("CO_RETURN CO_AWAIT this->{}(native);", setter);
                        stub("}});");
                    }
                    stub.set_count(stub.get_count() - 1);
                    stub("if (ret != busgen::error::OK())");
                    stub("    return ret;");
                }

                void write_bind(const interface_spec& spec, const binding_names& names, writer& stub)
                {
                    stub("// Registers the handlers on a new dispatcher for path, the dispatcher's interface is");
                    stub("// parsed back from introspection_xml() so both always agree.");
                    stub("int bind(std::shared_ptr<busgen::transport> transport, std::string path)");
                    stub("{{");
                    stub("busgen::introspection_node node;");
                    stub("std::string diagnostic;");
                    stub("auto ret = busgen::parse_introspection(");
                    stub("    std::string(\"<node>\\n\") + introspection_xml() + \"</node>\\n\", node, diagnostic);");
                    stub("if (ret != busgen::error::OK() || node.interfaces.size() != 1)");
                    stub("{{");
                    stub("BUSGEN_ERROR(\"cannot bind {{}}: {{}}\", get_interface_name(), diagnostic);");
                    stub("return ret != busgen::error::OK() ? ret : busgen::error::XML_PARSE_ERROR();");
                    stub("}}");
                    stub("auto dispatcher = std::make_shared<busgen::interface_dispatcher>(");
                    stub("    std::move(node.interfaces.front()), std::move(transport), std::move(path));");
                    for (std::size_t i = 0; i < spec.methods.size(); ++i)
                    {
                        stub("");
                        write_method_binding(spec.methods[i], names.methods[i], stub);
                    }
                    for (std::size_t i = 0; i < spec.properties.size(); ++i)
                    {
                        stub("");
                        write_property_binding(spec.properties[i], names.getters[i], names.setters[i], stub);
                    }
                    stub("");
                    stub("dispatcher_ = std::move(dispatcher);");
                    stub("return busgen::error::OK();");
                    stub("}}");
                }

                void write_emitters(const interface_spec& spec, const binding_names& names, writer& stub)
                {
                    auto taken = argument_taken_names();
                    for (std::size_t i = 0; i < spec.signals.size(); ++i)
                    {
                        auto& signal = spec.signals[i];
                        auto params = make_param_names(signal.args, taken);
                        std::vector<std::string> parts;
                        for (std::size_t j = 0; j < signal.args.size(); ++j)
                            parts.push_back(native_param_type(signal.args[j].type.front()) + " " + params[j]);

                        stub("");
                        write_doc(stub, signal.doc);
                        stub("CORO_TASK(int) {}({})", names.emitters[i], join(parts));
                        stub("{{");
                        stub("if (!dispatcher_)");
                        stub("    CO_RETURN busgen::error::TRANSPORT_ERROR();");
                        params.insert(params.begin(), quoted(signal.wire_name));
                        stub("CO_RETURN CO_AWAIT dispatcher_->emit({});", join(params));
                        stub("}}");
                    }
                    for (std::size_t i = 0; i < spec.properties.size(); ++i)
                    {
                        auto& property = spec.properties[i];
                        if (property.notify == change_notify::constant || property.notify == change_notify::no)
                            continue;
                        stub("");
                        stub("// announces a change of {} made outside the setter", property.wire_name);
                        stub("CORO_TASK(int) {}()", names.change_notifiers[i]);
                        stub("{{");
                        stub("if (!dispatcher_)");
                        stub("    CO_RETURN busgen::error::TRANSPORT_ERROR();");
                        stub("CO_RETURN CO_AWAIT dispatcher_->notify_property_changed({});", quoted(property.wire_name));
                        stub("}}");
                    }
                }
            }

            void write_dispatcher(const interface_spec& spec, const std::string& class_name, writer& stub)
            {
                auto names = make_binding_names(spec, reserved_member_names());

                stub("// server skeleton for {}", spec.name);
                stub("class {}", class_name);
                stub("{{");
                stub("std::shared_ptr<busgen::interface_dispatcher> dispatcher_;");
                stub("");
                stub("public:");
                stub("virtual ~{}() = default;", class_name);
                stub("");
                stub("static const char* get_interface_name() {{ return {}; }}", quoted(spec.name));
                stub("static const char* introspection_xml()");
                stub("{{");
                stub.print_tabs();
                stub.raw("return R\"__busgen__({})__busgen__\";\n", interface_xml(spec));
                stub("}}");
                stub("");
                write_virtuals(spec, names, stub);
                stub("");
                write_bind(spec, names, stub);
                stub("");
                stub("const std::shared_ptr<busgen::interface_dispatcher>& get_dispatcher() const {{ return dispatcher_; }}");
                write_emitters(spec, names, stub);
                stub("}};");
            }
        }
    }
}
