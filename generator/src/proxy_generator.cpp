/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include "proxy_generator.h"
#include "type_utils.h"

namespace busgen
{
    namespace generator
    {
        const std::set<std::string>& reserved_member_names()
        {
            static const std::set<std::string> names = {"get_transport",
                "destination",
                "path",
                "interface_name",
                "call_raw",
                "send_raw",
                "call_method",
                "call_method_returning",
                "call_method_returning_tuple",
                "call_method_no_reply",
                "get_property",
                "set_property",
                "get_property_value",
                "set_property_value",
                "get_all_properties",
                "make_signal_subscription",
                "get_interface_name",
                "introspection_xml",
                "bind",
                "get_dispatcher",
                "transport_",
                "destination_",
                "path_",
                "interface_name_",
                "dispatcher_"};
            return names;
        }

        const std::set<std::string>& reserved_local_names()
        {
            static const std::set<std::string> names
                = {"result", "call", "reply", "ret", "new_value", "current", "native", "subscription", "signal", "decode"};
            return names;
        }

        namespace proxy_generator
        {
            namespace
            {
                void write_doc(writer& proxy, const std::string& doc)
                {
                    for (auto& line : doc_lines(doc))
                        proxy.write_line(line.empty() ? "//" : "// " + line);
                }

                void write_member_header(writer& proxy, const std::string& doc, bool deprecated, const std::string& native, const std::string& wire)
                {
                    write_doc(proxy, doc);
                    if (needs_explicit_wire_name(native, wire))
                        proxy("// wire name: {}", wire);
                    if (deprecated)
                        proxy("[[deprecated]]");
                }

                void write_method(writer& proxy, const method_spec& method, const std::string& name)
                {
                    auto params = make_param_names(method.inputs, reserved_local_names());
                    write_member_header(proxy, method.doc, method.is_deprecated(), method.native_name, method.wire_name);

                    proxy.print_tabs();
                    proxy.raw("CORO_TASK(int) {}(", name);
                    bool has_params = false;
                    for (std::size_t i = 0; i < method.inputs.size(); ++i)
                    {
                        if (has_params)
                            proxy.raw(", ");
                        proxy.raw("{} {}", native_param_type(method.inputs[i].type.front()), params[i]);
                        has_params = true;
                    }
                    bool no_reply = method.is_no_reply();
                    if (!no_reply && !method.outputs.empty())
                    {
                        if (has_params)
                            proxy.raw(", ");
                        proxy.raw("{}& result", native_result_type(method));
                    }
                    proxy.raw(")\n");
                    proxy("{{");

                    std::string args;
                    for (auto& param : params)
                        args += ", " + param;
                    auto wire = quoted(method.wire_name);
                    if (no_reply)
                        proxy("CO_RETURN CO_AWAIT call_method_no_reply({}{});", wire, args);
                    else if (method.outputs.empty())
                        proxy("CO_RETURN CO_AWAIT call_method({}{});", wire, args);
                    else if (method.outputs.size() == 1)
                        proxy("CO_RETURN CO_AWAIT call_method_returning({}, result{});", wire, args);
                    else
                        proxy("CO_RETURN CO_AWAIT call_method_returning_tuple({}, result{});", wire, args);
                    proxy("}}");
                }

                void write_property(writer& proxy, const property_spec& property, const std::string& getter, const std::string& setter)
                {
                    auto type_name = native_type_name(property.type);
                    auto wire = quoted(property.wire_name);
                    if (property.readable())
                    {
                        write_member_header(
                            proxy, property.doc, property.is_deprecated(), property.native_name, property.wire_name);
                        proxy("CORO_TASK(int) {}({}& result)", getter, type_name);
                        proxy("{{");
                        proxy("CO_RETURN CO_AWAIT get_property({}, result);", wire);
                        proxy("}}");
                    }
                    // constant properties never get a setter, whatever their access says
                    if (property.has_setter())
                    {
                        if (!property.readable())
                            write_member_header(
                                proxy, property.doc, property.is_deprecated(), property.native_name, property.wire_name);
                        else if (property.is_deprecated())
                            proxy("[[deprecated]]");
                        proxy("CORO_TASK(int) {}({} new_value)", setter, native_param_type(property.type.front()));
                        proxy("{{");
                        proxy("CO_RETURN CO_AWAIT set_property({}, new_value);", wire);
                        proxy("}}");
                    }
                }

                void write_signal(writer& proxy, const signal_spec& signal, const std::string& receiver, const std::string& args_name)
                {
                    auto fields = make_param_names(signal.args, reserved_local_names());
                    proxy("// arguments of {}", signal.wire_name);
                    proxy("struct {}", args_name);
                    proxy("{{");
                    for (std::size_t i = 0; i < signal.args.size(); ++i)
                        proxy("{} {}{{}};", native_type_name(signal.args[i].type), fields[i]);
                    if (!signal.args.empty())
                        proxy("");
                    std::string field_list;
                    for (std::size_t i = 0; i < fields.size(); ++i)
                        field_list += (i ? ", " : "") + fields[i];
                    proxy("int decode(busgen::received_signal& signal) {{ return signal.args({}); }}", field_list);
                    proxy("}};");
                    proxy("");

                    write_member_header(proxy, signal.doc, signal.is_deprecated(), signal.native_name, signal.wire_name);
                    proxy("int {}(busgen::signal_subscription& subscription)", receiver);
                    proxy("{{");
                    proxy("subscription = make_signal_subscription({});", quoted(signal.wire_name));
                    proxy("return subscription.subscribe();");
                    proxy("}}");
                }
            }

            void write_proxy(const interface_spec& spec, const std::string& class_name, const options& opts, writer& proxy)
            {
                auto names = make_binding_names(spec, reserved_member_names());

                write_doc(proxy, spec.doc);
                proxy("// client proxy for {}", spec.name);
                proxy("class {} : public busgen::proxy_base", class_name);
                proxy("{{");
                proxy("public:");
                proxy("static const char* get_interface_name() {{ return {}; }}", quoted(spec.name));
                proxy("");

                std::string service_default = opts.default_service.empty() ? "" : " = " + quoted(opts.default_service);
                std::string path_default = opts.default_path.empty() ? "" : " = " + quoted(opts.default_path);
                // a path default is only usable when the service has one too
                if (service_default.empty())
                    path_default.clear();
                proxy("{}(std::shared_ptr<busgen::transport> transport, std::string destination{}, std::string path{})",
                    class_name,
                    service_default,
                    path_default);
                proxy("    : busgen::proxy_base(std::move(transport), std::move(destination), std::move(path), {})",
                    quoted(spec.name));
                proxy("{{");
                proxy("}}");

                for (std::size_t i = 0; i < spec.methods.size(); ++i)
                {
                    proxy("");
                    write_method(proxy, spec.methods[i], names.methods[i]);
                }
                for (std::size_t i = 0; i < spec.properties.size(); ++i)
                {
                    proxy("");
                    write_property(proxy, spec.properties[i], names.getters[i], names.setters[i]);
                }
                for (std::size_t i = 0; i < spec.signals.size(); ++i)
                {
                    proxy("");
                    write_signal(proxy, spec.signals[i], names.receivers[i], names.signal_args[i]);
                }
                proxy("}};");
            }
        }
    }
}
