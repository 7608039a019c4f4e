/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/introspection.h>
#include <busgen/internal/logger.h>

namespace
{
    const char* sample_document = R"(<!DOCTYPE node PUBLIC "-//freedesktop//DTD D-BUS Object Introspection 1.0//EN"
 "http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd">
<node name="/org/example/Sensor">
  <interface name="org.freedesktop.DBus.Peer">
    <method name="Ping"/>
    <method name="GetMachineId">
      <arg type="s" name="machine_uuid" direction="out"/>
    </method>
  </interface>
  <!--
      The sensor interface.
        Indented line.
  -->
  <interface name="org.example.Sensor">
    <annotation name="org.freedesktop.DBus.Property.EmitsChangedSignal" value="invalidates"/>
    <method name="Calibrate">
      <arg name="offset" type="d"/>
      <arg name="accepted" type="b" direction="out"/>
    </method>
    <signal name="Threshold">
      <arg name="level" type="d"/>
    </signal>
    <property name="Level" type="d" access="read"/>
    <property name="Serial" type="s" access="read">
      <annotation name="org.freedesktop.DBus.Property.EmitsChangedSignal" value="const"/>
    </property>
  </interface>
  <node name="child"/>
</node>
)";

    int parse(const std::string& xml, busgen::introspection_node& node, std::vector<std::string>* rejected = nullptr)
    {
        std::string diagnostic;
        return busgen::parse_introspection(xml, node, diagnostic, rejected);
    }
}

TEST(introspection, parses_document)
{
    busgen::introspection_node node;
    std::string diagnostic;
    ASSERT_EQ(busgen::parse_introspection(sample_document, node, diagnostic), busgen::error::OK()) << diagnostic;

    EXPECT_EQ(node.name, "/org/example/Sensor");
    ASSERT_EQ(node.interfaces.size(), 2u);
    ASSERT_EQ(node.children.size(), 1u);
    EXPECT_EQ(node.children[0].name, "child");

    auto* sensor = node.find_interface("org.example.Sensor");
    ASSERT_NE(sensor, nullptr);
    EXPECT_EQ(sensor->doc, "The sensor interface.\n  Indented line.");

    auto* calibrate = sensor->find_method("Calibrate");
    ASSERT_NE(calibrate, nullptr);
    EXPECT_EQ(calibrate->native_name, "calibrate");
    ASSERT_EQ(calibrate->inputs.size(), 1u);
    EXPECT_EQ(calibrate->inputs[0].direction, busgen::arg_direction::in);
    ASSERT_EQ(calibrate->outputs.size(), 1u);
    EXPECT_EQ(calibrate->outputs[0].name, "accepted");
}

TEST(introspection, properties_inherit_interface_notification)
{
    busgen::introspection_node node;
    ASSERT_EQ(parse(sample_document, node), busgen::error::OK());
    auto* sensor = node.find_interface("org.example.Sensor");
    ASSERT_NE(sensor, nullptr);
    EXPECT_EQ(sensor->find_property("Level")->notify, busgen::change_notify::invalidates);
    EXPECT_EQ(sensor->find_property("Serial")->notify, busgen::change_notify::constant);
}

TEST(introspection, write_then_parse_is_stable)
{
    busgen::introspection_node first;
    ASSERT_EQ(parse(sample_document, first), busgen::error::OK());
    auto written = busgen::introspect_xml(first);

    busgen::introspection_node second;
    ASSERT_EQ(parse(written, second), busgen::error::OK());
    EXPECT_EQ(busgen::introspect_xml(second), written);

    auto* sensor = second.find_interface("org.example.Sensor");
    ASSERT_NE(sensor, nullptr);
    EXPECT_EQ(sensor->doc, "The sensor interface.\n  Indented line.");
    EXPECT_EQ(sensor->find_property("Level")->notify, busgen::change_notify::invalidates);
    EXPECT_EQ(sensor->find_property("Serial")->notify, busgen::change_notify::constant);
}

TEST(introspection, property_differing_from_interface_default_keeps_annotation)
{
    busgen::introspection_node node;
    ASSERT_EQ(parse(sample_document, node), busgen::error::OK());
    auto xml = busgen::interface_xml(*node.find_interface("org.example.Sensor"));
    EXPECT_NE(xml.find("<property name=\"Level\" type=\"d\" access=\"read\"/>"), std::string::npos);
    EXPECT_NE(xml.find("<property name=\"Serial\" type=\"s\" access=\"read\">\n"
                       "    <annotation name=\"org.freedesktop.DBus.Property.EmitsChangedSignal\" value=\"const\"/>\n"
                       "  </property>"),
        std::string::npos);
}

TEST(introspection, child_nodes_are_written)
{
    busgen::introspection_node node;
    node.children.push_back({"first", {}, {}});
    node.children.push_back({"second", {}, {}});
    EXPECT_EQ(busgen::introspect_xml(node),
        std::string(busgen::introspection_doctype) + "<node>\n  <node name=\"first\"/>\n  <node name=\"second\"/>\n</node>\n");
}

TEST(introspection, invalid_interface_is_rejected_but_siblings_survive)
{
    const char* xml = R"(<node>
  <interface name="org.example.Broken">
    <method name="Twice"/>
    <method name="Twice"/>
  </interface>
  <interface name="org.example.Fine">
    <method name="Once"/>
  </interface>
  <interface name="org.example.BadSignal">
    <signal name="Changed">
      <arg name="value" type="u" direction="out"/>
    </signal>
  </interface>
</node>)";
    busgen::introspection_node node;
    std::vector<std::string> rejected;
    ASSERT_EQ(parse(xml, node, &rejected), busgen::error::OK());
    ASSERT_EQ(node.interfaces.size(), 1u);
    EXPECT_EQ(node.interfaces[0].name, "org.example.Fine");
    ASSERT_EQ(rejected.size(), 2u);
    EXPECT_EQ(rejected[0].rfind("org.example.Broken: ", 0), 0u);
    EXPECT_EQ(rejected[1].rfind("org.example.BadSignal: ", 0), 0u);
}

TEST(introspection, rejections_are_logged_only_when_not_collected)
{
    const char* xml = R"(<node>
  <interface name="org.example.Broken">
    <method name="Twice"/>
    <method name="Twice"/>
  </interface>
</node>)";
    std::vector<std::string> warnings;
    busgen::set_log_sink([&warnings](busgen::log_level level, const std::string& message)
        {
            if (level == busgen::log_level::warning)
                warnings.push_back(message);
        });

    busgen::introspection_node node;
    std::vector<std::string> rejected;
    EXPECT_EQ(parse(xml, node, &rejected), busgen::error::OK());
    EXPECT_EQ(rejected.size(), 1u);
    EXPECT_TRUE(warnings.empty());

    EXPECT_EQ(parse(xml, node), busgen::error::OK());
    busgen::set_log_sink({});
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("org.example.Broken"), std::string::npos);
}

TEST(introspection, child_node_without_name_is_skipped)
{
    busgen::introspection_node node;
    ASSERT_EQ(parse(R"(<node name="/a"><node/><node name="b"/></node>)", node), busgen::error::OK());
    ASSERT_EQ(node.children.size(), 1u);
    EXPECT_EQ(node.children[0].name, "b");
}

TEST(introspection, double_dash_in_doc_stays_inside_the_comment)
{
    busgen::interface_spec iface;
    iface.name = "org.example.Dashes";
    busgen::method_spec method;
    method.wire_name = "Run";
    method.native_name = "run";
    method.doc = "a --> b\nflags like --force";
    iface.methods.push_back(std::move(method));

    busgen::introspection_node node;
    node.interfaces.push_back(iface);
    auto xml = busgen::introspect_xml(node);
    EXPECT_NE(xml.find("a - -> b"), std::string::npos);
    EXPECT_NE(xml.find("flags like - -force"), std::string::npos);

    busgen::introspection_node parsed;
    ASSERT_EQ(parse(xml, parsed), busgen::error::OK());
    ASSERT_EQ(parsed.interfaces.size(), 1u);
    auto* run = parsed.interfaces[0].find_method("Run");
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->doc, "a - -> b\nflags like - -force");
    EXPECT_EQ(busgen::introspect_xml(parsed), xml);
}

TEST(introspection, missing_required_attributes_fail_document)
{
    busgen::introspection_node node;
    std::string diagnostic;
    EXPECT_EQ(busgen::parse_introspection("<node><interface/></node>", node, diagnostic),
        busgen::error::XML_MISSING_ATTRIBUTE());
    EXPECT_NE(diagnostic.find("name"), std::string::npos);

    EXPECT_EQ(parse(R"(<node><interface name="a.b"><method name="M"><arg name="x"/></method></interface></node>)", node),
        busgen::error::XML_MISSING_ATTRIBUTE());
    EXPECT_EQ(parse(R"(<node><interface name="a.b"><property name="P" type="u"/></interface></node>)", node),
        busgen::error::XML_MISSING_ATTRIBUTE());
}

TEST(introspection, invalid_attribute_values_fail_document)
{
    busgen::introspection_node node;
    EXPECT_EQ(parse(R"(<node><interface name="a.b"><method name="M"><arg type="a" direction="in"/></method></interface></node>)", node),
        busgen::error::XML_INVALID_ATTRIBUTE());
    EXPECT_EQ(parse(R"(<node><interface name="a.b"><method name="M"><arg type="u" direction="sideways"/></method></interface></node>)", node),
        busgen::error::XML_INVALID_ATTRIBUTE());
    EXPECT_EQ(parse(R"(<node><interface name="a.b"><property name="P" type="u" access="readonly"/></interface></node>)", node),
        busgen::error::XML_INVALID_ATTRIBUTE());
    EXPECT_EQ(parse(R"(<node><interface name="a.b"><property name="P" type="u" access="read">
        <annotation name="org.freedesktop.DBus.Property.EmitsChangedSignal" value="sometimes"/></property></interface></node>)", node),
        busgen::error::XML_INVALID_ATTRIBUTE());
}

TEST(introspection, malformed_xml_fails_and_keeps_output)
{
    busgen::introspection_node node;
    node.name = "previous";
    std::string diagnostic;
    EXPECT_EQ(busgen::parse_introspection("<node><interface name=\"a.b\">", node, diagnostic), busgen::error::XML_PARSE_ERROR());
    EXPECT_FALSE(diagnostic.empty());
    EXPECT_EQ(node.name, "previous");

    EXPECT_EQ(parse("<interface name=\"a.b\"/>", node), busgen::error::XML_PARSE_ERROR());
}

TEST(introspection, arg_without_direction_is_an_input)
{
    busgen::introspection_node node;
    ASSERT_EQ(parse(R"(<node><interface name="a.b"><method name="M"><arg name="x" type="u"/></method></interface></node>)", node),
        busgen::error::OK());
    auto* m = node.interfaces[0].find_method("M");
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->inputs.size(), 1u);
    EXPECT_TRUE(m->outputs.empty());
}

TEST(introspection, doc_comment_normalisation)
{
    EXPECT_EQ(busgen::normalise_doc_comment("\n    First line.   \n\n      Second.\n  "), "First line.\n\n  Second.");
    EXPECT_EQ(busgen::normalise_doc_comment(" single "), "single");
    EXPECT_EQ(busgen::normalise_doc_comment("\n \n"), "");
}

TEST(introspection, doc_only_attaches_to_the_next_element)
{
    const char* xml = R"(<node>
  <interface name="a.b">
    <!-- documented -->
    <method name="First"/>
    <method name="Second"/>
  </interface>
</node>)";
    busgen::introspection_node node;
    ASSERT_EQ(parse(xml, node), busgen::error::OK());
    EXPECT_EQ(node.interfaces[0].find_method("First")->doc, "documented");
    EXPECT_EQ(node.interfaces[0].find_method("Second")->doc, "");
}

TEST(introspection, partition_by_prefix)
{
    busgen::introspection_node node;
    ASSERT_EQ(parse(sample_document, node), busgen::error::OK());
    auto partition = busgen::partition_interfaces(node);
    ASSERT_EQ(partition.standard.size(), 1u);
    EXPECT_EQ(partition.standard[0]->name, "org.freedesktop.DBus.Peer");
    ASSERT_EQ(partition.needed.size(), 1u);
    EXPECT_EQ(partition.needed[0]->name, "org.example.Sensor");

    auto custom = busgen::partition_interfaces(node, "org.example");
    EXPECT_EQ(custom.standard.size(), 1u);
    EXPECT_EQ(custom.standard[0]->name, "org.example.Sensor");
}
