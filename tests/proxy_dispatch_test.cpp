/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include <busgen/busgen.h>
#include <transports/loopback/transport.h>

namespace
{
    constexpr const char* service_name = "org.example.Calculator";
    constexpr const char* object_path = "/org/example/Calculator";
    constexpr const char* interface_name = "org.example.Calc";

    busgen::interface_spec calc_spec()
    {
        busgen::interface_builder b(interface_name);
        b.add_method("add").param("a", "i").param("b", "i").returns("i");
        b.add_method("div_mod").param("a", "u").param("b", "u").returns("u").returns("u");
        b.add_method("describe").returns_struct({"u", "s"});
        b.add_method("broken").returns("u");
        b.add_method("reset").no_reply();
        b.add_property("level", "u", busgen::property_access::readwrite);
        b.add_property("mode", "s", busgen::property_access::readwrite, busgen::change_notify::invalidates);
        b.add_property("quiet", "u", busgen::property_access::readwrite, busgen::change_notify::no);
        b.add_property("serial", "s", busgen::property_access::read, busgen::change_notify::constant);
        b.add_signal("overflow").arg("by", "u");

        busgen::interface_spec spec;
        std::string diagnostic;
        auto ret = b.build(spec, diagnostic);
        EXPECT_EQ(ret, busgen::error::OK()) << diagnostic;
        return spec;
    }

    struct calc_state
    {
        uint32_t level = 1;
        std::string mode = "basic";
        uint32_t quiet = 0;
        int resets = 0;
    };

    class proxy_dispatch_test : public testing::Test
    {
    protected:
        std::shared_ptr<busgen::loopback::bus> bus_;
        std::shared_ptr<busgen::loopback::connection> server_conn_;
        std::shared_ptr<busgen::loopback::connection> client_conn_;
        std::unique_ptr<busgen::object_server> server_;
        std::shared_ptr<busgen::interface_dispatcher> dispatcher_;
        std::shared_ptr<calc_state> state_ = std::make_shared<calc_state>();

        void SetUp() override
        {
            bus_ = busgen::loopback::bus::create();
            server_conn_ = bus_->connect();
            client_conn_ = bus_->connect();
            ASSERT_EQ(bus_->request_name(service_name, server_conn_), busgen::error::OK());

            dispatcher_ = std::make_shared<busgen::interface_dispatcher>(calc_spec(), server_conn_, object_path);
            auto state = state_;

            ASSERT_EQ(dispatcher_->add_method("Add",
                          [](const busgen::message& call, std::vector<busgen::value>& reply) -> CORO_TASK(int)
                          {
                              int32_t a = 0;
                              int32_t b = 0;
                              if (busgen::unmarshal_values(call.body, a, b) != busgen::error::OK())
                                  CO_RETURN busgen::error::INVALID_ARGS();
                              reply = busgen::marshal_values(int32_t(a + b));
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_method("DivMod",
                          [](const busgen::message& call, std::vector<busgen::value>& reply) -> CORO_TASK(int)
                          {
                              uint32_t a = 0;
                              uint32_t b = 0;
                              if (busgen::unmarshal_values(call.body, a, b) != busgen::error::OK() || b == 0)
                                  CO_RETURN busgen::error::INVALID_ARGS();
                              reply = busgen::marshal_values(uint32_t(a / b), uint32_t(a % b));
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_method("Describe",
                          [state](const busgen::message&, std::vector<busgen::value>& reply) -> CORO_TASK(int)
                          {
                              reply = busgen::marshal_values(std::make_tuple(state->level, state->mode));
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_method("Broken",
                          [](const busgen::message&, std::vector<busgen::value>& reply) -> CORO_TASK(int)
                          {
                              reply = busgen::marshal_values(std::string("not a number"));
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_method("Reset",
                          [state](const busgen::message&, std::vector<busgen::value>&) -> CORO_TASK(int)
                          {
                              ++state->resets;
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());

            ASSERT_EQ(dispatcher_->add_property(
                          "Level",
                          [state](busgen::value& result) -> CORO_TASK(int)
                          {
                              result = busgen::value(state->level);
                              CO_RETURN busgen::error::OK();
                          },
                          [state](const busgen::value& new_value) -> CORO_TASK(int)
                          { CO_RETURN busgen::wire_type<uint32_t>::from_value(new_value, state->level); }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_property(
                          "Mode",
                          [state](busgen::value& result) -> CORO_TASK(int)
                          {
                              result = busgen::value(state->mode);
                              CO_RETURN busgen::error::OK();
                          },
                          [state](const busgen::value& new_value) -> CORO_TASK(int)
                          { CO_RETURN busgen::wire_type<std::string>::from_value(new_value, state->mode); }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_property(
                          "Quiet",
                          [state](busgen::value& result) -> CORO_TASK(int)
                          {
                              result = busgen::value(state->quiet);
                              CO_RETURN busgen::error::OK();
                          },
                          [state](const busgen::value& new_value) -> CORO_TASK(int)
                          { CO_RETURN busgen::wire_type<uint32_t>::from_value(new_value, state->quiet); }),
                busgen::error::OK());
            ASSERT_EQ(dispatcher_->add_property("Serial",
                          [](busgen::value& result) -> CORO_TASK(int)
                          {
                              result = busgen::value("SN-1");
                              CO_RETURN busgen::error::OK();
                          }),
                busgen::error::OK());

            server_ = std::make_unique<busgen::object_server>(server_conn_);
            ASSERT_EQ(server_->add(dispatcher_), busgen::error::OK());
            ASSERT_EQ(server_->attach(), busgen::error::OK());
        }

        void TearDown() override
        {
            server_.reset();
        }

        busgen::proxy_base make_proxy() const
        {
            return busgen::proxy_base(client_conn_, service_name, object_path, interface_name);
        }

        busgen::signal_subscription properties_changed()
        {
            busgen::fdo::properties_proxy properties(client_conn_, service_name, object_path);
            busgen::signal_subscription subscription;
            EXPECT_EQ(properties.receive_properties_changed(subscription), busgen::error::OK());
            return subscription;
        }
    };
}

TEST_F(proxy_dispatch_test, method_with_one_output)
{
    auto proxy = make_proxy();
    int32_t sum = 0;
    ASSERT_EQ(SYNC_WAIT(proxy.call_method_returning("Add", sum, int32_t(20), int32_t(22))), busgen::error::OK());
    EXPECT_EQ(sum, 42);
}

TEST_F(proxy_dispatch_test, several_outputs_unpack_into_a_tuple)
{
    auto proxy = make_proxy();
    std::tuple<uint32_t, uint32_t> result;
    ASSERT_EQ(SYNC_WAIT(proxy.call_method_returning_tuple("DivMod", result, uint32_t(17), uint32_t(5))), busgen::error::OK());
    EXPECT_EQ(std::get<0>(result), 3u);
    EXPECT_EQ(std::get<1>(result), 2u);
}

TEST_F(proxy_dispatch_test, struct_output_is_a_single_value)
{
    auto proxy = make_proxy();
    std::tuple<uint32_t, std::string> described;
    ASSERT_EQ(SYNC_WAIT(proxy.call_method_returning("Describe", described)), busgen::error::OK());
    EXPECT_EQ(described, std::make_tuple(uint32_t(1), std::string("basic")));
}

TEST_F(proxy_dispatch_test, wrong_argument_types_are_invalid_args)
{
    auto proxy = make_proxy();
    int32_t sum = 0;
    EXPECT_EQ(SYNC_WAIT(proxy.call_method_returning("Add", sum, std::string("20"), int32_t(22))), busgen::error::INVALID_ARGS());
}

TEST_F(proxy_dispatch_test, handler_errors_reach_the_caller)
{
    auto proxy = make_proxy();
    std::tuple<uint32_t, uint32_t> result;
    EXPECT_EQ(SYNC_WAIT(proxy.call_method_returning_tuple("DivMod", result, uint32_t(1), uint32_t(0))),
        busgen::error::INVALID_ARGS());
}

TEST_F(proxy_dispatch_test, reply_not_matching_declaration_is_rejected)
{
    auto proxy = make_proxy();
    uint32_t number = 0;
    EXPECT_NE(SYNC_WAIT(proxy.call_method_returning("Broken", number)), busgen::error::OK());
    EXPECT_EQ(number, 0u);
}

TEST_F(proxy_dispatch_test, reply_of_unexpected_type_is_type_mismatch)
{
    auto proxy = make_proxy();
    std::string text;
    EXPECT_EQ(SYNC_WAIT(proxy.call_method_returning("Add", text, int32_t(1), int32_t(2))), busgen::error::TYPE_MISMATCH());
    EXPECT_TRUE(text.empty());
}

TEST_F(proxy_dispatch_test, unknown_method)
{
    auto proxy = make_proxy();
    EXPECT_EQ(SYNC_WAIT(proxy.call_method("Missing")), busgen::error::UNKNOWN_METHOD());
}

TEST_F(proxy_dispatch_test, no_reply_method_runs)
{
    auto proxy = make_proxy();
    ASSERT_EQ(SYNC_WAIT(proxy.call_method_no_reply("Reset")), busgen::error::OK());
    EXPECT_EQ(state_->resets, 1);
}

TEST_F(proxy_dispatch_test, properties_get_and_set)
{
    auto proxy = make_proxy();
    uint32_t level = 0;
    ASSERT_EQ(SYNC_WAIT(proxy.get_property("Level", level)), busgen::error::OK());
    EXPECT_EQ(level, 1u);

    ASSERT_EQ(SYNC_WAIT(proxy.set_property("Level", uint32_t(9))), busgen::error::OK());
    EXPECT_EQ(state_->level, 9u);
    ASSERT_EQ(SYNC_WAIT(proxy.get_property("Level", level)), busgen::error::OK());
    EXPECT_EQ(level, 9u);

    std::string wrong;
    EXPECT_EQ(SYNC_WAIT(proxy.get_property("Level", wrong)), busgen::error::TYPE_MISMATCH());
    EXPECT_EQ(SYNC_WAIT(proxy.set_property("Level", std::string("nine"))), busgen::error::INVALID_ARGS());
    EXPECT_EQ(SYNC_WAIT(proxy.get_property("Missing", level)), busgen::error::UNKNOWN_PROPERTY());
}

TEST_F(proxy_dispatch_test, constant_property_is_read_only)
{
    auto proxy = make_proxy();
    std::string serial;
    ASSERT_EQ(SYNC_WAIT(proxy.get_property("Serial", serial)), busgen::error::OK());
    EXPECT_EQ(serial, "SN-1");
    EXPECT_EQ(SYNC_WAIT(proxy.set_property("Serial", std::string("SN-2"))), busgen::error::PROPERTY_READ_ONLY());
}

TEST_F(proxy_dispatch_test, get_all_properties)
{
    auto proxy = make_proxy();
    std::map<std::string, busgen::value> all;
    ASSERT_EQ(SYNC_WAIT(proxy.get_all_properties(all)), busgen::error::OK());
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all.at("Level"), busgen::value(uint32_t(1)));
    EXPECT_EQ(all.at("Mode"), busgen::value("basic"));
    EXPECT_EQ(all.at("Serial"), busgen::value("SN-1"));
}

TEST_F(proxy_dispatch_test, changed_property_sends_new_value)
{
    auto subscription = properties_changed();
    auto proxy = make_proxy();
    ASSERT_EQ(SYNC_WAIT(proxy.set_property("Level", uint32_t(5))), busgen::error::OK());

    busgen::received_signal received;
    ASSERT_TRUE(subscription.poll(received));
    busgen::fdo::properties_changed_args args;
    ASSERT_EQ(args.decode(received), busgen::error::OK());
    EXPECT_EQ(args.interface_name, interface_name);
    ASSERT_EQ(args.changed_properties.size(), 1u);
    EXPECT_EQ(args.changed_properties.at("Level"), busgen::value(uint32_t(5)));
    EXPECT_TRUE(args.invalidated_properties.empty());
    EXPECT_FALSE(subscription.poll(received));
}

TEST_F(proxy_dispatch_test, invalidating_property_names_itself)
{
    auto subscription = properties_changed();
    auto proxy = make_proxy();
    ASSERT_EQ(SYNC_WAIT(proxy.set_property("Mode", std::string("scientific"))), busgen::error::OK());
    EXPECT_EQ(state_->mode, "scientific");

    busgen::received_signal received;
    ASSERT_TRUE(subscription.poll(received));
    busgen::fdo::properties_changed_args args;
    ASSERT_EQ(args.decode(received), busgen::error::OK());
    EXPECT_TRUE(args.changed_properties.empty());
    EXPECT_EQ(args.invalidated_properties, std::vector<std::string>{"Mode"});
}

TEST_F(proxy_dispatch_test, silent_property_sends_nothing)
{
    auto subscription = properties_changed();
    auto proxy = make_proxy();
    ASSERT_EQ(SYNC_WAIT(proxy.set_property("Quiet", uint32_t(3))), busgen::error::OK());
    EXPECT_EQ(state_->quiet, 3u);

    busgen::received_signal received;
    EXPECT_FALSE(subscription.poll(received));
}

TEST_F(proxy_dispatch_test, server_side_change_notification)
{
    auto subscription = properties_changed();
    state_->level = 77;
    ASSERT_EQ(SYNC_WAIT(dispatcher_->notify_property_changed("Level")), busgen::error::OK());
    ASSERT_EQ(SYNC_WAIT(dispatcher_->notify_property_changed("Quiet")), busgen::error::OK());
    EXPECT_EQ(SYNC_WAIT(dispatcher_->notify_property_changed("Missing")), busgen::error::UNKNOWN_PROPERTY());

    busgen::received_signal received;
    ASSERT_TRUE(subscription.poll(received));
    busgen::fdo::properties_changed_args args;
    ASSERT_EQ(args.decode(received), busgen::error::OK());
    EXPECT_EQ(args.changed_properties.at("Level"), busgen::value(uint32_t(77)));
    EXPECT_FALSE(subscription.poll(received));
}

TEST_F(proxy_dispatch_test, emitted_signal_reaches_proxy_subscription)
{
    auto proxy = make_proxy();
    auto subscription = proxy.make_signal_subscription("Overflow");
    ASSERT_EQ(subscription.subscribe(), busgen::error::OK());

    ASSERT_EQ(SYNC_WAIT(dispatcher_->emit("Overflow", uint32_t(12))), busgen::error::OK());
    EXPECT_EQ(SYNC_WAIT(dispatcher_->emit("Overflow", std::string("12"))), busgen::error::INVALID_ARGS());
    EXPECT_EQ(SYNC_WAIT(dispatcher_->emit("Underflow", uint32_t(1))), busgen::error::UNKNOWN_METHOD());

    busgen::received_signal received;
    ASSERT_TRUE(subscription.poll(received));
    uint32_t by = 0;
    ASSERT_EQ(received.args(by), busgen::error::OK());
    EXPECT_EQ(by, 12u);
    EXPECT_FALSE(subscription.poll(received));
}

TEST_F(proxy_dispatch_test, dispatcher_rejects_undeclared_bindings)
{
    auto noop = [](const busgen::message&, std::vector<busgen::value>&) -> CORO_TASK(int) { CO_RETURN busgen::error::OK(); };
    EXPECT_EQ(dispatcher_->add_method("Undeclared", noop), busgen::error::UNKNOWN_METHOD());
    EXPECT_EQ(dispatcher_->add_method("Add", noop), busgen::error::MODEL_DUPLICATE_MEMBER());
    EXPECT_EQ(dispatcher_->add_property("Undeclared", busgen::property_getter{}), busgen::error::UNKNOWN_PROPERTY());
    EXPECT_EQ(dispatcher_->introspect(), busgen::interface_xml(dispatcher_->spec()));
}
