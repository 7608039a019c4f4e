/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>

#include <gtest/gtest.h>

#include <busgen/busgen.h>
#include <transports/loopback/transport.h>

namespace
{
    busgen::message level_signal(const std::string& path, uint32_t level)
    {
        return busgen::message::signal(path, "org.example.Sensor", "LevelChanged", busgen::marshal_values(level));
    }
}

TEST(signal_matcher, compares_header_fields_only)
{
    busgen::signal_matcher matcher("org.example.Sensor", "LevelChanged");

    EXPECT_EQ(matcher.match(level_signal("/a", 1)), busgen::signal_state::matched_pending);
    EXPECT_EQ(matcher.match(level_signal("/b", 2)), busgen::signal_state::matched_pending);

    auto other_member = busgen::message::signal("/a", "org.example.Sensor", "Other");
    EXPECT_EQ(matcher.match(other_member), busgen::signal_state::not_matched);

    auto other_interface = busgen::message::signal("/a", "org.example.Other", "LevelChanged");
    EXPECT_EQ(matcher.match(other_interface), busgen::signal_state::not_matched);

    auto call = busgen::message::method_call("org.example", "/a", "org.example.Sensor", "LevelChanged");
    EXPECT_EQ(matcher.match(call), busgen::signal_state::not_matched);

    // a body of the wrong shape still matches, decoding reports the problem
    auto odd_body = busgen::message::signal("/a", "org.example.Sensor", "LevelChanged", busgen::marshal_values(std::string("x")));
    EXPECT_EQ(matcher.match(odd_body), busgen::signal_state::matched_pending);
}

TEST(signal_matcher, path_restricts_matches)
{
    busgen::signal_matcher matcher("org.example.Sensor", "LevelChanged", "/a");
    EXPECT_EQ(matcher.match(level_signal("/a", 1)), busgen::signal_state::matched_pending);
    EXPECT_EQ(matcher.match(level_signal("/b", 1)), busgen::signal_state::not_matched);

    auto rule = matcher.to_match_rule();
    EXPECT_EQ(rule.to_string(), "type='signal',path='/a',interface='org.example.Sensor',member='LevelChanged'");
}

TEST(signal_matcher, decoding_reports_state)
{
    busgen::received_signal good(level_signal("/a", 7));
    EXPECT_EQ(good.state(), busgen::signal_state::matched_pending);
    uint32_t level = 0;
    ASSERT_EQ(good.args(level), busgen::error::OK());
    EXPECT_EQ(level, 7u);
    EXPECT_EQ(good.state(), busgen::signal_state::decoded);

    busgen::received_signal bad(level_signal("/a", 7));
    std::string text = "untouched";
    EXPECT_EQ(bad.args(text), busgen::error::DECODE_FAILED());
    EXPECT_EQ(bad.state(), busgen::signal_state::decode_failed);
    EXPECT_EQ(text, "untouched");

    busgen::received_signal short_body(level_signal("/a", 7));
    uint32_t first = 0;
    uint32_t second = 0;
    EXPECT_EQ(short_body.args(first, second), busgen::error::DECODE_FAILED());
    EXPECT_EQ(first, 0u);
}

TEST(signal_subscription, receives_matching_signals)
{
    auto bus = busgen::loopback::bus::create();
    auto listener = bus->connect();
    auto emitter = bus->connect();

    busgen::signal_subscription subscription(listener, busgen::signal_matcher("org.example.Sensor", "LevelChanged", "/a"));
    EXPECT_EQ(subscription.state(), busgen::subscription_state::unsubscribed);
    ASSERT_EQ(subscription.subscribe(), busgen::error::OK());
    EXPECT_EQ(subscription.state(), busgen::subscription_state::subscribed);
    EXPECT_EQ(listener->subscription_count(), 1u);

    busgen::received_signal received;
    EXPECT_FALSE(subscription.poll(received));

    ASSERT_EQ(SYNC_WAIT(emitter->send(level_signal("/b", 1))), busgen::error::OK());
    ASSERT_EQ(SYNC_WAIT(emitter->send(level_signal("/a", 2))), busgen::error::OK());
    ASSERT_EQ(SYNC_WAIT(emitter->send(level_signal("/a", 3))), busgen::error::OK());

    uint32_t level = 0;
    ASSERT_TRUE(subscription.poll(received));
    ASSERT_EQ(received.args(level), busgen::error::OK());
    EXPECT_EQ(level, 2u);
    EXPECT_EQ(received.get_message().sender, emitter->unique_name());

    ASSERT_TRUE(subscription.poll(received));
    ASSERT_EQ(received.args(level), busgen::error::OK());
    EXPECT_EQ(level, 3u);

    EXPECT_FALSE(subscription.poll(received));
}

TEST(signal_subscription, cancelled_subscription_can_be_renewed)
{
    auto bus = busgen::loopback::bus::create();
    auto listener = bus->connect();

    busgen::signal_subscription subscription(listener, busgen::signal_matcher("org.example.Sensor", "LevelChanged"));
    ASSERT_EQ(subscription.subscribe(), busgen::error::OK());
    ASSERT_EQ(SYNC_WAIT(listener->send(level_signal("/a", 1))), busgen::error::OK());

    subscription.cancel();
    EXPECT_EQ(subscription.state(), busgen::subscription_state::unsubscribed);
    EXPECT_EQ(listener->subscription_count(), 0u);

    busgen::received_signal received;
    EXPECT_FALSE(subscription.poll(received));
    ASSERT_EQ(SYNC_WAIT(listener->send(level_signal("/a", 2))), busgen::error::OK());

    ASSERT_EQ(subscription.subscribe(), busgen::error::OK());
    EXPECT_FALSE(subscription.poll(received));
    ASSERT_EQ(SYNC_WAIT(listener->send(level_signal("/a", 3))), busgen::error::OK());
    ASSERT_TRUE(subscription.poll(received));
    uint32_t level = 0;
    ASSERT_EQ(received.args(level), busgen::error::OK());
    EXPECT_EQ(level, 3u);
}

TEST(signal_subscription, destruction_unsubscribes)
{
    auto bus = busgen::loopback::bus::create();
    auto listener = bus->connect();
    {
        busgen::signal_subscription subscription(listener, busgen::signal_matcher("org.example.Sensor", "LevelChanged"));
        ASSERT_EQ(subscription.subscribe(), busgen::error::OK());
        EXPECT_EQ(listener->subscription_count(), 1u);

        busgen::signal_subscription moved(std::move(subscription));
        EXPECT_EQ(moved.state(), busgen::subscription_state::subscribed);
        EXPECT_EQ(listener->subscription_count(), 1u);
    }
    EXPECT_EQ(listener->subscription_count(), 0u);
}

TEST(signal_subscription, needs_a_transport)
{
    busgen::signal_subscription subscription;
    EXPECT_EQ(subscription.subscribe(), busgen::error::TRANSPORT_ERROR());
}
