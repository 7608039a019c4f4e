/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/signal_matcher.h>

namespace busgen
{
    const char* to_string(signal_state state)
    {
        switch (state)
        {
        case signal_state::not_matched:
            return "not_matched";
        case signal_state::matched_pending:
            return "matched_pending";
        case signal_state::decoded:
            return "decoded";
        case signal_state::decode_failed:
            return "decode_failed";
        }
        return "not_matched";
    }

    signal_matcher::signal_matcher(std::string interface_name, std::string member, std::string path)
        : interface_name_(std::move(interface_name))
        , member_(std::move(member))
        , path_(std::move(path))
    {
    }

    signal_state signal_matcher::match(const message& msg) const
    {
        if (msg.type != message_type::signal)
            return signal_state::not_matched;
        if (msg.interface_name != interface_name_ || msg.member != member_)
            return signal_state::not_matched;
        if (!path_.empty() && msg.path != path_)
            return signal_state::not_matched;
        return signal_state::matched_pending;
    }

    match_rule signal_matcher::to_match_rule() const
    {
        match_rule rule;
        rule.type = message_type::signal;
        rule.interface_name = interface_name_;
        rule.member = member_;
        rule.path = path_;
        return rule;
    }

    signal_subscription::signal_subscription(std::shared_ptr<transport> t, signal_matcher matcher)
        : transport_(std::move(t))
        , matcher_(std::move(matcher))
    {
    }

    signal_subscription::signal_subscription(signal_subscription&& other) noexcept
        : transport_(std::move(other.transport_))
        , matcher_(std::move(other.matcher_))
        , stream_(std::move(other.stream_))
    {
    }

    signal_subscription& signal_subscription::operator=(signal_subscription&& other) noexcept
    {
        if (this != &other)
        {
            cancel();
            transport_ = std::move(other.transport_);
            matcher_ = std::move(other.matcher_);
            stream_ = std::move(other.stream_);
        }
        return *this;
    }

    signal_subscription::~signal_subscription()
    {
        cancel();
    }

    int signal_subscription::subscribe()
    {
        if (stream_)
            return error::OK();
        if (!transport_)
            return error::TRANSPORT_ERROR();
        std::shared_ptr<message_stream> stream;
        auto ret = transport_->subscribe(matcher_.to_match_rule(), stream);
        if (ret != error::OK())
        {
            BUSGEN_WARNING("unable to subscribe to {}.{}: {}", matcher_.interface_name(), matcher_.member(), error::to_string(ret));
            return ret;
        }
        stream_ = std::move(stream);
        return error::OK();
    }

    bool signal_subscription::poll(received_signal& out)
    {
        if (!stream_)
            return false;
        auto ret = transport_->process_events();
        if (ret != error::OK())
            BUSGEN_WARNING("processing events for {}.{} failed: {}", matcher_.interface_name(), matcher_.member(), error::to_string(ret));

        message msg;
        while (stream_->try_next(msg))
        {
            if (matcher_.match(msg) == signal_state::matched_pending)
            {
                out = received_signal(std::move(msg));
                return true;
            }
        }
        return false;
    }

    void signal_subscription::cancel()
    {
        if (!stream_)
            return;
        stream_->cancel();
        if (transport_)
        {
            auto ret = transport_->unsubscribe(stream_);
            if (ret != error::OK())
                BUSGEN_DEBUG("unsubscribe from {}.{} returned {}", matcher_.interface_name(), matcher_.member(), error::to_string(ret));
        }
        stream_.reset();
    }
}
