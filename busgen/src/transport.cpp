/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <busgen/internal/logger.h>
#include <busgen/internal/transport.h>

namespace busgen
{
    bool message_stream::push(const message& msg)
    {
        if (!rule_.matches(msg))
            return false;
        std::lock_guard lock(mutex_);
        if (cancelled_)
            return false;
        queue_.push_back(msg);
        return true;
    }

    bool message_stream::try_next(message& out)
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    std::size_t message_stream::size() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    void message_stream::cancel()
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
        queue_.clear();
    }

    bool message_stream::is_cancelled() const
    {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    void stream_registry::add(const std::shared_ptr<message_stream>& stream)
    {
        std::lock_guard lock(mutex_);
        streams_.push_back(stream);
    }

    bool stream_registry::remove(const std::shared_ptr<message_stream>& stream)
    {
        std::lock_guard lock(mutex_);
        auto it = std::find(streams_.begin(), streams_.end(), stream);
        if (it == streams_.end())
            return false;
        streams_.erase(it);
        return true;
    }

    std::size_t stream_registry::deliver(const message& msg) const
    {
        // copied so a consumer may unsubscribe while messages are being delivered
        std::vector<std::shared_ptr<message_stream>> streams;
        {
            std::lock_guard lock(mutex_);
            streams = streams_;
        }
        std::size_t accepted = 0;
        for (auto& stream : streams)
        {
            if (stream->push(msg))
                ++accepted;
        }
        return accepted;
    }

    std::size_t stream_registry::size() const
    {
        std::lock_guard lock(mutex_);
        return streams_.size();
    }

    void pending_calls::register_call(uint32_t serial)
    {
        std::lock_guard lock(mutex_);
        calls_[serial] = std::nullopt;
    }

    bool pending_calls::on_reply(const message& reply)
    {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(reply.reply_serial);
        if (it == calls_.end())
        {
            BUSGEN_DEBUG("dropping reply to unknown serial {}", reply.reply_serial);
            return false;
        }
        it->second = reply;
        return true;
    }

    bool pending_calls::take(uint32_t serial, message& out)
    {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(serial);
        if (it == calls_.end() || !it->second)
            return false;
        out = std::move(*it->second);
        calls_.erase(it);
        return true;
    }

    bool pending_calls::is_pending(uint32_t serial) const
    {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(serial);
        return it != calls_.end() && !it->second;
    }

    void pending_calls::abandon(uint32_t serial)
    {
        std::lock_guard lock(mutex_);
        calls_.erase(serial);
    }

    std::size_t pending_calls::size() const
    {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }
}
