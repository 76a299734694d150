/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * TCP Line Channels and Upstream Dialer
 */

#include "minerproxy/proxy.h"
#include "minerproxy/util.h"
#include <algorithm>

namespace minerproxy {

// ============================================================================
// TCP Channel
// ============================================================================

TcpChannel::TcpChannel(std::unique_ptr<net::Stream> stream)
    : stream_(std::move(stream))
    , remote_address_(stream_->GetPeerAddress())
{}

TcpChannel::~TcpChannel() {
    Close();
    std::lock_guard<std::mutex> lock(reader_mutex_);
    if (reader_.joinable()) {
        // The reader holds the last reference when it finishes
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

void TcpChannel::StartReader(DataHandler on_data, CloseHandler on_closed) {
    std::lock_guard<std::mutex> lock(reader_mutex_);
    if (reader_.joinable()) {
        return;
    }
    reader_ = std::thread(&TcpChannel::ReaderLoop, shared_from_this(),
                          std::move(on_data), std::move(on_closed));
}

void TcpChannel::ReaderLoop(std::shared_ptr<TcpChannel> self, DataHandler on_data, CloseHandler on_closed) {
    char buffer[4096];
    std::string reason;

    while (true) {
        size_t bytes_read = 0;
        net::ReadStatus status = self->stream_->Read(buffer, sizeof(buffer), bytes_read);

        if (status == net::ReadStatus::DATA) {
            if (on_data) {
                on_data(std::string(buffer, bytes_read));
            }
            continue;
        }

        if (self->closed_) {
            reason = "Connection closed";
        } else if (status == net::ReadStatus::TIMEOUT) {
            reason = "Read timeout";
        } else if (status == net::ReadStatus::CLOSED) {
            reason = "Connection closed by peer";
        } else {
            reason = "Connection error";
        }
        break;
    }

    self->Close();
    if (on_closed) {
        on_closed(reason);
    }
}

Result<void> TcpChannel::Send(const std::string& line) {
    if (closed_) {
        return Result<void>::Error("Channel closed");
    }
    return stream_->WriteAll(line);
}

void TcpChannel::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    stream_->Shutdown();
}

void TcpChannel::Join() {
    std::thread::id self_id = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(reader_mutex_);
    if (reader_.joinable() && reader_.get_id() != self_id) {
        reader_.join();
    }
}

// ============================================================================
// Upstream Dialer
// ============================================================================

TcpUpstreamDialer::TcpUpstreamDialer(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout)
{}

TcpUpstreamDialer::~TcpUpstreamDialer() {
    Shutdown();
}

Result<std::shared_ptr<LineChannel>> TcpUpstreamDialer::Dial(const PoolDescriptor& pool,
                                                             UpstreamHandlers handlers) {
    auto stream = net::Stream::Connect(pool.host, pool.port, pool.tls, connect_timeout_);
    if (stream.IsError()) {
        return Result<std::shared_ptr<LineChannel>>::Error(stream.GetError());
    }

    auto channel = std::make_shared<TcpChannel>(std::move(stream.GetValue()));
    channel->StartReader(std::move(handlers.on_data), std::move(handlers.on_closed));

    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                       [](const std::weak_ptr<TcpChannel>& c) { return c.expired(); }),
                        channels_.end());
        channels_.push_back(channel);
    }

    LogDebug("Upstream", "Connected to " + pool.name + " (" + pool.Endpoint() +
             (pool.tls ? ", TLS" : "") + ")");
    return Result<std::shared_ptr<LineChannel>>::Ok(channel);
}

void TcpUpstreamDialer::Shutdown() {
    std::vector<std::weak_ptr<TcpChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels.swap(channels_);
    }

    for (auto& weak : channels) {
        if (auto channel = weak.lock()) {
            channel->Close();
            channel->Join();
        }
    }
}

} // namespace minerproxy
