#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake data channel to test the session pipeline without a network.
LoopbackTransport::~LoopbackTransport()
{
    if (peer_ && peer_->peer_ == this)
        peer_->peer_ = nullptr;
}

bool LoopbackTransport::start(const Settings &s, Handlers h)
{
    handlers_ = std::move(h);
    mtu_      = s.max_message_size;
    started_  = true;
    // already opened before anyone listened: report it now
    OnOpen on_open = handlers_.on_open;
    if (open_ && on_open)
        on_open();
    return true;
}

bool LoopbackTransport::send(const Message &one_message)
{
    if (!started_ || !open_)
        return false;
    if (mtu_ != 0 && one_message.data.size() > mtu_)
    {
        LOG_WARN("loopback: %zu byte message exceeds max %zu", one_message.data.size(), mtu_);
        return false;
    }
    LoopbackTransport *dst = peer_ ? peer_ : this;
    if (!dst->started_ || !dst->open_)
        return false;
    sent_++;
    // copy: the receiver may stop() the channel from inside its handler
    OnMessage on_message = dst->handlers_.on_message;
    if (on_message)
        on_message(one_message);
    return true;
}

void LoopbackTransport::stop()
{
    if (!started_)
        return;
    started_ = false;
    open_    = false;
    handlers_ = Handlers{};
    if (peer_)
        peer_->peer_closed();
}

bool LoopbackTransport::link_ready() const
{
    return started_ && open_;
}

void LoopbackTransport::open()
{
    mark_open();
    if (peer_)
        peer_->mark_open();
}

void LoopbackTransport::link(LoopbackTransport &a, LoopbackTransport &b)
{
    a.peer_ = &b;
    b.peer_ = &a;
}

void LoopbackTransport::mark_open()
{
    if (open_)
        return;
    open_         = true;
    OnOpen on_open = handlers_.on_open;
    if (started_ && on_open)
        on_open();
}

void LoopbackTransport::peer_closed()
{
    if (!started_)
        return;
    open_ = false;
    // copy: the close handler may stop() us and reset handlers_
    OnClose on_close = handlers_.on_close;
    if (on_close)
        on_close();
}

void LoopbackNegotiator::start_connection(const ConnectParams &p, OnChannelReady on_ready)
{
    last_ = p;
    LOG_DEBUG("loopback negotiation: originator=%d kind=%s label=%s", p.originator ? 1 : 0,
              p.kind.c_str(), p.label.c_str());
    if (on_ready)
        on_ready(channel_);
}

}  // namespace transport
