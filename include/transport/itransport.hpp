#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace transport
{

using Frame = std::vector<std::uint8_t>;

// One data channel message. Text and binary deliveries stay distinct.
struct Message
{
    Frame data;
    bool  is_text{false};
};

using OnOpen    = std::function<void()>;
using OnMessage = std::function<void(const Message &)>;
using OnClose   = std::function<void()>;

struct Handlers
{
    OnOpen    on_open;
    OnMessage on_message;
    OnClose   on_close;
};

struct Settings
{
    std::string role;  // "loopback" for the in-process channel
    std::string label;
    std::size_t max_message_size = 16300;
};

// Handle to an established (or establishing) data channel.
struct ITransport
{
    virtual bool        start(const Settings &s, Handlers h) = 0;
    // false when the channel is not open or over its own buffer threshold
    virtual bool        send(const Message &one_message)     = 0;
    virtual void        stop()                               = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

struct ConnectParams
{
    bool                       originator{true};
    std::string                kind;
    std::string                label;
    std::optional<std::string> offer;  // opaque offer that triggered an answering session
};

using OnChannelReady = std::function<void(ITransport &)>;

// Signalling side: produces a channel handle once negotiation is done.
struct INegotiator
{
    virtual void start_connection(const ConnectParams &p, OnChannelReady on_ready) = 0;
    virtual ~INegotiator() = default;
};

}  // namespace transport
