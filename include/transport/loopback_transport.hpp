#pragma once
#include <cstddef>

#include "transport/itransport.hpp"

namespace transport {

// In-process data channel. Unlinked it echoes to itself, linked it delivers to its peer.
class LoopbackTransport final : public ITransport {
public:
  ~LoopbackTransport() override;

  bool start(const Settings& s, Handlers h) override;
  bool send(const Message& one_message) override;
  void stop() override;
  bool link_ready() const override;
  std::string name() const override { return "loopback"; }

  // channel-ready signal, raised on both ends of a link
  void open();
  static void link(LoopbackTransport& a, LoopbackTransport& b);

  std::size_t sent() const { return sent_; }

private:
  void mark_open();
  void peer_closed();

  Handlers           handlers_{};
  std::size_t        mtu_{0};
  std::size_t        sent_{0};
  bool               started_{false};
  bool               open_{false};
  LoopbackTransport* peer_{nullptr};
};

// Hands out one pre-built loopback channel.
class LoopbackNegotiator final : public INegotiator {
public:
  explicit LoopbackNegotiator(LoopbackTransport& channel) : channel_(channel) {}

  void start_connection(const ConnectParams& p, OnChannelReady on_ready) override;

  const ConnectParams& last_params() const { return last_; }

private:
  LoopbackTransport& channel_;
  ConnectParams      last_{};
};

} // namespace transport
