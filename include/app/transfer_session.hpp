#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "proto/frag.hpp"
#include "sched/send_queue.hpp"
#include "sched/timer.hpp"
#include "serial/serializer.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"

namespace app
{

struct SessionOptions
{
    std::string                serialization{constants::DEFAULT_SERIALIZATION};
    std::string                label;  // defaults to the session id
    std::size_t                max_message_size = constants::MAX_MESSAGE_SIZE;
    std::chrono::milliseconds  send_interval{constants::SEND_INTERVAL_MS};
    std::optional<std::string> offer;  // set on the answering side
};

enum class SessionState
{
    Pending,
    Open,
    Closed
};

const char *state_name(SessionState s);

// One logical send/receive endpoint bound to one data channel.
class TransferSession
{
  public:
    using OnOpen  = std::function<void()>;
    using OnData  = std::function<void(const serial::Value &, const serial::Descriptor &)>;
    using OnError = std::function<void(const chunkwire::Error &)>;
    using OnClose = std::function<void()>;

    // Throws chunkwire::ConfigurationError for an unknown serialization name,
    // a zero max message size or a zero send interval.
    TransferSession(transport::INegotiator   &negotiator,
                    std::unique_ptr<sched::ITimer> timer,
                    SessionOptions            opts = {});
    ~TransferSession();

    TransferSession(const TransferSession &)            = delete;
    TransferSession &operator=(const TransferSession &) = delete;

    // Registered after the channel became ready, the listener is called at once.
    void on_open(OnOpen cb);
    void on_data(OnData cb) { on_data_ = std::move(cb); }
    void on_error(OnError cb) { on_error_ = std::move(cb); }
    void on_close(OnClose cb) { on_close_ = std::move(cb); }

    // Never throws. Before `open` the value is held and an error event is raised;
    // it goes out, in order, once the channel is ready.
    void send(const serial::Value &v, const serial::Descriptor &d = serial::Descriptor::plain());
    void close();

    serial::Mode       serialization_mode() const { return mode_; }
    SessionState       state() const { return state_; }
    const std::string &id() const { return id_; }
    const std::string &label() const { return label_; }

    std::size_t queued() const { return queue_.size(); }
    std::size_t pending_sends() const { return pre_open_.size(); }
    std::size_t live_transfers() const { return rx_.live(); }

  private:
    void attach(transport::ITransport &ch);
    void handle_open();
    void announce_open();
    void handle_message(const transport::Message &m);
    void handle_closed();
    void transmit(const serial::Value &v, const serial::Descriptor &d);
    void receive_chunk(const transport::Message &m);
    void emit_data(const serial::Value &v, const serial::Descriptor &d);
    void emit_error(chunkwire::Errc code, std::string msg);
    bool teardown();

    serial::Mode                        mode_;
    std::unique_ptr<serial::Serializer> serializer_;
    SessionOptions                      opts_;
    std::string                         id_;
    std::string                         label_;
    SessionState                        state_{SessionState::Pending};
    bool                                open_announced_{false};
    transport::ITransport              *channel_{nullptr};
    sched::SendQueue                    queue_;
    frag::Reassembler                   rx_;
    std::deque<std::pair<serial::Value, serial::Descriptor>> pre_open_;

    OnOpen  on_open_;
    OnData  on_data_;
    OnError on_error_;
    OnClose on_close_;
};

}  // namespace app
