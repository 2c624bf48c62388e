#include <cstdint>
#include <sodium.h>
#include <string>
#include <vector>

#include "app/transfer_session.hpp"
#include "util/log.hpp"

namespace app
{

const char *state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Pending:
            return "pending";
        case SessionState::Open:
            return "open";
        case SessionState::Closed:
            return "closed";
    }
    return "?";
}

static serial::Mode checked_mode(const SessionOptions &opts)
{
    auto mode = serial::mode_from_name(opts.serialization);
    if (!mode)
        throw chunkwire::ConfigurationError("Invalid serialization: '" + opts.serialization + "'");
    if (opts.max_message_size == 0)
        throw chunkwire::ConfigurationError("max_message_size must be positive");
    if (opts.send_interval.count() <= 0)
        throw chunkwire::ConfigurationError("send_interval must be positive");
    return *mode;
}

static std::string new_session_id()
{
    const std::uint64_t r = frag::random_transfer_id();
    char                hex[2 * sizeof r + 1];
    sodium_bin2hex(hex, sizeof hex, reinterpret_cast<const unsigned char *>(&r), sizeof r);
    return std::string(constants::SESSION_ID_PREFIX) + hex;
}

static serial::Descriptor descriptor_of(const frag::Metadata &meta)
{
    if (meta.name)
        return serial::Descriptor::named(*meta.name, meta.mime_type.value_or(""));
    if (meta.mime_type)
        return serial::Descriptor::typed(*meta.mime_type);
    return serial::Descriptor::plain();
}

TransferSession::TransferSession(transport::INegotiator        &negotiator,
                                 std::unique_ptr<sched::ITimer> timer,
                                 SessionOptions                 opts)
    : mode_(checked_mode(opts)),
      serializer_(serial::make_serializer(mode_)),
      opts_(std::move(opts)),
      id_(new_session_id()),
      label_(opts_.label.empty() ? id_ : opts_.label),
      queue_(std::move(timer), opts_.send_interval,
             [this](const transport::Message &m) { return channel_ && channel_->send(m); })
{
    LOG_DEBUG("session %s: label=%s serialization=%s max_message_size=%zu", id_.c_str(),
              label_.c_str(), serial::mode_name(mode_), opts_.max_message_size);

    transport::ConnectParams p;
    if (opts_.offer)
    {
        p.originator = false;
        p.offer      = opts_.offer;
    }
    else
    {
        p.originator = true;
        p.kind       = std::string(constants::CHANNEL_KIND);
        p.label      = label_;
    }
    negotiator.start_connection(p, [this](transport::ITransport &ch) { attach(ch); });
}

TransferSession::~TransferSession()
{
    teardown();
}

void TransferSession::attach(transport::ITransport &ch)
{
    if (state_ == SessionState::Closed)
    {
        LOG_WARN("session %s: channel ready after close, ignoring", id_.c_str());
        return;
    }
    channel_ = &ch;

    transport::Settings s;
    s.role             = ch.name();
    s.label            = label_;
    s.max_message_size = opts_.max_message_size;

    transport::Handlers h;
    h.on_open    = [this] { handle_open(); };
    h.on_message = [this](const transport::Message &m) { handle_message(m); };
    h.on_close   = [this] { handle_closed(); };
    if (!ch.start(s, std::move(h)))
    {
        LOG_ERROR("session %s: channel start failed", id_.c_str());
        channel_ = nullptr;
    }
}

void TransferSession::handle_open()
{
    if (state_ != SessionState::Pending)
        return;
    state_ = SessionState::Open;
    LOG_INFO("Data channel connection success (%s)", label_.c_str());

    // values sent while pending go out in submission order, ahead of
    // anything the open listener sends
    auto held = std::move(pre_open_);
    pre_open_.clear();
    for (auto &v : held)
    {
        if (state_ != SessionState::Open)
            return;
        transmit(v.first, v.second);
    }
    announce_open();
}

void TransferSession::on_open(OnOpen cb)
{
    on_open_ = std::move(cb);
    // the channel may already have been ready during construction
    if (state_ == SessionState::Open)
        announce_open();
}

void TransferSession::announce_open()
{
    if (open_announced_ || !on_open_)
        return;
    open_announced_ = true;
    OnOpen cb       = on_open_;
    cb();
}

void TransferSession::handle_closed()
{
    LOG_INFO("DataChannel closed for: %s", id_.c_str());
    close();
}

void TransferSession::send(const serial::Value &v, const serial::Descriptor &d)
{
    if (state_ != SessionState::Open)
    {
        emit_error(chunkwire::Errc::SendNotOpen,
                   "Connection is not open. You should listen for the `open` event before "
                   "sending messages.");
        if (state_ == SessionState::Pending)
            pre_open_.emplace_back(v, d);
        return;
    }
    transmit(v, d);
}

void TransferSession::transmit(const serial::Value &v, const serial::Descriptor &d)
{
    if (v.is_null())
        return;

    serial::Packed packed;
    std::string    err;
    if (!serializer_->encode(v, packed, err))
    {
        emit_error(chunkwire::Errc::Serialization, err);
        return;
    }

    if (!serial::mode_is_chunked(mode_))
    {
        queue_.enqueue(transport::Message{std::move(packed.bytes), packed.text});
        return;
    }

    frag::Metadata meta;
    meta.id = frag::random_transfer_id();
    switch (d.kind)
    {
        case serial::Descriptor::Kind::Named:
            meta.type      = "File";
            meta.name      = d.name;
            meta.mime_type = d.mime_type;
            break;
        case serial::Descriptor::Kind::Typed:
            meta.type      = "Blob";
            meta.mime_type = d.mime_type;
            break;
        case serial::Descriptor::Kind::Plain:
            meta.type = v.type_name();
            break;
    }

    std::vector<frag::Chunk> chunks;
    if (!frag::split(packed.bytes, meta, opts_.max_message_size, chunks))
    {
        emit_error(chunkwire::Errc::ChunkSize,
                   "chunk metadata (" + std::to_string(frag::envelope_overhead(meta)) +
                       " bytes) does not fit max message size " +
                       std::to_string(opts_.max_message_size));
        return;
    }

    // pack every chunk first: a send is either fully queued or not at all
    std::vector<transport::Frame> frames;
    frames.reserve(chunks.size());
    for (const auto &c : chunks)
    {
        auto frame = frag::serialize(c);
        if (frame.empty())
        {
            emit_error(chunkwire::Errc::ChunkSize, "failed to pack chunk envelope");
            return;
        }
        frames.push_back(std::move(frame));
    }
    LOG_DEBUG("session %s: %zu bytes -> %zu chunks", id_.c_str(), packed.bytes.size(),
              frames.size());
    for (auto &f : frames)
        queue_.enqueue(transport::Message{std::move(f), false});
}

void TransferSession::handle_message(const transport::Message &m)
{
    if (state_ != SessionState::Open)
    {
        LOG_DEBUG("session %s: dropping message while %s", id_.c_str(), state_name(state_));
        return;
    }

    if (serial::mode_is_chunked(mode_))
    {
        receive_chunk(m);
        return;
    }

    serial::Value v;
    std::string   err;
    if (!serializer_->decode(serial::Packed{m.data, m.is_text}, v, err))
    {
        emit_error(chunkwire::Errc::Serialization, err);
        return;
    }
    emit_data(v, serial::Descriptor::plain());
}

void TransferSession::receive_chunk(const transport::Message &m)
{
    auto c = frag::parse(m.data);
    if (!c)
    {
        emit_error(chunkwire::Errc::MalformedChunk, "unparseable chunk envelope");
        return;
    }

    frag::Assembled done;
    switch (rx_.feed(*c, done))
    {
        case frag::Reassembler::Result::Incomplete:
            return;
        case frag::Reassembler::Result::Malformed:
            emit_error(chunkwire::Errc::MalformedChunk,
                       "chunk " + std::to_string(c->index) + " of " +
                           std::to_string(c->meta.total) + " rejected, transfer discarded");
            return;
        case frag::Reassembler::Result::Complete:
            break;
    }

    serial::Value v;
    std::string   err;
    if (!serializer_->decode(serial::Packed{std::move(done.payload), false}, v, err))
    {
        emit_error(chunkwire::Errc::Serialization, err);
        return;
    }
    emit_data(v, descriptor_of(done.meta));
}

void TransferSession::emit_data(const serial::Value &v, const serial::Descriptor &d)
{
    if (on_data_)
        on_data_(v, d);
}

void TransferSession::emit_error(chunkwire::Errc code, std::string msg)
{
    LOG_WARN("session %s: %s: %s", id_.c_str(), chunkwire::errc_name(code), msg.c_str());
    if (on_error_)
        on_error_(chunkwire::Error{code, std::move(msg)});
}

bool TransferSession::teardown()
{
    if (state_ == SessionState::Closed)
        return false;
    state_ = SessionState::Closed;
    if (rx_.live())
        LOG_INFO("session %s: discarding %zu incomplete transfers", id_.c_str(), rx_.live());
    rx_.clear();
    queue_.clear();
    pre_open_.clear();
    if (channel_)
    {
        transport::ITransport *ch = channel_;
        channel_                  = nullptr;
        ch->stop();
    }
    return true;
}

void TransferSession::close()
{
    if (teardown() && on_close_)
        on_close_();
}

}  // namespace app
