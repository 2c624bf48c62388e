#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "app/transfer_session.hpp"
#include "proto/frag.hpp"
#include "sched/event_loop.hpp"
#include "serial/serializer.hpp"
#include "transport/loopback_transport.hpp"

using namespace std::chrono_literals;
using app::SessionOptions;
using app::SessionState;
using app::TransferSession;
using chunkwire::Errc;
using serial::Descriptor;
using serial::Value;

namespace
{
struct ManualTimer : public sched::ITimer
{
    std::function<void()> cb;
    bool                  on = false;

    void start(std::chrono::milliseconds, std::function<void()> f) override
    {
        cb = std::move(f);
        on = true;
    }
    void stop() override { on = false; }
    bool active() const override { return on; }

    bool fire()
    {
        if (!on)
            return false;
        auto f = cb;
        f();
        return true;
    }
};

// Data channel whose signals are raised by the test.
struct FakeChannel : public transport::ITransport
{
    transport::Handlers             h;
    transport::Settings             settings;
    bool                            started = false;
    bool                            open    = false;
    bool                            stopped = false;
    int                             refuse  = 0;  // fail this many sends
    std::vector<transport::Message> sent;

    bool start(const transport::Settings &s, transport::Handlers hs) override
    {
        settings = s;
        h        = std::move(hs);
        started  = true;
        return true;
    }
    bool send(const transport::Message &m) override
    {
        if (!open)
            return false;
        if (refuse > 0)
        {
            refuse--;
            return false;
        }
        sent.push_back(m);
        return true;
    }
    void stop() override
    {
        stopped = true;
        open    = false;
    }
    bool        link_ready() const override { return open; }
    std::string name() const override { return "fake"; }

    void signal_open()
    {
        open = true;
        h.on_open();
    }
    void deliver(const transport::Message &m) { h.on_message(m); }
    void deliver(const frag::Bytes &frame) { h.on_message(transport::Message{frame, false}); }
    void signal_closed()
    {
        open = false;
        h.on_close();
    }
};

struct FakeNegotiator : public transport::INegotiator
{
    transport::ITransport    &ch;
    transport::ConnectParams  params;
    int                       calls = 0;
    explicit FakeNegotiator(transport::ITransport &c) : ch(c) {}
    void start_connection(const transport::ConnectParams &p,
                          transport::OnChannelReady       on_ready) override
    {
        params = p;
        calls++;
        on_ready(ch);
    }
};

struct Rig
{
    FakeChannel                      ch;
    FakeNegotiator                   neg{ch};
    ManualTimer                     *timer = nullptr;
    std::unique_ptr<TransferSession> s;
    std::vector<Value>               data;
    std::vector<Descriptor>          descs;
    std::vector<chunkwire::Error>    errors;
    int                              opens  = 0;
    int                              closes = 0;

    explicit Rig(SessionOptions o)
    {
        timer = new ManualTimer;
        s     = std::make_unique<TransferSession>(neg, std::unique_ptr<sched::ITimer>(timer),
                                                  std::move(o));
        s->on_open([this] { opens++; });
        s->on_data([this](const Value &v, const Descriptor &d) {
            data.push_back(v);
            descs.push_back(d);
        });
        s->on_error([this](const chunkwire::Error &e) { errors.push_back(e); });
        s->on_close([this] { closes++; });
    }

    void drain()
    {
        while (timer->fire())
        {
        }
    }
};

SessionOptions with_mode(const char *mode, std::size_t max = 16300)
{
    SessionOptions o;
    o.serialization    = mode;
    o.max_message_size = max;
    return o;
}

std::string text_of(const transport::Message &m)
{
    return std::string(m.data.begin(), m.data.end());
}

// Frames a peer in binary mode would send for `v`.
std::vector<frag::Bytes> frames_for(const Value &v, std::uint64_t id, std::size_t max)
{
    serial::Packed p;
    std::string    err;
    EXPECT_TRUE(serial::make_serializer(serial::Mode::Binary)->encode(v, p, err));
    frag::Metadata meta;
    meta.id   = id;
    meta.type = v.type_name();
    std::vector<frag::Chunk> chunks;
    EXPECT_TRUE(frag::split(p.bytes, meta, max, chunks));
    std::vector<frag::Bytes> out;
    for (const auto &c : chunks)
        out.push_back(frag::serialize(c));
    return out;
}

Value blob(std::size_t n)
{
    std::vector<std::uint8_t> raw(n);
    for (std::size_t i = 0; i < n; ++i)
        raw[i] = static_cast<std::uint8_t>(i * 13 + 1);
    return Value::binary(raw);
}
}  // namespace

TEST(Session, InvalidConfigurationThrows)
{
    FakeChannel    ch;
    FakeNegotiator neg(ch);
    EXPECT_THROW(TransferSession(neg, std::make_unique<ManualTimer>(), with_mode("xml")),
                 chunkwire::ConfigurationError);
    EXPECT_THROW(TransferSession(neg, std::make_unique<ManualTimer>(), with_mode("binary", 0)),
                 chunkwire::ConfigurationError);
    SessionOptions o;
    o.send_interval = 0ms;
    EXPECT_THROW(TransferSession(neg, std::make_unique<ManualTimer>(), o),
                 chunkwire::ConfigurationError);
    // nothing was negotiated for a session that never existed
    EXPECT_EQ(neg.calls, 0);
}

TEST(Session, DefaultsAndNegotiation)
{
    Rig r(SessionOptions{});
    EXPECT_EQ(r.s->serialization_mode(), serial::Mode::Binary);
    EXPECT_EQ(r.s->state(), SessionState::Pending);
    EXPECT_EQ(r.s->id().rfind("dc_", 0), 0u);
    EXPECT_EQ(r.s->id().size(), 3u + 16u);
    EXPECT_EQ(r.s->label(), r.s->id());

    EXPECT_TRUE(r.neg.params.originator);
    EXPECT_EQ(r.neg.params.kind, "data");
    EXPECT_EQ(r.neg.params.label, r.s->label());
    EXPECT_TRUE(r.ch.started);
    EXPECT_EQ(r.ch.settings.max_message_size, 16300u);

    r.ch.signal_open();
    EXPECT_EQ(r.s->state(), SessionState::Open);
    EXPECT_EQ(r.opens, 1);
}

TEST(Session, AnsweringSideForwardsOffer)
{
    SessionOptions o;
    o.label = "files";
    o.offer = "v=0 opaque-offer";
    Rig r(o);
    EXPECT_EQ(r.s->label(), "files");
    EXPECT_FALSE(r.neg.params.originator);
    ASSERT_TRUE(r.neg.params.offer.has_value());
    EXPECT_EQ(*r.neg.params.offer, "v=0 opaque-offer");
}

TEST(Session, NoneMode_SendsRawValue)
{
    Rig r(with_mode("none"));
    r.ch.signal_open();
    r.s->send(Value("hello"));
    EXPECT_TRUE(r.ch.sent.empty());  // paced by the timer
    r.drain();
    ASSERT_EQ(r.ch.sent.size(), 1u);
    EXPECT_TRUE(r.ch.sent[0].is_text);
    EXPECT_EQ(text_of(r.ch.sent[0]), "hello");
    EXPECT_TRUE(r.errors.empty());

    r.ch.deliver(transport::Message{{'y', 'o'}, true});
    r.ch.deliver(transport::Message{{0x01, 0x02}, false});
    ASSERT_EQ(r.data.size(), 2u);
    EXPECT_EQ(r.data[0], Value("yo"));
    EXPECT_EQ(r.data[1], Value::binary({0x01, 0x02}));
}

TEST(Session, NoneMode_RejectsNonNativeValues)
{
    Rig r(with_mode("none"));
    r.ch.signal_open();
    r.s->send(Value{{"k", 1}});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::Serialization);
    EXPECT_EQ(r.s->queued(), 0u);
    EXPECT_EQ(r.s->state(), SessionState::Open);
}

TEST(Session, JsonMode_TextBothWays)
{
    Rig r(with_mode("json", 32));
    r.ch.signal_open();
    const Value v = {{"list", {1, 2, 3}}, {"s", std::string(100, 'x')}};
    r.s->send(v);
    r.drain();
    // never chunked, even above max_message_size
    ASSERT_EQ(r.ch.sent.size(), 1u);
    EXPECT_TRUE(r.ch.sent[0].is_text);
    EXPECT_EQ(text_of(r.ch.sent[0]), v.dump());

    const std::string in = "{\"ok\":true}";
    r.ch.deliver(transport::Message{{in.begin(), in.end()}, true});
    ASSERT_EQ(r.data.size(), 1u);
    EXPECT_EQ(r.data[0], Value({{"ok", true}}));

    const std::string bad = "{oops";
    r.ch.deliver(transport::Message{{bad.begin(), bad.end()}, true});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::Serialization);
    EXPECT_EQ(r.data.size(), 1u);
    EXPECT_EQ(r.s->state(), SessionState::Open);
}

TEST(Session, SendBeforeOpenIsHeldInOrder)
{
    Rig r(with_mode("none"));
    r.s->send(Value("one"));
    r.s->send(Value("two"));
    r.s->send(Value("three"));

    ASSERT_EQ(r.errors.size(), 3u);
    for (const auto &e : r.errors)
        EXPECT_EQ(e.code, Errc::SendNotOpen);
    EXPECT_EQ(r.s->pending_sends(), 3u);
    EXPECT_EQ(r.s->queued(), 0u);
    r.drain();
    EXPECT_TRUE(r.ch.sent.empty());

    r.ch.signal_open();
    EXPECT_EQ(r.s->pending_sends(), 0u);
    r.drain();
    ASSERT_EQ(r.ch.sent.size(), 3u);
    EXPECT_EQ(text_of(r.ch.sent[0]), "one");
    EXPECT_EQ(text_of(r.ch.sent[1]), "two");
    EXPECT_EQ(text_of(r.ch.sent[2]), "three");
}

TEST(Session, HeldSendsGoOutBeforeOpenListenerSends)
{
    FakeChannel     ch;
    FakeNegotiator  neg{ch};
    auto           *timer = new ManualTimer;
    TransferSession s(neg, std::unique_ptr<sched::ITimer>(timer), with_mode("none"));
    s.on_open([&] { s.send(Value("second")); });
    s.send(Value("first"));

    ch.signal_open();
    while (timer->fire())
    {
    }
    ASSERT_EQ(ch.sent.size(), 2u);
    EXPECT_EQ(text_of(ch.sent[0]), "first");
    EXPECT_EQ(text_of(ch.sent[1]), "second");
}

TEST(Session, OpenListenerRegisteredLateStillHearsOpen)
{
    transport::LoopbackTransport  ch;
    transport::LoopbackNegotiator neg(ch);
    ch.open();  // ready before the session exists

    TransferSession s(neg, std::make_unique<ManualTimer>(), with_mode("none"));
    EXPECT_EQ(s.state(), SessionState::Open);

    int opens = 0;
    s.on_open([&] { opens++; });
    EXPECT_EQ(opens, 1);

    // announced once only
    s.on_open([&] { opens++; });
    EXPECT_EQ(opens, 1);
}

TEST(Session, OpenListenerFiresOnceOnNormalOpen)
{
    Rig r(with_mode("json"));
    EXPECT_EQ(r.opens, 0);
    r.ch.signal_open();
    EXPECT_EQ(r.opens, 1);
    r.s->on_open([&r] { r.opens++; });
    EXPECT_EQ(r.opens, 1);
}

TEST(Session, RetryKeepsChunkOrder)
{
    Rig r(with_mode("binary", 128));
    r.ch.signal_open();
    r.s->send(blob(1000));
    const std::size_t n = r.s->queued();
    ASSERT_GT(n, 3u);

    r.ch.refuse = 1;
    ASSERT_TRUE(r.timer->fire());  // first hand-off refused
    r.ch.refuse = 0;
    r.drain();
    ASSERT_EQ(r.ch.sent.size(), n);
    for (std::size_t i = 0; i < n; ++i)
    {
        auto c = frag::parse(r.ch.sent[i].data);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->index, i);
        EXPECT_LE(r.ch.sent[i].data.size(), 128u);
    }
}

TEST(Session, BinaryFramesAreChunkEnvelopes)
{
    Rig r(with_mode("binary", 200));
    r.ch.signal_open();
    r.s->send(blob(900), Descriptor::named("photo.jpg", "image/jpeg"));
    r.drain();
    ASSERT_GE(r.ch.sent.size(), 5u);

    std::uint64_t id = 0;
    for (std::size_t i = 0; i < r.ch.sent.size(); ++i)
    {
        EXPECT_FALSE(r.ch.sent[i].is_text);
        auto c = frag::parse(r.ch.sent[i].data);
        ASSERT_TRUE(c.has_value());
        if (i == 0)
            id = c->meta.id;
        EXPECT_EQ(c->meta.id, id);
        EXPECT_EQ(c->meta.type, "File");
        EXPECT_EQ(c->meta.name, std::optional<std::string>("photo.jpg"));
        EXPECT_EQ(c->meta.mime_type, std::optional<std::string>("image/jpeg"));
        EXPECT_EQ(c->meta.total, r.ch.sent.size());
    }
}

TEST(Session, ChunkSizeErrorLeavesSessionUsable)
{
    Rig r(with_mode("binary", 60));
    r.ch.signal_open();
    r.s->send(blob(10), Descriptor::named(std::string(40, 'n')));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::ChunkSize);
    EXPECT_EQ(r.s->queued(), 0u);

    r.s->send(blob(10));
    EXPECT_GT(r.s->queued(), 0u);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST(Session, NullIsIgnored)
{
    Rig r(with_mode("json"));
    r.ch.signal_open();
    r.s->send(Value());
    EXPECT_EQ(r.s->queued(), 0u);
    EXPECT_TRUE(r.errors.empty());
}

TEST(Session, ReassemblesOutOfOrderWithDuplicates)
{
    Rig r(with_mode("binary", 100));
    r.ch.signal_open();
    const Value v      = blob(500);
    auto        frames = frames_for(v, 0xABCDEF, 100);
    ASSERT_GT(frames.size(), 3u);

    r.ch.deliver(frames[1]);
    r.ch.deliver(frames[1]);
    for (std::size_t i = frames.size() - 1; i > 1; --i)
        r.ch.deliver(frames[i]);
    EXPECT_TRUE(r.data.empty());
    EXPECT_EQ(r.s->live_transfers(), 1u);
    r.ch.deliver(frames[0]);

    ASSERT_EQ(r.data.size(), 1u);
    EXPECT_EQ(r.data[0], v);
    EXPECT_EQ(r.descs[0], Descriptor::plain());
    EXPECT_EQ(r.s->live_transfers(), 0u);
    EXPECT_TRUE(r.errors.empty());
}

TEST(Session, OutOfRangeChunkDiscardsTransferOnly)
{
    Rig r(with_mode("binary", 100));
    r.ch.signal_open();
    const Value v      = blob(300);
    auto        frames = frames_for(v, 77, 100);
    ASSERT_GE(frames.size(), 3u);
    const Value other  = blob(250);
    auto        others = frames_for(other, 78, 100);

    r.ch.deliver(frames[0]);
    r.ch.deliver(others[0]);
    EXPECT_EQ(r.s->live_transfers(), 2u);

    // index == total
    auto       bad   = frames[1];
    const auto total = static_cast<std::uint32_t>(frames.size());
    bad[frag::INDEX_OFFSET + 0] = static_cast<std::uint8_t>(total >> 24);
    bad[frag::INDEX_OFFSET + 1] = static_cast<std::uint8_t>(total >> 16);
    bad[frag::INDEX_OFFSET + 2] = static_cast<std::uint8_t>(total >> 8);
    bad[frag::INDEX_OFFSET + 3] = static_cast<std::uint8_t>(total);
    r.ch.deliver(bad);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::MalformedChunk);
    EXPECT_EQ(r.s->live_transfers(), 1u);  // the other transfer survives
    EXPECT_TRUE(r.data.empty());

    // a clean resend of the same id completes
    for (const auto &f : frames)
        r.ch.deliver(f);
    ASSERT_EQ(r.data.size(), 1u);
    EXPECT_EQ(r.data[0], v);

    for (std::size_t i = 1; i < others.size(); ++i)
        r.ch.deliver(others[i]);
    ASSERT_EQ(r.data.size(), 2u);
    EXPECT_EQ(r.data[1], other);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST(Session, HugeTotalIsMalformedAndSessionStaysUsable)
{
    Rig r(with_mode("binary"));
    r.ch.signal_open();

    frag::Chunk c;
    c.meta.id    = 0x51;
    c.meta.type  = "binary";
    c.meta.size  = 1;
    c.meta.total = 0xFFFFFFFFu;
    c.index      = 0;
    c.data       = {0x2a};
    r.ch.deliver(frag::serialize(c));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::MalformedChunk);
    EXPECT_EQ(r.s->live_transfers(), 0u);
    EXPECT_EQ(r.s->state(), SessionState::Open);

    const Value v = blob(300);
    for (const auto &f : frames_for(v, 0x51, 128))
        r.ch.deliver(f);
    ASSERT_EQ(r.data.size(), 1u);
    EXPECT_EQ(r.data[0], v);
}

TEST(Session, GarbageFrameIsMalformed)
{
    Rig r(with_mode("binary-utf8"));
    r.ch.signal_open();
    r.ch.deliver(transport::Message{{1, 2, 3}, false});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::MalformedChunk);
    EXPECT_EQ(r.s->state(), SessionState::Open);
}

TEST(Session, CloseDiscardsEverything)
{
    Rig r(with_mode("binary", 100));
    r.ch.signal_open();
    auto frames = frames_for(blob(400), 5, 100);
    r.ch.deliver(frames[0]);
    r.s->send(blob(400));
    EXPECT_EQ(r.s->live_transfers(), 1u);
    EXPECT_GT(r.s->queued(), 0u);

    r.s->close();
    EXPECT_EQ(r.s->state(), SessionState::Closed);
    EXPECT_EQ(r.closes, 1);
    EXPECT_EQ(r.s->live_transfers(), 0u);
    EXPECT_EQ(r.s->queued(), 0u);
    EXPECT_TRUE(r.ch.stopped);
    EXPECT_FALSE(r.timer->active());

    r.s->close();
    EXPECT_EQ(r.closes, 1);

    r.s->send(blob(10));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, Errc::SendNotOpen);
    EXPECT_EQ(r.s->pending_sends(), 0u);
    EXPECT_TRUE(r.ch.sent.empty());
}

TEST(Session, ChannelClosedSignalClosesSession)
{
    Rig r(with_mode("json"));
    r.s->send(Value("held"));
    r.ch.signal_open();
    r.ch.signal_closed();
    EXPECT_EQ(r.s->state(), SessionState::Closed);
    EXPECT_EQ(r.closes, 1);
    EXPECT_EQ(r.s->queued(), 0u);
    r.drain();
    EXPECT_TRUE(r.ch.sent.empty());
}

TEST(Session, PendingCloseDropsHeldSends)
{
    Rig r(with_mode("none"));
    r.s->send(Value("x"));
    r.s->close();
    EXPECT_EQ(r.s->pending_sends(), 0u);
    EXPECT_EQ(r.closes, 1);
    EXPECT_EQ(r.opens, 0);
}

TEST(SessionLoopback, BinaryTransferBetweenLinkedSessions)
{
    for (const char *mode : {"binary", "binary-utf8"})
    {
        transport::LoopbackTransport a, b;
        transport::LoopbackTransport::link(a, b);
        transport::LoopbackNegotiator na(a), nb(b);

        auto          *ta = new ManualTimer;
        auto          *tb = new ManualTimer;
        SessionOptions o  = with_mode(mode, 256);
        TransferSession tx(na, std::unique_ptr<sched::ITimer>(ta), o);
        o.offer = "offer";
        TransferSession rx(nb, std::unique_ptr<sched::ITimer>(tb), o);

        std::vector<Value> got;
        Descriptor         got_desc;
        rx.on_data([&](const Value &v, const Descriptor &d) {
            got.push_back(v);
            got_desc = d;
        });

        Value v;
        v["title"] = "caf\xc3\xa9";
        v["body"]  = blob(5000);
        tx.send(v, Descriptor::typed("application/x-demo"));  // held until open
        a.open();
        EXPECT_EQ(tx.state(), SessionState::Open);
        EXPECT_EQ(rx.state(), SessionState::Open);

        while (ta->fire())
        {
        }
        ASSERT_EQ(got.size(), 1u) << mode;
        EXPECT_EQ(got[0], v);
        EXPECT_EQ(got_desc, Descriptor::typed("application/x-demo"));
        EXPECT_GT(a.sent(), 20u);

        tx.close();
        EXPECT_EQ(rx.state(), SessionState::Closed);
    }
}

TEST(SessionLoopback, EchoOnEventLoop)
{
    sched::EventLoop             loop;
    transport::LoopbackTransport ch;  // unlinked: echoes to itself
    transport::LoopbackNegotiator neg(ch);

    SessionOptions o = with_mode("binary", 512);
    o.send_interval  = 1ms;
    TransferSession s(neg, std::make_unique<sched::LoopTimer>(loop), o);

    std::vector<Value> got;
    s.on_data([&](const Value &v, const Descriptor &) { got.push_back(v); });
    loop.post([&] { ch.open(); });
    loop.post([&] {
        s.send(Value("first"));
        s.send(blob(3000));
        s.send(Value({{"last", true}}));
    });

    ASSERT_TRUE(loop.run_until([&] { return got.size() == 3; }, 5000ms));
    EXPECT_EQ(got[0], Value("first"));
    EXPECT_EQ(got[1], blob(3000));
    EXPECT_EQ(got[2], Value({{"last", true}}));
    EXPECT_EQ(loop.timers(), 0u);
}
