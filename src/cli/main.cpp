#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "app/transfer_session.hpp"
#include "sched/event_loop.hpp"
#include "sched/timer.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkwire [options] <file>\n"
                         "\n"
                         "Sends <file> between two linked loopback sessions and verifies it.\n"
                         "\n"
                         "Options:\n"
                         "  --mode binary|binary-utf8|json|none\n"
                         "  --max <bytes>        max message size of the channel\n"
                         "  --interval <ms>      send queue drain period\n"
                         "  --label <label>\n");
}

static bool parse_size(const std::string &s, unsigned long &out)
{
    char         *p = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &p, 10);
    if (s.empty() || !p || *p != '\0' || v == 0)
        return false;
    out = v;
    return true;
}

static bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

// Builds the value to send for the chosen mode; false if the file cannot be expressed.
static bool make_value(serial::Mode                     mode,
                       const std::vector<std::uint8_t> &bytes,
                       std::size_t                      max_message_size,
                       serial::Value                   &out)
{
    switch (mode)
    {
        case serial::Mode::Json:
            out = serial::Value::parse(bytes.begin(), bytes.end(), nullptr, false);
            if (out.is_discarded())
            {
                std::fprintf(stderr, "error: json mode needs a file holding a JSON document\n");
                return false;
            }
            return true;
        case serial::Mode::None:
            if (bytes.size() > max_message_size)
            {
                std::fprintf(stderr, "error: none mode cannot send %zu bytes (max %zu)\n",
                             bytes.size(), max_message_size);
                return false;
            }
            out = serial::Value::binary(bytes);
            return true;
        case serial::Mode::Binary:
        case serial::Mode::BinaryUtf8:
            out = serial::Value::binary(bytes);
            return true;
    }
    return false;
}

}  // namespace

int main(int argc, char **argv)
{
    config::Settings cfg = config::from_env();
    if (!cfg.log_level.empty())
        chunkwire::set_log_level_by_name(cfg.log_level.c_str());

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        unsigned long v = 0;
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--mode" && i + 1 < argc)
        {
            cfg.serialization = argv[++i];
        }
        else if (a == "--max" && i + 1 < argc)
        {
            if (!parse_size(argv[++i], v))
            {
                std::fprintf(stderr, "error: invalid --max '%s'\n", argv[i]);
                return exitc::bad_args;
            }
            cfg.max_message_size = v;
        }
        else if (a == "--interval" && i + 1 < argc)
        {
            if (!parse_size(argv[++i], v))
            {
                std::fprintf(stderr, "error: invalid --interval '%s'\n", argv[i]);
                return exitc::bad_args;
            }
            cfg.send_interval = std::chrono::milliseconds(v);
        }
        else if (a == "--label" && i + 1 < argc)
        {
            cfg.label = argv[++i];
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string        &path = args[0];
    std::vector<std::uint8_t> bytes;
    if (!read_file(path, bytes))
    {
        LOG_ERROR("cannot read %s", path.c_str());
        return exitc::io_error;
    }

    sched::EventLoop               loop;
    transport::LoopbackTransport   ch_a, ch_b;
    transport::LoopbackTransport::link(ch_a, ch_b);
    transport::LoopbackNegotiator  neg_a(ch_a), neg_b(ch_b);

    app::SessionOptions opts = config::to_session_options(cfg);
    std::unique_ptr<app::TransferSession> tx, rx;
    try
    {
        tx = std::make_unique<app::TransferSession>(neg_a, std::make_unique<sched::LoopTimer>(loop),
                                                    opts);
        opts.offer = "loopback";
        rx = std::make_unique<app::TransferSession>(neg_b, std::make_unique<sched::LoopTimer>(loop),
                                                    opts);
    }
    catch (const chunkwire::ConfigurationError &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        return exitc::bad_args;
    }

    serial::Value value;
    if (!make_value(tx->serialization_mode(), bytes, cfg.max_message_size, value))
        return exitc::bad_args;
    const auto desc = serial::Descriptor::named(std::filesystem::path(path).filename().string(),
                                                "application/octet-stream");

    bool               done   = false;
    bool               failed = false;
    serial::Value      got;
    serial::Descriptor got_desc;

    auto on_err = [&](const chunkwire::Error &e) {
        // pre-open sends are expected to report SendNotOpen; everything else is fatal
        if (e.code == chunkwire::Errc::SendNotOpen)
            return;
        LOG_ERROR("%s: %s", chunkwire::errc_name(e.code), e.message.c_str());
        failed = true;
    };
    tx->on_error(on_err);
    rx->on_error(on_err);
    rx->on_data([&](const serial::Value &v, const serial::Descriptor &d) {
        got      = v;
        got_desc = d;
        done     = true;
    });

    // submitted before the channel is ready: held until open
    tx->send(value, desc);
    loop.post([&] { ch_a.open(); });

    const std::size_t frames_hint = bytes.size() / cfg.max_message_size + 2;
    const std::chrono::milliseconds timeout(
        5000 + static_cast<long long>(frames_hint) * cfg.send_interval.count() * 4);
    loop.run_until([&] { return done || failed; }, timeout);

    if (!done)
    {
        LOG_ERROR("transfer did not complete (%s)", failed ? "error" : "timeout");
        return exitc::transfer_failed;
    }
    if (got != value)
    {
        LOG_ERROR("received value differs from the one sent");
        return exitc::transfer_failed;
    }

    LOG_SYSTEM("[%s] %zu bytes in %zu messages (name=%s)",
               serial::mode_name(tx->serialization_mode()), bytes.size(), ch_a.sent(),
               got_desc.name.empty() ? "-" : got_desc.name.c_str());
    tx->close();
    return exitc::ok;
}
