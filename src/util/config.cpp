#include <cstdlib>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

static bool parse_ulong(const char *e, unsigned long lo, unsigned long hi, unsigned long &out)
{
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (!p || p == e || *p != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

Settings from_env()
{
    Settings s;
    if (const char *e = std::getenv(constants::ENV_SERIALIZATION); e && *e)
        s.serialization = e;

    if (const char *e = std::getenv(constants::ENV_MAX_MESSAGE_SIZE))
    {
        unsigned long v = 0;
        if (parse_ulong(e, constants::MIN_MESSAGE_SIZE_ENV, constants::MAX_MESSAGE_SIZE_ENV, v))
        {
            s.max_message_size = static_cast<std::size_t>(v);
            LOG_INFO("Using max_message_size=%zu (from %s)", s.max_message_size,
                     constants::ENV_MAX_MESSAGE_SIZE);
        }
        else
        {
            LOG_WARN("Ignoring invalid %s='%s' (expect %zu..%zu)", constants::ENV_MAX_MESSAGE_SIZE,
                     e, constants::MIN_MESSAGE_SIZE_ENV, constants::MAX_MESSAGE_SIZE_ENV);
        }
    }

    if (const char *e = std::getenv(constants::ENV_SEND_INTERVAL_MS))
    {
        unsigned long v = 0;
        if (parse_ulong(e, 1, constants::MAX_SEND_INTERVAL_MS, v))
        {
            s.send_interval = std::chrono::milliseconds(v);
            LOG_INFO("Using send_interval=%lums (from %s)", v, constants::ENV_SEND_INTERVAL_MS);
        }
        else
        {
            LOG_WARN("Ignoring invalid %s='%s' (expect 1..%u)", constants::ENV_SEND_INTERVAL_MS, e,
                     constants::MAX_SEND_INTERVAL_MS);
        }
    }

    if (const char *e = std::getenv(constants::ENV_LABEL))
        s.label = e;
    if (const char *e = std::getenv(constants::ENV_LOG_LEVEL); e && *e)
    {
        if (chunkwire::level_from_name(e))
            s.log_level = e;
        else
            LOG_WARN("Ignoring invalid %s='%s' (expect debug|info|warn|error)",
                     constants::ENV_LOG_LEVEL, e);
    }
    return s;
}

app::SessionOptions to_session_options(const Settings &s)
{
    app::SessionOptions o;
    o.serialization    = s.serialization;
    o.label            = s.label;
    o.max_message_size = s.max_message_size;
    o.send_interval    = s.send_interval;
    return o;
}

}  // namespace config
