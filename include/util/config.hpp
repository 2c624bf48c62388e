#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "app/transfer_session.hpp"
#include "util/constants.hpp"

namespace config
{

struct Settings
{
    std::string               serialization{constants::DEFAULT_SERIALIZATION};
    std::size_t               max_message_size = constants::MAX_MESSAGE_SIZE;
    std::chrono::milliseconds send_interval{constants::SEND_INTERVAL_MS};
    std::string               label;
    std::string               log_level;  // empty: leave the logger alone
};

// Overlay CHUNKWIRE_* environment variables on the defaults. Out-of-range
// numbers are ignored with a warning.
Settings from_env();

app::SessionOptions to_session_options(const Settings &s);

}  // namespace config
