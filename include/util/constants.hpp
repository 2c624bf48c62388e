#pragma once
#include <cstddef>
#include <string_view>

namespace constants
{
// Largest message a data channel is assumed to carry in one piece.
inline constexpr std::size_t MAX_MESSAGE_SIZE     = 16300;
inline constexpr std::size_t MIN_MESSAGE_SIZE_ENV = 64;
inline constexpr std::size_t MAX_MESSAGE_SIZE_ENV = 256 * 1024;

// Send Scheduler drain period
inline constexpr unsigned SEND_INTERVAL_MS     = 10;
inline constexpr unsigned MAX_SEND_INTERVAL_MS = 10000;

inline constexpr std::string_view DEFAULT_SERIALIZATION = "binary";
inline constexpr std::string_view SESSION_ID_PREFIX     = "dc_";
inline constexpr std::string_view CHANNEL_KIND          = "data";

// Environment variables read by config::from_env()
inline constexpr const char *ENV_SERIALIZATION    = "CHUNKWIRE_SERIALIZATION";
inline constexpr const char *ENV_MAX_MESSAGE_SIZE = "CHUNKWIRE_MAX_MESSAGE_SIZE";
inline constexpr const char *ENV_SEND_INTERVAL_MS = "CHUNKWIRE_SEND_INTERVAL_MS";
inline constexpr const char *ENV_LABEL            = "CHUNKWIRE_LABEL";
inline constexpr const char *ENV_LOG_LEVEL        = "CHUNKWIRE_LOG_LEVEL";

}  // namespace constants
