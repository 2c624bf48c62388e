#pragma once
#include <stdexcept>
#include <string>

namespace chunkwire
{

// Runtime failures reported through a session's error event.
enum class Errc
{
    Configuration,
    Serialization,
    ChunkSize,       // envelope metadata alone exceeds the channel's message size
    MalformedChunk,  // inbound chunk with a bad index/total or an unparseable envelope
    SendNotOpen
};

inline const char *errc_name(Errc e)
{
    switch (e)
    {
        case Errc::Configuration:
            return "ConfigurationError";
        case Errc::Serialization:
            return "SerializationError";
        case Errc::ChunkSize:
            return "ChunkSizeError";
        case Errc::MalformedChunk:
            return "MalformedChunkError";
        case Errc::SendNotOpen:
            return "SendNotOpenError";
    }
    return "?";
}

struct Error
{
    Errc        code;
    std::string message;
};

// Thrown from a session constructor; there is no listener to report to yet.
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

}  // namespace chunkwire
