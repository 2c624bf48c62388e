#pragma once
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
Serialization modes:
  none        -> value must already be a string or a binary blob; sent as-is
  json        -> JSON text, one channel message, never chunked
  binary      -> MessagePack bytes, chunked by frag::split
  binary-utf8 -> as binary, every string (keys included) is repaired to valid UTF-8
*/

namespace serial
{

using Value = nlohmann::json;
using Bytes = std::vector<std::uint8_t>;

enum class Mode
{
    Binary,
    BinaryUtf8,
    Json,
    None
};

std::optional<Mode> mode_from_name(std::string_view name);
const char         *mode_name(Mode m);
// binary modes go through Chunker/Reassembler, json and none are single messages
bool                mode_is_chunked(Mode m);

// What a data channel carries: raw bytes plus whether they are text.
struct Packed
{
    Bytes bytes;
    bool  text{false};
};

// Describes what kind of object a value stands for; travels in every chunk envelope.
struct Descriptor
{
    enum class Kind
    {
        Plain,
        Typed,  // blob-like, has a content type
        Named   // file-like, has a name (and usually a content type)
    };
    Kind        kind{Kind::Plain};
    std::string name;
    std::string mime_type;

    static Descriptor plain() { return {}; }
    static Descriptor typed(std::string mime) { return {Kind::Typed, {}, std::move(mime)}; }
    static Descriptor named(std::string name, std::string mime = {})
    {
        return {Kind::Named, std::move(name), std::move(mime)};
    }

    bool operator==(const Descriptor &o) const
    {
        return kind == o.kind && name == o.name && mime_type == o.mime_type;
    }
};

class Serializer
{
  public:
    virtual ~Serializer() = default;

    virtual Mode mode() const = 0;
    // On failure `err` holds a human readable reason and `out` is unspecified.
    virtual bool encode(const Value &in, Packed &out, std::string &err) const = 0;
    virtual bool decode(const Packed &in, Value &out, std::string &err) const = 0;
};

std::unique_ptr<Serializer> make_serializer(Mode m);

// Replace ill-formed UTF-8 in every string and object key with U+FFFD.
Value sanitize_utf8(const Value &v);

}  // namespace serial
