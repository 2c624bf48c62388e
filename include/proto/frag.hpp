#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/*
TX (binary modes):
session.send(value)
  -> Serializer.encode(value)  = packed payload
     -> split(packed, meta, max_message_size)
        -> for each Chunk {meta, index, data}:
             serialize(Chunk)  // one frame <= max_message_size
               -> SendQueue.enqueue(frame)

RX:
transport.on_message(frame)
  -> parse(frame)  // structural checks only
      -> ok? reassembler.feed(Chunk)
            -> Complete ? Serializer.decode(payload) -> data event

Frame layout (big-endian):
  [0]      ver
  [1]      flags (FLAG_NAME, FLAG_MIME)
  [2..9]   transfer id
  [10..17] size of the whole packed payload
  [18..21] total parts
  [22..25] index
  [26..]   u16 len + type
           u16 len + name       (FLAG_NAME only)
           u16 len + mime type  (FLAG_MIME only)
           u32 len + data
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t PROTO_VER      = 1;
inline constexpr std::uint8_t FLAG_NAME      = 1 << 0;
inline constexpr std::uint8_t FLAG_MIME      = 1 << 1;
inline constexpr std::size_t  FIXED_HDR_SIZE = 26;
inline constexpr std::size_t  INDEX_OFFSET   = 22;
inline constexpr std::size_t  STR_LEN_SIZE   = 2;
inline constexpr std::size_t  DATA_LEN_SIZE  = 4;
inline constexpr std::size_t  MAX_FIELD_LEN  = 0xFFFF;

using Bytes = std::vector<std::uint8_t>;

// Identical for every chunk of one transfer.
struct Metadata
{
    std::uint64_t              id{0};
    std::string                type;
    std::uint64_t              size{0};
    std::uint32_t              total{0};
    std::optional<std::string> name;
    std::optional<std::string> mime_type;
};

struct Chunk
{
    Metadata      meta;
    std::uint32_t index{0};
    Bytes         data;
};

// Random 64-bit transfer id (libsodium).
std::uint64_t random_transfer_id();

// Bytes of a frame that are not payload: the whole envelope minus `data`.
std::size_t envelope_overhead(const Metadata &meta);

// TX
// Fills meta.total. False when the envelope leaves no room for payload
// (or a metadata string is longer than MAX_FIELD_LEN).
bool  split(const Bytes       &packed,
            Metadata           meta,
            std::size_t        max_message_size,
            std::vector<Chunk> &out);
Bytes serialize(const Chunk &c);  // empty on failure
// RX
std::optional<Chunk> parse(const Bytes &frame);

struct Assembled
{
    Metadata meta;
    Bytes    payload;
};

class Reassembler
{
  public:
    enum class Result
    {
        Incomplete,
        Complete,  // `out` holds the transfer, which has left the table
        Malformed  // chunk dropped and its transfer discarded; also when total > max(size, 1)
    };

    Result feed(const Chunk &c, Assembled &out);

    void        clear(std::uint64_t id) { map_.erase(id); }
    void        clear() { map_.clear(); }
    std::size_t live() const { return map_.size(); }
    // distinct parts seen so far, nullopt when no transfer is live for `id`
    std::optional<std::uint32_t> received(std::uint64_t id) const;

  private:
    struct Transfer
    {
        Metadata                       meta;
        std::size_t                    bytes = 0;
        std::map<std::uint32_t, Bytes> parts;  // filled sparsely, keyed by index
    };
    std::unordered_map<std::uint64_t, Transfer> map_;
};

}  // namespace frag
