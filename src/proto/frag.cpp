#include <algorithm>
#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>
#include <endian.h>  // htobe64, be64toh
#include <sodium.h>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

static bool ensure_sodium_init()
{
    static bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::uint64_t random_transfer_id()
{
    if (!ensure_sodium_init())
        LOG_WARN("random_transfer_id: sodium_init failed");
    std::uint64_t id = 0;
    randombytes_buf(&id, sizeof id);
    return id;
}

std::size_t envelope_overhead(const Metadata &meta)
{
    std::size_t n = FIXED_HDR_SIZE + STR_LEN_SIZE + meta.type.size() + DATA_LEN_SIZE;
    if (meta.name)
        n += STR_LEN_SIZE + meta.name->size();
    if (meta.mime_type)
        n += STR_LEN_SIZE + meta.mime_type->size();
    return n;
}

static bool fields_fit(const Metadata &meta)
{
    if (meta.type.size() > MAX_FIELD_LEN)
        return false;
    if (meta.name && meta.name->size() > MAX_FIELD_LEN)
        return false;
    if (meta.mime_type && meta.mime_type->size() > MAX_FIELD_LEN)
        return false;
    return true;
}

bool split(const Bytes &packed, Metadata meta, std::size_t max_message_size, std::vector<Chunk> &out)
{
    out.clear();
    if (!fields_fit(meta))
    {
        LOG_ERROR("split: metadata field longer than %zu bytes", MAX_FIELD_LEN);
        return false;
    }
    const std::size_t overhead = envelope_overhead(meta);
    if (max_message_size <= overhead)
    {
        LOG_ERROR("split: envelope overhead (%zu) leaves no room in max message size (%zu)",
                  overhead, max_message_size);
        return false;
    }
    const std::size_t chunk_size = max_message_size - overhead;

    meta.size = packed.size();
    // an empty payload still travels as one empty chunk so the receiver can complete
    const std::size_t num_chunks =
        packed.empty() ? 1 : (packed.size() + chunk_size - 1) / chunk_size;
    if (num_chunks > UINT32_MAX)
    {
        LOG_ERROR("split: payload too large (%zu bytes, needs %zu chunks)", packed.size(),
                  num_chunks);
        return false;
    }
    meta.total = static_cast<std::uint32_t>(num_chunks);

    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = std::min(chunk_size, packed.size() - start);
        Chunk             c;
        c.meta  = meta;
        c.index = static_cast<std::uint32_t>(i);
        if (take)
            c.data.assign(packed.begin() + start, packed.begin() + start + take);
        out.push_back(std::move(c));
    }
    return true;
}

static void put_u16(Bytes &out, std::uint16_t v)
{
    std::uint16_t be = htons(v);
    const auto   *p  = reinterpret_cast<const std::uint8_t *>(&be);
    out.insert(out.end(), p, p + sizeof be);
}

static void put_u32(Bytes &out, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    const auto   *p  = reinterpret_cast<const std::uint8_t *>(&be);
    out.insert(out.end(), p, p + sizeof be);
}

static void put_u64(Bytes &out, std::uint64_t v)
{
    std::uint64_t be = htobe64(v);
    const auto   *p  = reinterpret_cast<const std::uint8_t *>(&be);
    out.insert(out.end(), p, p + sizeof be);
}

static void put_str(Bytes &out, const std::string &s)
{
    put_u16(out, static_cast<std::uint16_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

Bytes serialize(const Chunk &c)
{
    // validate fields before packing
    if (c.meta.total == 0 || c.index >= c.meta.total)
    {
        LOG_ERROR("serialize: invalid index %u of %u", c.index, c.meta.total);
        return {};
    }
    if (!fields_fit(c.meta) || c.data.size() > UINT32_MAX)
    {
        LOG_ERROR("serialize: field too long");
        return {};
    }

    Bytes out;
    out.reserve(envelope_overhead(c.meta) + c.data.size());

    std::uint8_t flags = 0;
    if (c.meta.name)
        flags |= FLAG_NAME;
    if (c.meta.mime_type)
        flags |= FLAG_MIME;

    out.push_back(PROTO_VER);
    out.push_back(flags);
    put_u64(out, c.meta.id);
    put_u64(out, c.meta.size);
    put_u32(out, c.meta.total);
    put_u32(out, c.index);
    put_str(out, c.meta.type);
    if (c.meta.name)
        put_str(out, *c.meta.name);
    if (c.meta.mime_type)
        put_str(out, *c.meta.mime_type);
    put_u32(out, static_cast<std::uint32_t>(c.data.size()));
    out.insert(out.end(), c.data.begin(), c.data.end());
    return out;
}

namespace
{
// Bounds-checked cursor over an inbound frame.
struct Reader
{
    const Bytes &buf;
    std::size_t  pos = 0;

    bool take(void *dst, std::size_t n)
    {
        if (buf.size() - pos < n)
            return false;
        std::memcpy(dst, buf.data() + pos, n);
        pos += n;
        return true;
    }
    bool u16(std::uint16_t &v)
    {
        std::uint16_t be;
        if (!take(&be, sizeof be))
            return false;
        v = ntohs(be);
        return true;
    }
    bool u32(std::uint32_t &v)
    {
        std::uint32_t be;
        if (!take(&be, sizeof be))
            return false;
        v = ntohl(be);
        return true;
    }
    bool u64(std::uint64_t &v)
    {
        std::uint64_t be;
        if (!take(&be, sizeof be))
            return false;
        v = be64toh(be);
        return true;
    }
    bool str(std::string &s)
    {
        std::uint16_t len;
        if (!u16(len) || buf.size() - pos < len)
            return false;
        s.assign(reinterpret_cast<const char *>(buf.data() + pos), len);
        pos += len;
        return true;
    }
};
}  // namespace

std::optional<Chunk> parse(const Bytes &frame)
{
    // structural checks only; index/total semantics belong to the reassembler
    if (frame.size() < FIXED_HDR_SIZE + STR_LEN_SIZE + DATA_LEN_SIZE)
    {
        LOG_ERROR("parse: frame too short! (%zu)", frame.size());
        return std::nullopt;
    }
    if (frame[0] != PROTO_VER)
    {
        LOG_ERROR("parse: unknown version %u", static_cast<unsigned>(frame[0]));
        return std::nullopt;
    }
    const std::uint8_t flags = frame[1];
    if (flags & ~(FLAG_NAME | FLAG_MIME))
    {
        LOG_ERROR("parse: unknown flags 0x%02x", static_cast<unsigned>(flags));
        return std::nullopt;
    }

    Chunk  c;
    Reader r{frame, 2};
    bool   ok = r.u64(c.meta.id) && r.u64(c.meta.size) && r.u32(c.meta.total) &&
              r.u32(c.index) && r.str(c.meta.type);
    if (ok && (flags & FLAG_NAME))
        ok = r.str(c.meta.name.emplace());
    if (ok && (flags & FLAG_MIME))
        ok = r.str(c.meta.mime_type.emplace());
    std::uint32_t len = 0;
    ok = ok && r.u32(len);
    if (!ok)
    {
        LOG_ERROR("parse: truncated envelope (%zu bytes)", frame.size());
        return std::nullopt;
    }

    const std::size_t expected = r.pos + static_cast<std::size_t>(len);
    if (frame.size() != expected)
    {
        LOG_ERROR("parse: size mismatch (got %zu, expect %zu)", frame.size(), expected);
        return std::nullopt;
    }
    c.data.assign(frame.begin() + r.pos, frame.end());
    return c;
}

std::optional<std::uint32_t> Reassembler::received(std::uint64_t id) const
{
    auto it = map_.find(id);
    if (it == map_.end())
        return std::nullopt;
    return static_cast<std::uint32_t>(it->second.parts.size());
}

Reassembler::Result Reassembler::feed(const Chunk &c, Assembled &out)
{
    const std::uint64_t id = c.meta.id;
    if (c.meta.total == 0 || c.index >= c.meta.total)
    {
        LOG_ERROR("Reassembler::feed: index %u out of range (total=%u, id=%016llx)", c.index,
                  c.meta.total, static_cast<unsigned long long>(id));
        clear(id);
        return Result::Malformed;
    }
    // every part but an empty transfer's single one carries at least one byte
    if (c.meta.total > std::max<std::uint64_t>(c.meta.size, 1))
    {
        LOG_ERROR("Reassembler::feed: total %u exceeds advertised size %llu (id=%016llx)",
                  c.meta.total, static_cast<unsigned long long>(c.meta.size),
                  static_cast<unsigned long long>(id));
        clear(id);
        return Result::Malformed;
    }

    auto it = map_.find(id);
    if (it == map_.end())
    {
        Transfer t;
        t.meta = c.meta;
        it     = map_.emplace(id, std::move(t)).first;
    }
    else if (it->second.meta.total != c.meta.total)
    {
        LOG_ERROR("Reassembler::feed: total changed %u -> %u (id=%016llx)", it->second.meta.total,
                  c.meta.total, static_cast<unsigned long long>(id));
        clear(id);
        return Result::Malformed;
    }

    Transfer &st   = it->second;
    auto      slot = st.parts.find(c.index);
    if (slot != st.parts.end())
    {
        // overwrite, but never count an index twice
        LOG_DEBUG("Reassembler::feed: duplicate chunk (id=%016llx, index=%u)",
                  static_cast<unsigned long long>(id), c.index);
        st.bytes -= slot->second.size();
        slot->second = c.data;
    }
    else
    {
        st.parts.emplace(c.index, c.data);
    }
    st.bytes += c.data.size();

    if (st.bytes > st.meta.size)
    {
        LOG_ERROR("Reassembler::feed: %zu bytes exceed advertised size %llu (id=%016llx)",
                  st.bytes, static_cast<unsigned long long>(st.meta.size),
                  static_cast<unsigned long long>(id));
        clear(id);
        return Result::Malformed;
    }

    if (st.parts.size() < st.meta.total)
        return Result::Incomplete;  // not done yet

    Transfer done = std::move(st);
    map_.erase(it);
    if (done.bytes != done.meta.size)
    {
        LOG_ERROR("Reassembler::feed: got %zu bytes, advertised %llu (id=%016llx)", done.bytes,
                  static_cast<unsigned long long>(done.meta.size),
                  static_cast<unsigned long long>(id));
        return Result::Malformed;
    }

    out.meta = std::move(done.meta);
    out.payload.clear();
    out.payload.reserve(done.bytes);
    // std::map iterates in index order
    for (const auto &part : done.parts)
        out.payload.insert(out.payload.end(), part.second.begin(), part.second.end());
    return Result::Complete;
}

}  // namespace frag
