#include <string>
#include <utility>

#include "serial/serializer.hpp"
#include "util/log.hpp"

namespace serial
{

std::optional<Mode> mode_from_name(std::string_view name)
{
    if (name == "binary")
        return Mode::Binary;
    if (name == "binary-utf8")
        return Mode::BinaryUtf8;
    if (name == "json")
        return Mode::Json;
    if (name == "none")
        return Mode::None;
    return std::nullopt;
}

const char *mode_name(Mode m)
{
    switch (m)
    {
        case Mode::Binary:
            return "binary";
        case Mode::BinaryUtf8:
            return "binary-utf8";
        case Mode::Json:
            return "json";
        case Mode::None:
            return "none";
    }
    return "?";
}

bool mode_is_chunked(Mode m)
{
    return m == Mode::Binary || m == Mode::BinaryUtf8;
}

static std::string repair_utf8(const std::string &s)
{
    // dump() with error_handler_t::replace substitutes U+FFFD for every bad sequence
    const std::string quoted = Value(s).dump(-1, ' ', false, Value::error_handler_t::replace);
    return Value::parse(quoted).get<std::string>();
}

Value sanitize_utf8(const Value &v)
{
    if (v.is_string())
        return repair_utf8(v.get_ref<const std::string &>());
    if (v.is_array())
    {
        Value out = Value::array();
        for (const auto &e : v)
            out.push_back(sanitize_utf8(e));
        return out;
    }
    if (v.is_object())
    {
        Value out = Value::object();
        for (auto it = v.begin(); it != v.end(); ++it)
            out[repair_utf8(it.key())] = sanitize_utf8(it.value());
        return out;
    }
    return v;
}

static bool contains_binary(const Value &v)
{
    if (v.is_binary())
        return true;
    if (v.is_structured())
    {
        for (const auto &e : v)
        {
            if (contains_binary(e))
                return true;
        }
    }
    return false;
}

namespace
{

class NoneSerializer final : public Serializer
{
  public:
    Mode mode() const override { return Mode::None; }

    bool encode(const Value &in, Packed &out, std::string &err) const override
    {
        if (in.is_string())
        {
            const auto &s = in.get_ref<const std::string &>();
            out.bytes.assign(s.begin(), s.end());
            out.text = true;
            return true;
        }
        if (in.is_binary())
        {
            const auto &b = in.get_binary();
            out.bytes.assign(b.begin(), b.end());
            out.text = false;
            return true;
        }
        err = std::string("value of type '") + in.type_name() +
              "' is not a string or binary buffer";
        return false;
    }

    bool decode(const Packed &in, Value &out, std::string & /*err*/) const override
    {
        if (in.text)
            out = std::string(in.bytes.begin(), in.bytes.end());
        else
            out = Value::binary(in.bytes);
        return true;
    }
};

class JsonSerializer final : public Serializer
{
  public:
    Mode mode() const override { return Mode::Json; }

    bool encode(const Value &in, Packed &out, std::string &err) const override
    {
        if (contains_binary(in))
        {
            err = "binary values have no JSON representation";
            return false;
        }
        std::string text;
        try
        {
            text = in.dump();
        }
        catch (const Value::exception &e)
        {
            err = e.what();
            return false;
        }
        out.bytes.assign(text.begin(), text.end());
        out.text = true;
        return true;
    }

    bool decode(const Packed &in, Value &out, std::string &err) const override
    {
        out = Value::parse(in.bytes.begin(), in.bytes.end(), nullptr, /*allow_exceptions=*/false);
        if (out.is_discarded())
        {
            err = "malformed JSON text (" + std::to_string(in.bytes.size()) + " bytes)";
            return false;
        }
        return true;
    }
};

class BinarySerializer final : public Serializer
{
  public:
    explicit BinarySerializer(bool utf8) : utf8_(utf8) {}

    Mode mode() const override { return utf8_ ? Mode::BinaryUtf8 : Mode::Binary; }

    bool encode(const Value &in, Packed &out, std::string &err) const override
    {
        if (in.is_discarded())
        {
            err = "discarded value cannot be encoded";
            return false;
        }
        try
        {
            out.bytes = utf8_ ? Value::to_msgpack(sanitize_utf8(in)) : Value::to_msgpack(in);
        }
        catch (const Value::exception &e)
        {
            err = e.what();
            return false;
        }
        out.text = false;
        return true;
    }

    bool decode(const Packed &in, Value &out, std::string &err) const override
    {
        out = Value::from_msgpack(in.bytes, /*strict=*/true, /*allow_exceptions=*/false);
        if (out.is_discarded())
        {
            err = "malformed MessagePack payload (" + std::to_string(in.bytes.size()) + " bytes)";
            return false;
        }
        if (utf8_)
            out = sanitize_utf8(out);
        return true;
    }

  private:
    bool utf8_;
};

}  // namespace

std::unique_ptr<Serializer> make_serializer(Mode m)
{
    switch (m)
    {
        case Mode::None:
            return std::make_unique<NoneSerializer>();
        case Mode::Json:
            return std::make_unique<JsonSerializer>();
        case Mode::Binary:
            return std::make_unique<BinarySerializer>(false);
        case Mode::BinaryUtf8:
            return std::make_unique<BinarySerializer>(true);
    }
    LOG_ERROR("make_serializer: unknown mode %d", static_cast<int>(m));
    return nullptr;
}

}  // namespace serial
