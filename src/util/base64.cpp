#include <uuidb64/base64.hpp>

namespace uuidb64::base64 {

static const char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

static int symbol_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

static std::string describe_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x20 && uc < 0x7f) return std::string("'") + c + "'";
    static const char hex[] = "0123456789abcdef";
    return std::string("byte 0x") + hex[uc >> 4] + hex[uc & 0x0F];
}

// ---- Encode ----

// Encodes len bytes into encoded_len(len) symbols starting at out.
static void encode_raw(const uint8_t* data, size_t len, char* out) {
    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16)
                   | (uint32_t(data[i + 1]) << 8)
                   | uint32_t(data[i + 2]);
        *out++ = alphabet[(n >> 18) & 0x3F];
        *out++ = alphabet[(n >> 12) & 0x3F];
        *out++ = alphabet[(n >> 6) & 0x3F];
        *out++ = alphabet[n & 0x3F];
    }

    size_t rem = len - i;
    if (rem == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        *out++ = alphabet[(n >> 18) & 0x3F];
        *out++ = alphabet[(n >> 12) & 0x3F];
    } else if (rem == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        *out++ = alphabet[(n >> 18) & 0x3F];
        *out++ = alphabet[(n >> 12) & 0x3F];
        *out++ = alphabet[(n >> 6) & 0x3F];
    }
}

std::string encode(const uint8_t* data, size_t len) {
    std::string out(encoded_len(len), '\0');
    encode_raw(data, len, out.data());
    return out;
}

std::string encode(const Bytes16& bytes) {
    std::string out(kEncodedLen, '\0');
    encode_raw(bytes.data(), bytes.size(), out.data());
    return out;
}

void encode_to(const Bytes16& bytes, char* out) {
    encode_raw(bytes.data(), bytes.size(), out);
}

void encode_append(const Bytes16& bytes, std::string& out) {
    size_t offset = out.size();
    out.resize(offset + kEncodedLen);
    encode_raw(bytes.data(), bytes.size(), out.data() + offset);
}

// ---- Decode ----

// Checks the alphabet and the symbol count. Returns the decoded byte count.
static Result<size_t> validate(std::string_view s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '=') {
            return UuidB64Error::parse(std::string(s),
                "padding character '=' at position " + std::to_string(i)
                + " is not allowed");
        }
        if (symbol_val(s[i]) < 0) {
            return UuidB64Error::parse(std::string(s),
                "invalid character " + describe_char(s[i]) + " at position "
                + std::to_string(i) + " (alphabet is A-Z a-z 0-9 - _)");
        }
    }
    if (s.size() % 4 == 1) {
        return UuidB64Error::parse(std::string(s),
            "invalid length " + std::to_string(s.size())
            + ": a trailing group of one symbol cannot encode a byte");
    }
    return Result<size_t>::ok((s.size() / 4) * 3 + (s.size() % 4 == 0 ? 0 : s.size() % 4 - 1));
}

// Decodes an already validated string into out, which must hold the
// decoded byte count.
static Status decode_raw(std::string_view s, uint8_t* out, DecodeOptions opts) {
    size_t i = 0;
    for (; i + 4 <= s.size(); i += 4) {
        uint32_t n = (uint32_t(symbol_val(s[i])) << 18)
                   | (uint32_t(symbol_val(s[i + 1])) << 12)
                   | (uint32_t(symbol_val(s[i + 2])) << 6)
                   | uint32_t(symbol_val(s[i + 3]));
        *out++ = static_cast<uint8_t>(n >> 16);
        *out++ = static_cast<uint8_t>(n >> 8);
        *out++ = static_cast<uint8_t>(n);
    }

    size_t rem = s.size() - i;
    if (rem == 0) return ok_status();

    uint32_t n = (uint32_t(symbol_val(s[i])) << 18)
               | (uint32_t(symbol_val(s[i + 1])) << 12);
    uint32_t unused_mask = 0xFFFF;  // rem == 2: one byte, bits 23..16
    if (rem == 3) {
        n |= uint32_t(symbol_val(s[i + 2])) << 6;
        unused_mask = 0xFF;
    }

    if ((n & unused_mask) != 0 && opts.trailing_bits == TrailingBits::Reject) {
        return UuidB64Error::parse(std::string(s),
            "final symbol " + describe_char(s.back())
            + " has non-zero unused bits (non-canonical encoding)");
    }

    *out++ = static_cast<uint8_t>(n >> 16);
    if (rem == 3) {
        *out++ = static_cast<uint8_t>(n >> 8);
    }
    return ok_status();
}

Result<std::vector<uint8_t>> decode(std::string_view s, DecodeOptions opts) {
    auto len = validate(s);
    UUIDB64_TRY(len);

    std::vector<uint8_t> out(len.value());
    UUIDB64_TRY(decode_raw(s, out.data(), opts));
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

Result<Bytes16> decode_uuid(std::string_view s, DecodeOptions opts) {
    auto len = validate(s);
    UUIDB64_TRY(len);

    if (len.value() != kRawLen) {
        return UuidB64Error::parse(std::string(s),
            "decoded to " + std::to_string(len.value())
            + " bytes, a UUID is exactly 16 (22 symbols)");
    }

    Bytes16 out{};
    UUIDB64_TRY(decode_raw(s, out.data(), opts));
    return Result<Bytes16>::ok(out);
}

} // namespace uuidb64::base64
