#include <uuidb64/uuid.hpp>
#include <fstream>
#include <random>

namespace uuidb64 {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (size_t i = 0; i < len; i += 8) {
        uint64_t word = gen();
        for (size_t j = i; j < len && j < i + 8; ++j) {
            buf[j] = static_cast<uint8_t>(word);
            word >>= 8;
        }
    }
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_pos(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

// ---- UUID v4 ----

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), u.bytes.size());
    // Version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // Variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::parse(std::string_view s) {
    if (s.size() != 36) {
        return UuidB64Error(UuidB64Error::Parse,
            "UUID string must be 36 characters",
            "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx",
            std::string(s));
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (is_dash_pos(i)) {
            if (s[i] != '-') {
                return UuidB64Error(UuidB64Error::Parse,
                    "UUID string has invalid dash positions",
                    "expected dashes at positions 8, 13, 18, 23",
                    std::string(s));
            }
            ++i;
            continue;
        }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return UuidB64Error(UuidB64Error::Parse,
                "UUID string contains invalid hex character",
                "invalid char at position " + std::to_string(hi < 0 ? i : i + 1),
                std::string(s));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

size_t hash_value(const Uuid& u) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (uint8_t b : u.bytes) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return static_cast<size_t>(h);
}

} // namespace uuidb64
