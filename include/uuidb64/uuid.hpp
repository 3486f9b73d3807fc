#pragma once

#include <uuidb64/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace uuidb64 {

// Raw 128-bit UUID. Owns generation and the canonical 8-4-4-4-12 hex form;
// the Base64 form lives in UuidB64.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();
    static Uuid nil() { return Uuid{}; }
    static Uuid from_bytes(const std::array<uint8_t, 16>& b) { return Uuid{b}; }

    const std::array<uint8_t, 16>& as_bytes() const { return bytes; }
    bool is_nil() const;

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    static Result<Uuid> parse(std::string_view s);

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const { return bytes < other.bytes; }
    bool operator<=(const Uuid& other) const { return bytes <= other.bytes; }
    bool operator>(const Uuid& other) const { return bytes > other.bytes; }
    bool operator>=(const Uuid& other) const { return bytes >= other.bytes; }
};

// FNV-1a over the raw bytes
size_t hash_value(const Uuid& u);

} // namespace uuidb64

namespace std {
template<>
struct hash<uuidb64::Uuid> {
    size_t operator()(const uuidb64::Uuid& u) const { return uuidb64::hash_value(u); }
};
} // namespace std
