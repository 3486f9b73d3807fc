#pragma once

#include <uuidb64/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// URL-safe Base64 (RFC 4648 section 5) without padding. Only this alphabet
// is supported: A-Z a-z 0-9 '-' '_'. '=' is never emitted or accepted.
namespace uuidb64::base64 {

constexpr size_t kRawLen = 16;
constexpr size_t kEncodedLen = 22;

using Bytes16 = std::array<uint8_t, kRawLen>;

// What to do with the unused low bits of the final symbol.
// "sMHuhm9GTxuNi3hJ51287g" and "sMHuhm9GTxuNi3hJ51287h" carry the same
// 16 bytes; only the first is canonical.
enum class TrailingBits {
    Reject,
    Mask,
};

struct DecodeOptions {
    TrailingBits trailing_bits = TrailingBits::Reject;
};

// Number of symbols needed for len bytes
constexpr size_t encoded_len(size_t len) {
    return (len / 3) * 4 + (len % 3 == 0 ? 0 : len % 3 + 1);
}

std::string encode(const uint8_t* data, size_t len);
std::string encode(const Bytes16& bytes);

// Writes exactly kEncodedLen symbols to out. No terminator is written.
void encode_to(const Bytes16& bytes, char* out);

// Appends kEncodedLen symbols to out. Nothing is retained after return.
void encode_append(const Bytes16& bytes, std::string& out);

Result<std::vector<uint8_t>> decode(std::string_view s, DecodeOptions opts = {});

// Decodes s and requires the payload to be exactly 16 bytes.
Result<Bytes16> decode_uuid(std::string_view s, DecodeOptions opts = {});

} // namespace uuidb64::base64
