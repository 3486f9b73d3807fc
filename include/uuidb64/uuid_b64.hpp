#pragma once

#include <uuidb64/base64.hpp>
#include <uuidb64/result.hpp>
#include <uuidb64/uuid.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace uuidb64 {

// Stack buffer holding the 22-symbol text form of a UuidB64.
class InlineString {
public:
    static constexpr size_t kCapacity = base64::kEncodedLen;

    InlineString() = default;

    std::string_view view() const { return {buffer_, size_}; }
    const char* data() const { return buffer_; }
    const char* c_str() const { return buffer_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    std::string str() const { return std::string(buffer_, size_); }

    operator std::string_view() const { return view(); }

    friend bool operator==(const InlineString& a, const InlineString& b) { return a.view() == b.view(); }
    friend bool operator!=(const InlineString& a, const InlineString& b) { return a.view() != b.view(); }
    friend bool operator==(const InlineString& a, std::string_view b) { return a.view() == b; }
    friend bool operator==(std::string_view a, const InlineString& b) { return a == b.view(); }
    friend bool operator!=(const InlineString& a, std::string_view b) { return a.view() != b; }
    friend bool operator!=(std::string_view a, const InlineString& b) { return a != b.view(); }

private:
    friend class UuidB64;

    char buffer_[kCapacity + 1]{};
    size_t size_ = 0;
};

// A UUID that displays, parses and serializes as 22 symbols of URL-safe
// Base64 without padding:
//
//     b0c1ee86-6f46-4f1b-8d8b-7849e75dbcee  <->  sMHuhm9GTxuNi3hJ51287g
//
// Equality, ordering and hashing are over the raw 16 bytes, not the text.
class UuidB64 {
public:
    // Nil identifier (16 zero bytes)
    UuidB64() = default;

    // Anything convertible to a raw Uuid.
    template<typename T,
             typename = std::enable_if_t<std::is_convertible_v<T, Uuid>>>
    UuidB64(const T& raw) : uuid_(raw) {}

    // New random (V4) identifier
    static UuidB64 generate();

    static UuidB64 from_bytes(const base64::Bytes16& bytes) {
        return UuidB64(Uuid::from_bytes(bytes));
    }

    // Returns a copy of the raw UUID.
    Uuid uuid() const { return uuid_; }
    const base64::Bytes16& bytes() const { return uuid_.bytes; }

    // Fails with a Parse error that carries s as its input.
    static Result<UuidB64> parse(std::string_view s, base64::DecodeOptions opts = {});

    std::string to_string() const;

    // Same text as to_string() without touching the heap.
    InlineString to_istring() const;

    // Appends the text form to buf.
    void to_buf(std::string& buf) const;

    // UuidB64(sMHuhm9GTxuNi3hJ51287g)
    std::string debug_string() const;

    bool operator==(const UuidB64& o) const { return uuid_ == o.uuid_; }
    bool operator!=(const UuidB64& o) const { return uuid_ != o.uuid_; }
    bool operator<(const UuidB64& o) const { return uuid_ < o.uuid_; }
    bool operator<=(const UuidB64& o) const { return uuid_ <= o.uuid_; }
    bool operator>(const UuidB64& o) const { return uuid_ > o.uuid_; }
    bool operator>=(const UuidB64& o) const { return uuid_ >= o.uuid_; }

private:
    Uuid uuid_;
};

std::ostream& operator<<(std::ostream& os, const UuidB64& id);
std::ostream& operator<<(std::ostream& os, const InlineString& s);

} // namespace uuidb64

namespace std {
template<>
struct hash<uuidb64::UuidB64> {
    size_t operator()(const uuidb64::UuidB64& id) const {
        return uuidb64::hash_value(id.uuid());
    }
};
} // namespace std
