#include <uuidb64/uuid_b64.hpp>
#include <uuidb64/log.hpp>

namespace uuidb64 {

UuidB64 UuidB64::generate() {
    return UuidB64(Uuid::v4());
}

Result<UuidB64> UuidB64::parse(std::string_view s, base64::DecodeOptions opts) {
    auto bytes = base64::decode_uuid(s, opts);
    if (bytes.is_err()) {
        if (log::enabled(log::Trace)) {
            log::trace("rejected UUID text '%s': %s",
                       bytes.error().input.c_str(), bytes.error().hint.c_str());
        }
        return std::move(bytes).error();
    }
    return Result<UuidB64>::ok(from_bytes(bytes.value()));
}

std::string UuidB64::to_string() const {
    return base64::encode(uuid_.bytes);
}

InlineString UuidB64::to_istring() const {
    InlineString out;
    base64::encode_to(uuid_.bytes, out.buffer_);
    out.size_ = base64::kEncodedLen;
    return out;
}

void UuidB64::to_buf(std::string& buf) const {
    base64::encode_append(uuid_.bytes, buf);
}

std::string UuidB64::debug_string() const {
    std::string out;
    out.reserve(9 + base64::kEncodedLen);
    out += "UuidB64(";
    to_buf(out);
    out += ')';
    return out;
}

std::ostream& operator<<(std::ostream& os, const UuidB64& id) {
    return os << id.to_istring();
}

std::ostream& operator<<(std::ostream& os, const InlineString& s) {
    return os.write(s.data(), static_cast<std::streamsize>(s.size()));
}

} // namespace uuidb64
