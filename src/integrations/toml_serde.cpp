#include <uuidb64/toml_serde.hpp>
#include <sstream>

namespace uuidb64 {

static const char* expecting = "expected a URL-safe Base64-encoded string";

toml::value<std::string> to_toml(const UuidB64& id) {
    return toml::value<std::string>(id.to_istring().str());
}

Result<UuidB64> from_toml(const toml::node& node, base64::DecodeOptions opts) {
    const auto* str = node.as_string();
    if (!str) {
        std::ostringstream found;
        found << node.type();
        return UuidB64Error(UuidB64Error::Parse,
            "invalid type: found " + found.str() + ", " + expecting);
    }
    return UuidB64::parse(str->get(), opts);
}

Result<UuidB64> from_toml(toml::node_view<const toml::node> view,
                          base64::DecodeOptions opts) {
    if (!view) {
        return UuidB64Error(UuidB64Error::Parse,
            std::string("missing value: ") + expecting);
    }
    return from_toml(*view.node(), opts);
}

Result<UuidB64> from_toml(toml::node_view<toml::node> view,
                          base64::DecodeOptions opts) {
    if (!view) {
        return UuidB64Error(UuidB64Error::Parse,
            std::string("missing value: ") + expecting);
    }
    return from_toml(*view.node(), opts);
}

} // namespace uuidb64
