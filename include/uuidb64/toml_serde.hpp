#pragma once

#include <uuidb64/uuid_b64.hpp>
#include <toml++/toml.hpp>

// TOML (toml++) serialization. A UuidB64 is always a single string scalar
// holding its 22-symbol text, never a table or an array of bytes.
//
//     auto tbl = toml::table{{"myid", uuidb64::to_toml(id)}};
//     auto back = uuidb64::from_toml(tbl["myid"]);
namespace uuidb64 {

toml::value<std::string> to_toml(const UuidB64& id);

Result<UuidB64> from_toml(const toml::node& node,
                          base64::DecodeOptions opts = {});

// A missing key is a Parse error.
Result<UuidB64> from_toml(toml::node_view<const toml::node> view,
                          base64::DecodeOptions opts = {});
Result<UuidB64> from_toml(toml::node_view<toml::node> view,
                          base64::DecodeOptions opts = {});

} // namespace uuidb64
