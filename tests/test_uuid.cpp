#include <catch2/catch.hpp>
#include <uuidb64/uuid.hpp>
#include <set>
#include <unordered_set>

using namespace uuidb64;

TEST_CASE("Uuid v4 version and variant bits", "[uuid]") {
    for (int i = 0; i < 50; ++i) {
        auto u = Uuid::v4();
        REQUIRE((u.bytes[6] & 0xF0) == 0x40);
        REQUIRE((u.bytes[8] & 0xC0) == 0x80);
    }
}

TEST_CASE("Uuid v4 generates unique values", "[uuid]") {
    std::set<Uuid> seen;
    for (int i = 0; i < 100; ++i) {
        REQUIRE(seen.insert(Uuid::v4()).second);
    }
}

TEST_CASE("Uuid nil", "[uuid]") {
    auto n = Uuid::nil();
    REQUIRE(n.is_nil());
    REQUIRE(n.to_string() == "00000000-0000-0000-0000-000000000000");
    REQUIRE_FALSE(Uuid::v4().is_nil());
}

TEST_CASE("Uuid to_string format", "[uuid]") {
    auto s = Uuid::v4().to_string();
    REQUIRE(s.size() == 36);
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
    // Position 14 is the version nibble
    REQUIRE(s[14] == '4');
}

TEST_CASE("Uuid parse known value", "[uuid]") {
    auto r = Uuid::parse("b0c1ee86-6f46-4f1b-8d8b-7849e75dbcee");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().bytes[0] == 0xb0);
    REQUIRE(r.value().bytes[15] == 0xee);
    REQUIRE(r.value().to_string() == "b0c1ee86-6f46-4f1b-8d8b-7849e75dbcee");
}

TEST_CASE("Uuid parse accepts uppercase", "[uuid]") {
    auto r = Uuid::parse("B0C1EE86-6F46-4F1B-8D8B-7849E75DBCEE");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "b0c1ee86-6f46-4f1b-8d8b-7849e75dbcee");
}

TEST_CASE("Uuid parse roundtrip", "[uuid]") {
    auto u = Uuid::v4();
    auto parsed = Uuid::parse(u.to_string());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("Uuid parse rejects malformed text", "[uuid]") {
    auto short_r = Uuid::parse("too-short");
    REQUIRE(short_r.is_err());
    REQUIRE(short_r.error().code == UuidB64Error::Parse);
    REQUIRE(short_r.error().input == "too-short");

    // Right length, no dashes
    REQUIRE(Uuid::parse("b0c1ee866f464f1b8d8b7849e75dbcee0000").is_err());
    // Bad hex digit
    REQUIRE(Uuid::parse("b0c1ee86-6f46-4f1b-8d8b-7849e75dbcgg").is_err());
    // Base64 form is a different dialect
    REQUIRE(Uuid::parse("sMHuhm9GTxuNi3hJ51287g").is_err());
}

TEST_CASE("Uuid ordering is lexicographic over bytes", "[uuid]") {
    Uuid a, b;
    a.bytes[0] = 0x01;
    b.bytes[15] = 0xff;
    REQUIRE(b < a);
    REQUIRE(a > b);
    REQUIRE(a != b);
    REQUIRE(a <= a);
    REQUIRE(a >= a);
}

TEST_CASE("Uuid hash distinguishes values", "[uuid]") {
    std::unordered_set<Uuid> set;
    auto u = Uuid::v4();
    set.insert(u);
    set.insert(u);
    set.insert(Uuid::nil());
    REQUIRE(set.size() == 2);
    REQUIRE(std::hash<Uuid>{}(u) == hash_value(u));
}
