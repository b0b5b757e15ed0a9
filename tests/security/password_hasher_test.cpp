/**
 * @file password_hasher_test.cpp
 * @brief Unit tests for PBKDF2-SHA256 password hashing
 */

#include <ampsetup/security/password_hasher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ampsetup::security;

TEST_CASE("password_hasher produces salted modular crypt hashes", "[security][password]") {
    password_hasher hasher(1000);

    auto first = hasher.hash("hunter2");
    auto second = hasher.hash("hunter2");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    SECTION("the encoded form names scheme and rounds") {
        CHECK(first.value().rfind("$pbkdf2-sha256$1000$", 0) == 0);
    }

    SECTION("the plaintext never appears in the hash") {
        CHECK(first.value().find("hunter2") == std::string::npos);
    }

    SECTION("two hashes of the same password differ by salt") {
        CHECK(first.value() != second.value());
    }

    SECTION("both hashes verify") {
        CHECK(hasher.verify("hunter2", first.value()));
        CHECK(hasher.verify("hunter2", second.value()));
    }

    SECTION("a wrong password does not verify") {
        CHECK_FALSE(hasher.verify("hunter3", first.value()));
        CHECK_FALSE(hasher.verify("", first.value()));
    }
}

TEST_CASE("password_hasher verifies a known hash", "[security][password]") {
    // PBKDF2-HMAC-SHA256("password", "salt", 1 round, 32 bytes)
    const std::string known =
        "$pbkdf2-sha256$1$c2FsdA$Eg.2z/z4syxD5yJSVsT4N6hlSMkszDVICAWYfLcL4Xs";

    password_hasher hasher;
    CHECK(hasher.verify("password", known));
    CHECK_FALSE(hasher.verify("Password", known));
}

TEST_CASE("password_hasher rejects malformed hashes", "[security][password]") {
    password_hasher hasher;

    CHECK_FALSE(hasher.verify("password", ""));
    CHECK_FALSE(hasher.verify("password", "password"));
    CHECK_FALSE(hasher.verify("password", "$pbkdf2-sha1$1$c2FsdA$abc"));
    CHECK_FALSE(hasher.verify("password", "$pbkdf2-sha256$x$c2FsdA$abc"));
    CHECK_FALSE(hasher.verify("password", "$pbkdf2-sha256$0$c2FsdA$abc"));
    CHECK_FALSE(hasher.verify("password", "$pbkdf2-sha256$1$c2FsdA"));
    CHECK_FALSE(hasher.verify("password", "$pbkdf2-sha256$1$c2FsdA$short"));
}

TEST_CASE("password_hasher rounds", "[security][password]") {
    CHECK(password_hasher().rounds() == password_hasher::default_rounds);
    CHECK(password_hasher(5000).rounds() == 5000);
    CHECK(password_hasher(0).rounds() == password_hasher::default_rounds);
}

TEST_CASE("ab64 encoding uses '.' and no padding", "[security][password]") {
    std::vector<std::uint8_t> bytes{0xfb, 0xff};

    auto encoded = ab64_encode(bytes);
    CHECK(encoded == "./8");
    CHECK(ab64_decode(encoded) == bytes);

    CHECK(ab64_encode({}).empty());
    CHECK(ab64_decode("").empty());
    CHECK(ab64_decode("A").empty());
}
