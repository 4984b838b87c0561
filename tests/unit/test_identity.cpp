#include <catch2/catch_test_macros.hpp>

#include <QRegularExpression>

#include "crypto/identity.hpp"

using namespace qrlink;

TEST_CASE("ICE credentials use the ice-char alphabet", "[crypto]") {
    const QRegularExpression iceChars(QStringLiteral("^[A-Za-z0-9+/]+$"));

    const auto ufrag = crypto::generate_ice_credential(crypto::ICE_UFRAG_LENGTH);
    const auto pwd = crypto::generate_ice_credential(crypto::ICE_PWD_LENGTH);

    REQUIRE(ufrag.size() == crypto::ICE_UFRAG_LENGTH);
    REQUIRE(pwd.size() == crypto::ICE_PWD_LENGTH);
    REQUIRE(iceChars.match(ufrag).hasMatch());
    REQUIRE(iceChars.match(pwd).hasMatch());
}

TEST_CASE("ICE credentials differ between calls", "[crypto]") {
    REQUIRE(crypto::generate_ice_credential(crypto::ICE_PWD_LENGTH) !=
            crypto::generate_ice_credential(crypto::ICE_PWD_LENGTH));
}

TEST_CASE("random_bytes returns the requested length", "[crypto]") {
    REQUIRE(crypto::random_bytes(0).empty());
    REQUIRE(crypto::random_bytes(64).size() == 64);
}

TEST_CASE("sha256 matches the known digest of \"abc\"", "[crypto]") {
    const std::vector<uint8_t> abc{'a', 'b', 'c'};
    const auto digest = crypto::sha256(abc);

    const crypto::Fingerprint expected{
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad,
    };
    REQUIRE(digest == expected);
}
