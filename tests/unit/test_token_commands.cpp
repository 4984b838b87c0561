#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "network/negotiation_codec.hpp"
#include "support/test_helpers.hpp"
#include "ui/cli/token_commands.hpp"

using namespace qrlink;
using namespace qrlink::test;

namespace {

QString writeFile(const QTemporaryDir& dir, const QString& name, const QString& content) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content.toUtf8());
    return path;
}

} // namespace

TEST_CASE("CLI encode: SDP with embedded candidates", "[cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto sdp = sampleSdp(QStringLiteral("cli1"))
        + QStringLiteral("a=") + hostCandidate(QStringLiteral("192.168.2.10"), 40000) + QStringLiteral("\r\n");

    ui::EncodeOptions options;
    options.type = QStringLiteral("answer");
    options.sdpPath = writeFile(dir, QStringLiteral("answer.sdp"), sdp);

    auto token = ui::encode_token(options);
    REQUIRE(token.is_ok());

    auto decoded = network::decompress(token.unwrap());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().description.role == network::SessionRole::Answer);
    REQUIRE(decoded.unwrap().paths.size() == 1);
    REQUIRE(decoded.unwrap().paths.front().port == 40000);
}

TEST_CASE("CLI encode: separate candidate file follows the SDP's own candidates", "[cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto sdp = sampleSdp(QStringLiteral("cli2"))
        + QStringLiteral("a=") + hostCandidate(QStringLiteral("192.168.2.10"), 40000) + QStringLiteral("\r\n");
    const auto candidates = hostCandidate(QStringLiteral("10.9.8.7"), 41000) + QStringLiteral("\n")
        + QStringLiteral("\n")
        + QStringLiteral("a=") + hostCandidate(QStringLiteral("198.51.100.4"), 42000, QStringLiteral("relay"))
        + QStringLiteral("\n");

    ui::EncodeOptions options;
    options.type = QStringLiteral("offer");
    options.sdpPath = writeFile(dir, QStringLiteral("offer.sdp"), sdp);
    options.candidatesPath = writeFile(dir, QStringLiteral("candidates.txt"), candidates);

    auto token = ui::encode_token(options);
    REQUIRE(token.is_ok());

    auto decoded = network::decompress(token.unwrap());
    REQUIRE(decoded.is_ok());
    const auto& paths = decoded.unwrap().paths;
    REQUIRE(paths.size() == 3);
    REQUIRE(paths[0].port == 40000);
    REQUIRE(paths[1].port == 41000);
    REQUIRE(paths[2].kind == network::PathKind::Relayed);
}

TEST_CASE("CLI encode: reports bad input", "[cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    ui::EncodeOptions options;
    options.type = QStringLiteral("offer");

    SECTION("unknown type") {
        options.type = QStringLiteral("pranswer");
        options.sdpPath = writeFile(dir, QStringLiteral("a.sdp"), sampleSdp(QStringLiteral("abcd")));
        REQUIRE(ui::encode_token(options).is_err());
    }

    SECTION("missing SDP file") {
        options.sdpPath = dir.filePath(QStringLiteral("missing.sdp"));
        REQUIRE(ui::encode_token(options).is_err());
    }

    SECTION("SDP without credentials") {
        options.sdpPath = writeFile(dir, QStringLiteral("empty.sdp"), QStringLiteral("v=0\r\n"));
        auto token = ui::encode_token(options);
        REQUIRE(token.is_err());
        REQUIRE(token.unwrap_err().code == ErrorCode::MalformedNegotiationData);
    }
}

TEST_CASE("CLI decode: prints SDP followed by candidate lines", "[cli]") {
    const auto token = makeToken(network::SessionRole::Offer, QStringLiteral("dec1"),
                                 {hostCandidate(QStringLiteral("192.168.2.10"), 40000)});

    auto text = ui::decode_token(token);
    REQUIRE(text.is_ok());
    REQUIRE(text.unwrap().contains(QStringLiteral("a=ice-ufrag:dec1\r\n")));
    REQUIRE(text.unwrap().endsWith(
        QStringLiteral("a=candidate:0 1 udp 2113937151 192.168.2.10 40000 typ host\r\n")));
}

TEST_CASE("CLI decode: rejects garbage", "[cli]") {
    auto text = ui::decode_token(QStringLiteral("???"));
    REQUIRE(text.is_err());
    REQUIRE(text.unwrap_err().code == ErrorCode::InvalidToken);
}
