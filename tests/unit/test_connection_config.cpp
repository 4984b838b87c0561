#include <catch2/catch_test_macros.hpp>

#include "network/connection_config.hpp"
#include "support/test_helpers.hpp"

using namespace qrlink::network;
using qrlink::test::EnvVarGuard;

namespace {

struct ConfigEnv {
    EnvVarGuard servers{"QRLINK_ICE_SERVERS"};
    EnvVarGuard timeout{"QRLINK_GATHER_TIMEOUT_MS"};
    EnvVarGuard threshold{"QRLINK_CANDIDATE_THRESHOLD"};

    ConfigEnv() {
        qunsetenv("QRLINK_ICE_SERVERS");
        qunsetenv("QRLINK_GATHER_TIMEOUT_MS");
        qunsetenv("QRLINK_CANDIDATE_THRESHOLD");
    }
};

} // namespace

TEST_CASE("ControllerConfig: defaults", "[config]") {
    ConfigEnv env;
    const auto config = ControllerConfig::fromEnvironment();

    REQUIRE(config.gather_timeout_ms == 3000);
    REQUIRE(config.candidate_threshold == 3);
    REQUIRE(config.channel_label == QStringLiteral("p2p-stream"));
    REQUIRE(config.ice_servers.size() == 5);
    REQUIRE(config.ice_servers.front() == QStringLiteral("stun:stun.l.google.com:19302"));
    for (const auto& server : config.ice_servers) {
        REQUIRE(server.startsWith(QStringLiteral("stun:")));
    }
}

TEST_CASE("ControllerConfig: environment overrides", "[config]") {
    ConfigEnv env;
    qputenv("QRLINK_ICE_SERVERS", " stun:a.example:3478 ,turn:b.example:3478,, ");
    qputenv("QRLINK_GATHER_TIMEOUT_MS", "750");
    qputenv("QRLINK_CANDIDATE_THRESHOLD", "5");

    const auto config = ControllerConfig::fromEnvironment();

    REQUIRE(config.ice_servers == QStringList{QStringLiteral("stun:a.example:3478"),
                                              QStringLiteral("turn:b.example:3478")});
    REQUIRE(config.gather_timeout_ms == 750);
    REQUIRE(config.candidate_threshold == 5);
}

TEST_CASE("ControllerConfig: invalid overrides keep defaults", "[config]") {
    ConfigEnv env;
    qputenv("QRLINK_GATHER_TIMEOUT_MS", "soon");
    qputenv("QRLINK_CANDIDATE_THRESHOLD", "-2");
    qputenv("QRLINK_ICE_SERVERS", " , ");

    const auto config = ControllerConfig::fromEnvironment();

    REQUIRE(config.gather_timeout_ms == ControllerConfig::DEFAULT_GATHER_TIMEOUT_MS);
    REQUIRE(config.candidate_threshold == ControllerConfig::DEFAULT_CANDIDATE_THRESHOLD);
    REQUIRE(config.ice_servers == ControllerConfig::defaultIceServers());
}
