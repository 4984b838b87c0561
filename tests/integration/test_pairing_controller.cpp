#include <catch2/catch_test_macros.hpp>

#include "network/loopback_engine.hpp"
#include "support/test_helpers.hpp"
#include "ui/controllers/PairingController.hpp"

using namespace qrlink;
using namespace qrlink::test;

namespace {

network::EngineFactory loopbackFactory() {
    network::LoopbackEngine::Options options;
    options.host_addresses = {QHostAddress(QStringLiteral("127.0.0.1"))};
    return network::LoopbackEngine::factory(options);
}

} // namespace

TEST_CASE("PairingController: two devices pair by exchanging codes", "[integration][pairing]") {
    ui::PairingController host(loopbackFactory(), fastConfig());
    ui::PairingController guest(loopbackFactory(), fastConfig());

    int completed = 0;
    QObject::connect(&host, &ui::PairingController::pairingComplete, &host, [&]() { ++completed; });
    QObject::connect(&guest, &ui::PairingController::pairingComplete, &guest, [&]() { ++completed; });

    REQUIRE(host.status() == QStringLiteral("Ready"));
    REQUIRE_FALSE(host.isPairing());

    host.startAsInitiator();
    REQUIRE(host.isPairing());
    REQUIRE(spinUntil([&]() { return !host.qrCodeData().isEmpty(); }, 2000));
    REQUIRE(host.status() == QStringLiteral("Scan this code on the other device"));

    guest.submitQrCodeData(host.qrCodeData());
    REQUIRE(spinUntil([&]() { return !guest.qrCodeData().isEmpty(); }, 2000));
    REQUIRE(guest.status() == QStringLiteral("Show this code to the other device"));

    host.submitQrCodeData(guest.qrCodeData());
    REQUIRE(spinUntil([&]() { return host.isConnected() && guest.isConnected(); }, 3000));

    REQUIRE(completed == 2);
    REQUIRE(host.qrCodeData().isEmpty());
    REQUIRE(guest.qrCodeData().isEmpty());
    REQUIRE(host.status() == QStringLiteral("Connected"));
    REQUIRE(host.lastError().isEmpty());

    QVariant received;
    QObject::connect(&guest, &ui::PairingController::messageReceived, &guest,
                     [&](const QVariant& m) { received = m; });
    REQUIRE(host.sendText(QStringLiteral("hi from the host")));
    REQUIRE(spinUntil([&]() { return received.isValid(); }, 2000));
    REQUIRE(received.toString() == QStringLiteral("hi from the host"));

    host.cancel();
    REQUIRE(spinUntil([&]() { return guest.canRetry(); }, 2000));
    REQUIRE(guest.status() == QStringLiteral("Disconnected - generate a new code to retry"));
    REQUIRE(host.canRetry());

    guest.retry();
    REQUIRE(guest.isPairing());
    REQUIRE(spinUntil([&]() { return !guest.qrCodeData().isEmpty(); }, 2000));
    REQUIRE(guest.connection().role() == network::SessionRole::Offer);
}

TEST_CASE("PairingController: a bad scan reports an error and stays idle", "[integration][pairing]") {
    ui::PairingController device(loopbackFactory(), fastConfig());

    QString failure;
    QObject::connect(&device, &ui::PairingController::pairingFailed, &device,
                     [&](const QString& reason) { failure = reason; });

    device.submitQrCodeData(QStringLiteral("definitely not a code"));

    REQUIRE_FALSE(failure.isEmpty());
    REQUIRE(device.lastError() == failure);
    REQUIRE(device.status() == QStringLiteral("Ready"));
    REQUIRE_FALSE(device.isPairing());
}

TEST_CASE("PairingController: sending before pairing fails", "[integration][pairing]") {
    ui::PairingController device(loopbackFactory(), fastConfig());

    REQUIRE_FALSE(device.sendText(QStringLiteral("too early")));
    REQUIRE(device.lastError() == QStringLiteral("Data channel not open"));
}
