#include "ui/cli/demo.hpp"

#include <QEventLoop>
#include <QMetaEnum>
#include <QTimer>
#include <QVariant>

#include "network/connection_controller.hpp"
#include "network/loopback_engine.hpp"

namespace qrlink::ui {

using network::ConnectionController;
using State = ConnectionController::ConnectionState;

int run_loopback_demo(const DemoOptions& options, QTextStream& out) {
    const auto factory = network::LoopbackEngine::factory(network::LoopbackEngine::Options{});
    ConnectionController host(factory, options.config);
    ConnectionController guest(factory, options.config);

    QEventLoop loop;
    int exit_code = 2;
    bool delivered = false;

    const auto report_state = [&out](const char* who) {
        return [&out, who](State state) {
            out << who << ": " << QMetaEnum::fromType<State>().valueToKey(static_cast<int>(state)) << Qt::endl;
        };
    };
    QObject::connect(&host, &ConnectionController::stateChanged, &loop, report_state("host"));
    QObject::connect(&guest, &ConnectionController::stateChanged, &loop, report_state("guest"));

    const auto on_error = [&out, &loop, &exit_code](const char* who) {
        return [&out, &loop, &exit_code, who](const Error& error) {
            out << who << " error (" << to_string(error.code) << "): "
                << QString::fromStdString(error.message) << Qt::endl;
            exit_code = 1;
            loop.quit();
        };
    };
    QObject::connect(&host, &ConnectionController::errorOccurred, &loop, on_error("host"));
    QObject::connect(&guest, &ConnectionController::errorOccurred, &loop, on_error("guest"));

    // host -> QR -> guest
    QObject::connect(&host, &ConnectionController::offerReady, &loop, [&](const QString& token) {
        out << "offer token (" << token.size() << " chars): " << token << Qt::endl;
        auto result = guest.createAnswer(token);
        if (result.is_err()) {
            out << "guest rejected offer: " << QString::fromStdString(result.unwrap_err().message) << Qt::endl;
            exit_code = 1;
            loop.quit();
        }
    });

    // guest -> QR -> host
    QObject::connect(&guest, &ConnectionController::answerReady, &loop, [&](const QString& token) {
        out << "answer token (" << token.size() << " chars): " << token << Qt::endl;
        auto result = host.acceptAnswer(token);
        if (result.is_err()) {
            out << "host rejected answer: " << QString::fromStdString(result.unwrap_err().message) << Qt::endl;
            exit_code = 1;
            loop.quit();
        }
    });

    QObject::connect(&host, &ConnectionController::stateChanged, &loop, [&](State state) {
        if (state == State::Connected && !host.send(options.message).is_ok()) {
            exit_code = 1;
            loop.quit();
        }
    });

    QObject::connect(&guest, &ConnectionController::messageReceived, &loop, [&](const QVariant& message) {
        out << "guest received: " << message.toString() << Qt::endl;
        delivered = message.toString() == options.message;
        if (delivered && guest.isConnected()) {
            exit_code = 0;
            loop.quit();
        }
    });

    QObject::connect(&guest, &ConnectionController::stateChanged, &loop, [&](State state) {
        if (state == State::Connected && delivered) {
            exit_code = 0;
            loop.quit();
        }
    });

    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(options.timeoutMs);

    auto started = host.createOffer();
    if (started.is_err()) {
        out << "createOffer failed: " << QString::fromStdString(started.unwrap_err().message) << Qt::endl;
        return 1;
    }

    loop.exec();

    host.close();
    guest.close();
    if (exit_code == 2) {
        out << "timed out after " << options.timeoutMs << " ms" << Qt::endl;
    }
    return exit_code;
}

} // namespace qrlink::ui
