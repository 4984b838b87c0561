#include "ui/controllers/PairingController.hpp"

namespace qrlink::ui {

using State = network::ConnectionController::ConnectionState;

PairingController::PairingController(network::EngineFactory factory, QObject* parent)
    : PairingController(std::move(factory), network::ControllerConfig::fromEnvironment(), parent)
{
}

PairingController::PairingController(network::EngineFactory factory,
                                     network::ControllerConfig config,
                                     QObject* parent)
    : QObject(parent)
    , connection_(std::make_unique<network::ConnectionController>(
          std::move(factory), std::move(config), this))
{
    connect(connection_.get(), &network::ConnectionController::stateChanged,
            this, [this](State state) {
                if (state == State::Connected) {
                    setQrCodeData({});
                    emit pairingComplete();
                }
                emit stateChanged();
            });
    connect(connection_.get(), &network::ConnectionController::offerReady,
            this, &PairingController::setQrCodeData);
    connect(connection_.get(), &network::ConnectionController::answerReady,
            this, &PairingController::setQrCodeData);
    connect(connection_.get(), &network::ConnectionController::answerAccepted,
            this, [this]() { setQrCodeData({}); });
    connect(connection_.get(), &network::ConnectionController::messageReceived,
            this, &PairingController::messageReceived);
    connect(connection_.get(), &network::ConnectionController::errorOccurred,
            this, [this](const Error& error) { reportError(error); });
}

bool PairingController::isPairing() const {
    const auto state = connection_->state();
    return state == State::Offering ||
           state == State::Answering ||
           state == State::Connecting;
}

bool PairingController::isConnected() const {
    return connection_->isConnected();
}

bool PairingController::canRetry() const {
    const auto state = connection_->state();
    return state == State::Failed || state == State::Disconnected;
}

QString PairingController::status() const {
    switch (connection_->state()) {
        case State::Idle:
            return "Ready";
        case State::Offering:
            return qr_code_data_.isEmpty() ? "Preparing code..." : "Scan this code on the other device";
        case State::Answering:
            return "Preparing answer...";
        case State::Connecting:
            return qr_code_data_.isEmpty() ? "Connecting..." : "Show this code to the other device";
        case State::Connected:
            return "Connected";
        case State::Disconnected:
            return "Disconnected - generate a new code to retry";
        case State::Failed:
            return "Connection failed - generate a new code to retry";
    }
    return "";
}

void PairingController::startAsInitiator() {
    setQrCodeData({});
    auto result = connection_->createOffer();
    if (result.is_err()) {
        reportError(result.unwrap_err());
    }
}

void PairingController::submitQrCodeData(const QString& qrData) {
    const auto state = connection_->state();
    auto result = (state == State::Offering || state == State::Connecting)
        ? connection_->acceptAnswer(qrData)
        : connection_->createAnswer(qrData);
    if (result.is_err()) {
        reportError(result.unwrap_err());
    }
}

void PairingController::retry() {
    connection_->close();
    startAsInitiator();
}

void PairingController::cancel() {
    connection_->close();
    setQrCodeData({});
}

bool PairingController::sendText(const QString& text) {
    auto result = connection_->send(text);
    if (result.is_err()) {
        reportError(result.unwrap_err());
        return false;
    }
    return true;
}

void PairingController::setQrCodeData(const QString& data) {
    if (qr_code_data_ != data) {
        qr_code_data_ = data;
        emit qrCodeDataChanged();
        emit stateChanged();
    }
}

void PairingController::reportError(const Error& error) {
    last_error_ = QString::fromStdString(error.message);
    emit lastErrorChanged();
    emit pairingFailed(last_error_);
}

} // namespace qrlink::ui
