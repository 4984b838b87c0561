#pragma once

#include "network/connection_controller.hpp"
#include <QObject>
#include <QString>
#include <QVariant>
#include <memory>

namespace qrlink::ui {

/**
 * PairingController - UI-facing wrapper around ConnectionController.
 *
 * Exposes the QR payload to display, a status line and a retry action. A
 * broken handshake is never repaired in place: Failed and Disconnected both
 * offer "retry", which closes the session and generates a fresh code.
 */
class PairingController : public QObject {
    Q_OBJECT
    
    Q_PROPERTY(bool pairing READ isPairing NOTIFY stateChanged)
    Q_PROPERTY(bool connected READ isConnected NOTIFY stateChanged)
    Q_PROPERTY(bool canRetry READ canRetry NOTIFY stateChanged)
    Q_PROPERTY(QString qrCodeData READ qrCodeData NOTIFY qrCodeDataChanged)
    Q_PROPERTY(QString status READ status NOTIFY stateChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)
    
public:
    explicit PairingController(network::EngineFactory factory, QObject* parent = nullptr);
    PairingController(network::EngineFactory factory,
                      network::ControllerConfig config,
                      QObject* parent = nullptr);
    
    [[nodiscard]] bool isPairing() const;
    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] bool canRetry() const;
    [[nodiscard]] QString qrCodeData() const { return qr_code_data_; }
    [[nodiscard]] QString status() const;
    [[nodiscard]] QString lastError() const { return last_error_; }
    
    [[nodiscard]] network::ConnectionController& connection() { return *connection_; }
    
    /**
     * Generate an offer code for the other device to scan.
     */
    Q_INVOKABLE void startAsInitiator();
    
    /**
     * Feed a scanned code. Idle: it is an offer and an answer code is
     * generated. Offering: it is the answer that completes the handshake.
     */
    Q_INVOKABLE void submitQrCodeData(const QString& qrData);
    
    /**
     * Close the session and start over with a fresh offer code.
     */
    Q_INVOKABLE void retry();
    
    Q_INVOKABLE void cancel();
    
    Q_INVOKABLE bool sendText(const QString& text);

signals:
    void stateChanged();
    void qrCodeDataChanged();
    void lastErrorChanged();
    void pairingComplete();
    void pairingFailed(const QString& reason);
    void messageReceived(const QVariant& message);

private:
    void setQrCodeData(const QString& data);
    void reportError(const Error& error);
    
    std::unique_ptr<network::ConnectionController> connection_;
    QString qr_code_data_;
    QString last_error_;
};

} // namespace qrlink::ui
