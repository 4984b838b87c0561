#pragma once

#include "core/result.hpp"
#include "network/connection_config.hpp"
#include "network/negotiation_codec.hpp"
#include "network/negotiation_engine.hpp"
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <QVariant>
#include <memory>
#include <optional>
#include <vector>

namespace qrlink::network {

/**
 * ConnectionController - Drives one negotiation engine through a QR-signaled
 * offer/answer handshake.
 *
 * Offering side:  createOffer() -> offerReady(token) ... acceptAnswer(token)
 * Answering side: createAnswer(token) -> answerReady(token)
 *
 * Local candidate gathering ends at whichever comes first: the engine
 * reporting gathering complete, candidate_threshold candidates, or
 * gather_timeout_ms. Connected requires both a usable path and an open data
 * channel, and latches on whichever of the two arrives second.
 *
 * Synchronous validation errors are returned from the call. Engine failures
 * that arrive later move the state and emit errorOccurred().
 */
class ConnectionController : public QObject {
    Q_OBJECT
    
    Q_PROPERTY(ConnectionState state READ state NOTIFY stateChanged)
    
public:
    enum class ConnectionState {
        Idle,
        Offering,       // Offer created, waiting for the answer token
        Answering,      // Offer token applied, creating the answer
        Connecting,     // Both descriptions applied, ICE in progress
        Connected,
        Disconnected,
        Failed
    };
    Q_ENUM(ConnectionState)
    
    explicit ConnectionController(EngineFactory factory,
                                  ControllerConfig config = ControllerConfig::fromEnvironment(),
                                  QObject* parent = nullptr);
    ~ConnectionController() override;
    
    /**
     * Start the offering side. The token arrives through offerReady().
     */
    Result<void, Error> createOffer();
    
    /**
     * Start the answering side from a scanned offer token.
     * The answer token arrives through answerReady().
     */
    Result<void, Error> createAnswer(const QString& offer_token);
    
    /**
     * Complete the offering side with a scanned answer token.
     */
    Result<void, Error> acceptAnswer(const QString& answer_token);
    
    /**
     * Send a message over the data channel. Strings go out verbatim,
     * maps and lists as compact JSON.
     */
    Result<void, Error> send(const QVariant& message);
    
    /**
     * Release the channel and the engine. Idempotent; always ends Disconnected.
     */
    void close();
    
    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == ConnectionState::Connected; }
    [[nodiscard]] std::optional<SessionRole> role() const { return role_; }
    [[nodiscard]] int localCandidateCount() const { return static_cast<int>(local_candidates_.size()); }
    [[nodiscard]] const ControllerConfig& config() const { return config_; }

    // "offer#2": role and lifecycle number, stamped on this controller's log lines.
    [[nodiscard]] QString sessionTag() const;

signals:
    void stateChanged(ConnectionState state);
    void offerReady(const QString& token);
    void answerReady(const QString& token);
    void answerAccepted();
    void messageReceived(const QVariant& message);
    void errorOccurred(const qrlink::Error& error);

private:
    Result<void, Error> startEngine(SessionRole role);
    void bindEngine();
    void bindChannel(std::shared_ptr<DataChannel> channel);
    void applyRemote(DecodedNegotiation remote, std::function<void()> then);
    void requestLocalDescription(SessionRole role);
    void beginGathering();
    void ingestLocalCandidate(const QString& candidate);
    void finishGathering(const char* reason);
    void onPathStateChanged(PathState path_state);
    void onChannelOpen();
    void onChannelClosed();
    void onChannelMessage(const QString& text);
    void checkConnected();
    void enterConnecting();
    void failWith(Error error);
    void setState(ConnectionState state);
    void releaseEngine(bool deferred);
    
    /**
     * Wrap an engine callback so it is dropped once this lifecycle ended.
     */
    template<typename F>
    auto guarded(F&& f) {
        return [self = QPointer<ConnectionController>(this),
                generation = generation_,
                f = std::forward<F>(f)](auto&&... args) {
            if (!self || self->generation_ != generation) {
                return;
            }
            f(std::forward<decltype(args)>(args)...);
        };
    }
    
    EngineFactory factory_;
    ControllerConfig config_;
    
    ConnectionState state_ = ConnectionState::Idle;
    std::optional<SessionRole> role_;
    quint64 generation_ = 0;
    
    std::unique_ptr<NegotiationEngine> engine_;
    std::shared_ptr<DataChannel> channel_;
    std::optional<SessionDescription> local_description_;
    std::vector<QString> local_candidates_;
    
    QTimer gather_timer_;
    bool gather_pending_ = false;
    bool gather_finalized_ = false;
    
    bool path_usable_ = false;
    bool channel_open_ = false;
};

} // namespace qrlink::network

Q_DECLARE_METATYPE(qrlink::Error)
