#pragma once

#include "network/negotiation_engine.hpp"
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QPointer>
#include <memory>
#include <vector>

namespace qrlink::network {

class LoopbackEngine;

/**
 * LoopbackChannel - Data channel between two loopback engines in one process.
 * Delivery is queued on the receiving engine's event loop.
 */
class LoopbackChannel : public DataChannel,
                        public std::enable_shared_from_this<LoopbackChannel> {
public:
    LoopbackChannel(QString label, LoopbackEngine* owner);
    
    [[nodiscard]] QString label() const override { return label_; }
    [[nodiscard]] ChannelState state() const override { return state_; }
    Result<void, Error> send(const QString& text) override;
    void close() override;
    
    static void pair(const std::shared_ptr<LoopbackChannel>& a,
                     const std::shared_ptr<LoopbackChannel>& b);
    
    void open();

private:
    void remoteClosed();
    
    QString label_;
    QPointer<LoopbackEngine> owner_;
    ChannelState state_ = ChannelState::Connecting;
    std::weak_ptr<LoopbackChannel> peer_;
};

/**
 * LoopbackEngine - In-process NegotiationEngine.
 *
 * Produces browser-shaped SDP with fresh ICE credentials and a SHA-256
 * fingerprint, announces one host candidate per local IPv4 address, and
 * links with the engine whose ice-ufrag the remote description names once
 * both sides hold each other's description. It does not open sockets; it
 * exists so the controller can be exercised end to end without a real
 * ICE stack.
 */
class LoopbackEngine : public QObject, public NegotiationEngine {
    Q_OBJECT
    
public:
    struct Options {
        int candidate_interval_ms = 5;
        int connect_delay_ms = 20;
        QList<QHostAddress> host_addresses;  // Empty: 127.0.0.1 plus local interfaces
        bool stall_gathering = false;        // Never report gathering complete
        bool fail_connectivity = false;      // Path goes Checking -> Failed
    };
    
    explicit LoopbackEngine(EngineConfig config, Options options, QObject* parent = nullptr);
    ~LoopbackEngine() override;
    
    /**
     * Factory suitable for ConnectionController.
     */
    [[nodiscard]] static EngineFactory factory(Options options);
    
    std::shared_ptr<DataChannel> create_channel(const QString& label) override;
    void create_local_description(SessionRole role, DescriptionCompletion done) override;
    void set_remote_description(const SessionDescription& description,
                                Completion done) override;
    void add_remote_candidate(const RemoteCandidate& candidate, Completion done) override;
    [[nodiscard]] GatheringState gathering_state() const override { return gathering_state_; }
    void close() override;
    
    [[nodiscard]] PathState path_state() const { return path_state_; }
    [[nodiscard]] const QString& local_ufrag() const { return ufrag_; }
    [[nodiscard]] const std::vector<NetworkPath>& remote_paths() const { return remote_paths_; }
    [[nodiscard]] const QStringList& ice_servers() const { return config_.ice_servers; }

private:
    static QHash<QString, QPointer<LoopbackEngine>>& registry();
    
    QString buildSdp(SessionRole role) const;
    QList<QHostAddress> candidateAddresses() const;
    void startGathering();
    void emitCandidate(int index);
    void tryLink();
    void setPathState(PathState state);
    
    EngineConfig config_;
    Options options_;
    
    SessionRole role_ = SessionRole::Offer;
    bool has_local_ = false;
    bool closed_ = false;
    bool linked_ = false;
    QString ufrag_;
    QString pwd_;
    QString fingerprint_;
    QString remote_ufrag_;
    std::vector<NetworkPath> remote_paths_;
    QList<QHostAddress> gather_addresses_;
    
    GatheringState gathering_state_ = GatheringState::New;
    PathState path_state_ = PathState::New;
    
    std::shared_ptr<LoopbackChannel> local_channel_;
    std::shared_ptr<LoopbackChannel> remote_channel_;
    QPointer<LoopbackEngine> peer_;
};

} // namespace qrlink::network
