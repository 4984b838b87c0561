#include "network/loopback_engine.hpp"

#include "crypto/identity.hpp"
#include "network/negotiation_codec.hpp"

#include <QLoggingCategory>
#include <QMetaObject>
#include <QNetworkInterface>
#include <QRandomGenerator>
#include <QStringList>
#include <QTimer>

namespace qrlink::network {

Q_LOGGING_CATEGORY(qrlinkLoopbackLog, "qrlink.loopback", QtInfoMsg)

namespace {

constexpr quint32 kHostPriority = 2122260223;

template<typename F>
void post(QObject* context, F&& f) {
    QMetaObject::invokeMethod(context, std::forward<F>(f), Qt::QueuedConnection);
}

} // namespace

// ============================================================================
// LoopbackChannel
// ============================================================================

LoopbackChannel::LoopbackChannel(QString label, LoopbackEngine* owner)
    : label_(std::move(label))
    , owner_(owner)
{
}

void LoopbackChannel::pair(const std::shared_ptr<LoopbackChannel>& a,
                           const std::shared_ptr<LoopbackChannel>& b) {
    a->peer_ = b;
    b->peer_ = a;
}

void LoopbackChannel::open() {
    if (state_ != ChannelState::Connecting || !owner_) {
        return;
    }
    state_ = ChannelState::Open;
    post(owner_.data(), [weak = weak_from_this()]() {
        auto self = weak.lock();
        if (self && self->state_ == ChannelState::Open && self->on_open) {
            self->on_open();
        }
    });
}

Result<void, Error> LoopbackChannel::send(const QString& text) {
    if (state_ != ChannelState::Open) {
        return fail<void>(ErrorCode::ChannelNotOpen, "Data channel not open");
    }
    auto peer = peer_.lock();
    if (!peer || !peer->owner_) {
        return fail<void>(ErrorCode::ChannelNotOpen, "Remote end of the channel is gone");
    }
    post(peer->owner_.data(), [weak = std::weak_ptr<LoopbackChannel>(peer), text]() {
        auto target = weak.lock();
        if (target && target->state_ == ChannelState::Open && target->on_message) {
            target->on_message(text);
        }
    });
    return Result<void, Error>::ok();
}

void LoopbackChannel::close() {
    if (state_ == ChannelState::Closed) {
        return;
    }
    state_ = ChannelState::Closed;

    if (auto peer = peer_.lock(); peer && peer->owner_) {
        post(peer->owner_.data(), [weak = std::weak_ptr<LoopbackChannel>(peer)]() {
            if (auto target = weak.lock()) {
                target->remoteClosed();
            }
        });
    }
    if (owner_) {
        post(owner_.data(), [weak = weak_from_this()]() {
            auto self = weak.lock();
            if (self && self->on_close) {
                self->on_close();
            }
        });
    }
}

void LoopbackChannel::remoteClosed() {
    if (state_ == ChannelState::Closed) {
        return;
    }
    state_ = ChannelState::Closed;
    if (on_close) {
        on_close();
    }
}

// ============================================================================
// LoopbackEngine
// ============================================================================

LoopbackEngine::LoopbackEngine(EngineConfig config, Options options, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , options_(std::move(options))
{
}

LoopbackEngine::~LoopbackEngine() {
    close();
}

EngineFactory LoopbackEngine::factory(Options options) {
    return [options](const EngineConfig& config)
               -> Result<std::unique_ptr<NegotiationEngine>, Error> {
        return Result<std::unique_ptr<NegotiationEngine>, Error>::ok(
            std::make_unique<LoopbackEngine>(config, options));
    };
}

QHash<QString, QPointer<LoopbackEngine>>& LoopbackEngine::registry() {
    static QHash<QString, QPointer<LoopbackEngine>> engines;
    return engines;
}

std::shared_ptr<DataChannel> LoopbackEngine::create_channel(const QString& label) {
    if (closed_) {
        return nullptr;
    }
    local_channel_ = std::make_shared<LoopbackChannel>(label, this);
    return local_channel_;
}

void LoopbackEngine::create_local_description(SessionRole role, DescriptionCompletion done) {
    if (closed_) {
        return;
    }
    if (role == SessionRole::Answer && remote_ufrag_.isEmpty()) {
        post(this, [done]() {
            done(fail<SessionDescription>(ErrorCode::EngineError,
                                          "Cannot answer without a remote offer"));
        });
        return;
    }

    role_ = role;
    ufrag_ = crypto::generate_ice_credential(crypto::ICE_UFRAG_LENGTH);
    pwd_ = crypto::generate_ice_credential(crypto::ICE_PWD_LENGTH);
    const auto digest = crypto::sha256(crypto::random_bytes(64));
    fingerprint_ = format_fingerprint(std::vector<uint8_t>(digest.begin(), digest.end()));
    has_local_ = true;
    registry().insert(ufrag_, this);

    const SessionDescription description{.role = role, .sdp = buildSdp(role)};
    qCDebug(qrlinkLoopbackLog) << "local" << role_name(role) << "ufrag" << ufrag_
                               << "ignoring" << config_.ice_servers.size() << "ICE servers";

    post(this, [this, done, description]() {
        if (closed_) return;
        done(Result<SessionDescription, Error>::ok(description));
        startGathering();
        tryLink();
    });
}

void LoopbackEngine::set_remote_description(const SessionDescription& description,
                                            Completion done) {
    if (closed_) {
        return;
    }
    const auto ice = extract_ice_parameters(description.sdp);
    if (!ice) {
        post(this, [done]() {
            done(fail<void>(ErrorCode::EngineError, "Remote description lacks ICE parameters"));
        });
        return;
    }

    remote_ufrag_ = ice->ufrag;
    post(this, [this, done]() {
        if (closed_) return;
        done(Result<void, Error>::ok());
        tryLink();
    });
}

void LoopbackEngine::add_remote_candidate(const RemoteCandidate& candidate, Completion done) {
    if (closed_) {
        return;
    }
    const auto path = parse_candidate(candidate.candidate);
    post(this, [this, done, path, line = candidate.candidate]() {
        if (closed_) return;
        if (!path) {
            done(fail<void>(ErrorCode::EngineError,
                            "Unsupported candidate: " + line.toStdString()));
            return;
        }
        remote_paths_.push_back(*path);
        done(Result<void, Error>::ok());
    });
}

void LoopbackEngine::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (!ufrag_.isEmpty() && registry().value(ufrag_) == this) {
        registry().remove(ufrag_);
    }
    if (local_channel_) {
        local_channel_->close();
    }
    if (remote_channel_) {
        remote_channel_->close();
    }
    if (peer_ && !peer_->closed_) {
        post(peer_.data(), [peer = peer_]() {
            if (peer && !peer->closed_) {
                peer->setPathState(PathState::Disconnected);
            }
        });
    }
    path_state_ = PathState::Closed;
}

QString LoopbackEngine::buildSdp(SessionRole role) const {
    const auto session_id = QRandomGenerator::global()->generate64() >> 1;
    const QStringList lines{
        QStringLiteral("v=0"),
        QStringLiteral("o=- %1 2 IN IP4 127.0.0.1").arg(session_id),
        QStringLiteral("s=-"),
        QStringLiteral("t=0 0"),
        QStringLiteral("a=group:BUNDLE 0"),
        QStringLiteral("a=extmap-allow-mixed"),
        QStringLiteral("a=msid-semantic: WMS"),
        QStringLiteral("m=application 9 UDP/DTLS/SCTP webrtc-datachannel"),
        QStringLiteral("c=IN IP4 0.0.0.0"),
        QStringLiteral("a=ice-ufrag:") + ufrag_,
        QStringLiteral("a=ice-pwd:") + pwd_,
        QStringLiteral("a=ice-options:trickle"),
        QStringLiteral("a=fingerprint:sha-256 ") + fingerprint_,
        role == SessionRole::Offer ? QStringLiteral("a=setup:actpass")
                                   : QStringLiteral("a=setup:active"),
        QStringLiteral("a=mid:0"),
        QStringLiteral("a=sctp-port:5000"),
        QStringLiteral("a=max-message-size:262144"),
    };
    return lines.join(QStringLiteral("\r\n")) + QStringLiteral("\r\n");
}

QList<QHostAddress> LoopbackEngine::candidateAddresses() const {
    if (!options_.host_addresses.isEmpty()) {
        return options_.host_addresses;
    }
    QList<QHostAddress> out{QHostAddress(QHostAddress::LocalHost)};
    for (const auto& address : QNetworkInterface::allAddresses()) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            out.append(address);
        }
    }
    return out;
}

void LoopbackEngine::startGathering() {
    if (gathering_state_ != GatheringState::New) {
        return;
    }
    gathering_state_ = GatheringState::Gathering;
    gather_addresses_ = candidateAddresses();
    QTimer::singleShot(options_.candidate_interval_ms, this, [this]() { emitCandidate(0); });
}

void LoopbackEngine::emitCandidate(int index) {
    if (closed_) {
        return;
    }
    if (index >= gather_addresses_.size()) {
        if (options_.stall_gathering) {
            return;
        }
        gathering_state_ = GatheringState::Complete;
        if (on_gathering_complete) {
            on_gathering_complete();
        }
        return;
    }

    const auto port = static_cast<uint16_t>(QRandomGenerator::global()->bounded(49152, 65536));
    const auto line = QStringLiteral("candidate:%1 1 udp %2 %3 %4 typ host generation 0 ufrag %5")
                          .arg(index + 1)
                          .arg(kHostPriority - static_cast<quint32>(index))
                          .arg(gather_addresses_[index].toString())
                          .arg(port)
                          .arg(ufrag_);
    if (on_local_candidate) {
        on_local_candidate(line);
    }
    QTimer::singleShot(options_.candidate_interval_ms, this,
                       [this, index]() { emitCandidate(index + 1); });
}

void LoopbackEngine::tryLink() {
    if (closed_ || linked_ || !has_local_ || remote_ufrag_.isEmpty()) {
        return;
    }
    LoopbackEngine* peer = registry().value(remote_ufrag_);
    if (!peer || peer->closed_ || !peer->has_local_ || peer->remote_ufrag_ != ufrag_) {
        // The peer links once it holds our description.
        return;
    }

    linked_ = true;
    peer->linked_ = true;
    peer_ = peer;
    peer->peer_ = this;

    LoopbackEngine* offerer = role_ == SessionRole::Offer ? this : peer;
    LoopbackEngine* answerer = role_ == SessionRole::Offer ? peer : this;
    qCDebug(qrlinkLoopbackLog) << "linking" << offerer->ufrag_ << "<->" << answerer->ufrag_;

    offerer->setPathState(PathState::Checking);
    answerer->setPathState(PathState::Checking);

    QTimer::singleShot(options_.connect_delay_ms, this,
                       [op = QPointer<LoopbackEngine>(offerer),
                        ap = QPointer<LoopbackEngine>(answerer)]() {
        if (!op || !ap || op->closed_ || ap->closed_) {
            return;
        }
        if (op->options_.fail_connectivity || ap->options_.fail_connectivity) {
            op->setPathState(PathState::Failed);
            ap->setPathState(PathState::Failed);
            return;
        }

        op->setPathState(PathState::Connected);
        ap->setPathState(PathState::Connected);

        if (op->local_channel_) {
            auto remote = std::make_shared<LoopbackChannel>(op->local_channel_->label(), ap.data());
            LoopbackChannel::pair(op->local_channel_, remote);
            ap->remote_channel_ = remote;
            if (ap->on_remote_channel) {
                ap->on_remote_channel(remote);
            }
            op->local_channel_->open();
            remote->open();
        }
    });
}

void LoopbackEngine::setPathState(PathState state) {
    if (path_state_ == state) {
        return;
    }
    path_state_ = state;
    if (on_path_state_changed) {
        on_path_state_changed(state);
    }
}

} // namespace qrlink::network
