#include "network/connection_controller.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QMetaObject>

namespace qrlink::network {

Q_LOGGING_CATEGORY(qrlinkSignalingLog, "qrlink.signaling", QtInfoMsg)

namespace {

QString serialize_message(const QVariant& message) {
    const auto json = QJsonValue::fromVariant(message);
    if (json.isObject()) {
        return QString::fromUtf8(QJsonDocument(json.toObject()).toJson(QJsonDocument::Compact));
    }
    if (json.isArray()) {
        return QString::fromUtf8(QJsonDocument(json.toArray()).toJson(QJsonDocument::Compact));
    }
    return message.toString();
}

QVariant deserialize_message(const QString& text) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error == QJsonParseError::NoError) {
        if (doc.isObject()) return doc.object().toVariantMap();
        if (doc.isArray()) return doc.array().toVariantList();
    }
    return text;
}

const char* path_state_name(PathState s) {
    switch (s) {
        case PathState::New: return "new";
        case PathState::Checking: return "checking";
        case PathState::Connected: return "connected";
        case PathState::Completed: return "completed";
        case PathState::Disconnected: return "disconnected";
        case PathState::Failed: return "failed";
        case PathState::Closed: return "closed";
    }
    return "?";
}

} // namespace

ConnectionController::ConnectionController(EngineFactory factory,
                                           ControllerConfig config,
                                           QObject* parent)
    : QObject(parent)
    , factory_(std::move(factory))
    , config_(std::move(config))
{
    gather_timer_.setSingleShot(true);
    gather_timer_.setTimerType(Qt::PreciseTimer);
    connect(&gather_timer_, &QTimer::timeout, this, [this]() {
        finishGathering("timeout");
    });
}

ConnectionController::~ConnectionController() {
    ++generation_;
    gather_timer_.stop();
    releaseEngine(false);
}

QString ConnectionController::sessionTag() const {
    const auto name = role_ ? role_name(*role_) : QStringLiteral("idle");
    return QStringLiteral("%1#%2").arg(name).arg(generation_);
}

// ============================================================================
// Lifecycle entry points
// ============================================================================

Result<void, Error> ConnectionController::createOffer() {
    auto started = startEngine(SessionRole::Offer);
    if (started.is_err()) {
        return started;
    }

    // The offering side owns channel creation.
    auto channel = engine_->create_channel(config_.channel_label);
    if (!channel) {
        releaseEngine(false);
        role_.reset();
        return fail<void>(ErrorCode::EngineInitError, "Engine could not create a data channel");
    }
    bindChannel(std::move(channel));

    setState(ConnectionState::Offering);
    requestLocalDescription(SessionRole::Offer);
    return Result<void, Error>::ok();
}

Result<void, Error> ConnectionController::createAnswer(const QString& offer_token) {
    if (engine_) {
        return fail<void>(ErrorCode::SessionInProgress, "Close the current session first");
    }

    auto decoded = decompress(offer_token);
    if (decoded.is_err()) {
        return Result<void, Error>::err(decoded.unwrap_err());
    }
    auto remote = std::move(decoded).unwrap();
    if (remote.description.role != SessionRole::Offer) {
        return fail<void>(ErrorCode::InvalidToken, "Expected an offer token");
    }

    auto started = startEngine(SessionRole::Answer);
    if (started.is_err()) {
        return started;
    }

    setState(ConnectionState::Answering);
    applyRemote(std::move(remote), [this]() {
        requestLocalDescription(SessionRole::Answer);
    });
    return Result<void, Error>::ok();
}

Result<void, Error> ConnectionController::acceptAnswer(const QString& answer_token) {
    if (!engine_ || role_ != SessionRole::Offer ||
        (state_ != ConnectionState::Offering && state_ != ConnectionState::Connecting)) {
        return fail<void>(ErrorCode::NoActiveOffer, "No peer connection - call createOffer first");
    }

    auto decoded = decompress(answer_token);
    if (decoded.is_err()) {
        return Result<void, Error>::err(decoded.unwrap_err());
    }
    auto remote = std::move(decoded).unwrap();
    if (remote.description.role != SessionRole::Answer) {
        return fail<void>(ErrorCode::InvalidToken, "Expected an answer token");
    }

    applyRemote(std::move(remote), [this]() {
        enterConnecting();
        emit answerAccepted();
    });
    return Result<void, Error>::ok();
}

Result<void, Error> ConnectionController::send(const QVariant& message) {
    if (!channel_ || channel_->state() != ChannelState::Open) {
        return fail<void>(ErrorCode::ChannelNotOpen, "Data channel not open");
    }
    return channel_->send(serialize_message(message));
}

void ConnectionController::close() {
    ++generation_;
    gather_timer_.stop();
    gather_pending_ = false;
    gather_finalized_ = false;

    releaseEngine(true);

    local_candidates_.clear();
    local_description_.reset();
    role_.reset();
    path_usable_ = false;
    channel_open_ = false;

    setState(ConnectionState::Disconnected);
}

// ============================================================================
// Engine plumbing
// ============================================================================

Result<void, Error> ConnectionController::startEngine(SessionRole role) {
    if (engine_) {
        return fail<void>(ErrorCode::SessionInProgress, "Close the current session first");
    }

    auto created = factory_ ? factory_(EngineConfig{.ice_servers = config_.ice_servers})
                            : fail<std::unique_ptr<NegotiationEngine>>(
                                  ErrorCode::EngineInitError, "No engine factory");
    if (created.is_err()) {
        auto error = created.unwrap_err();
        error.code = ErrorCode::EngineInitError;
        qCWarning(qrlinkSignalingLog) << qPrintable(sessionTag()) << "engine init failed:" << error.message.c_str();
        return Result<void, Error>::err(std::move(error));
    }
    engine_ = std::move(created).unwrap();
    if (!engine_) {
        return fail<void>(ErrorCode::EngineInitError, "Engine factory returned no engine");
    }

    ++generation_;
    role_ = role;
    local_candidates_.clear();
    local_description_.reset();
    gather_pending_ = false;
    gather_finalized_ = false;
    path_usable_ = false;
    channel_open_ = false;

    bindEngine();
    qCDebug(qrlinkSignalingLog) << qPrintable(sessionTag()) << "engine started";
    return Result<void, Error>::ok();
}

void ConnectionController::bindEngine() {
    engine_->on_local_candidate = guarded([this](QString candidate) {
        ingestLocalCandidate(candidate);
    });
    engine_->on_gathering_complete = guarded([this]() {
        qCDebug(qrlinkSignalingLog) << "gathering complete";
        finishGathering("complete");
    });
    engine_->on_path_state_changed = guarded([this](PathState s) {
        onPathStateChanged(s);
    });
    engine_->on_remote_channel = guarded([this](std::shared_ptr<DataChannel> channel) {
        qCDebug(qrlinkSignalingLog) << "received data channel" << channel->label();
        bindChannel(std::move(channel));
    });
}

void ConnectionController::bindChannel(std::shared_ptr<DataChannel> channel) {
    channel_ = std::move(channel);
    channel_open_ = false;

    channel_->on_open = guarded([this]() { onChannelOpen(); });
    channel_->on_close = guarded([this]() { onChannelClosed(); });
    channel_->on_message = guarded([this](QString text) { onChannelMessage(text); });
    channel_->on_error = guarded([this](QString message) {
        qCWarning(qrlinkSignalingLog) << qPrintable(sessionTag()) << "data channel error:" << message;
        emit errorOccurred(Error{message.toStdString(), ErrorCode::EngineError});
    });

    // Some engines hand over a channel that is already open.
    if (channel_->state() == ChannelState::Open) {
        onChannelOpen();
    }
}

void ConnectionController::applyRemote(DecodedNegotiation remote, std::function<void()> then) {
    auto candidates = std::make_shared<std::vector<RemoteCandidate>>(std::move(remote.candidates));

    engine_->set_remote_description(
        remote.description,
        guarded([this, candidates, then = std::move(then)](Result<void, Error> applied) {
            if (applied.is_err()) {
                failWith(Error{"Remote description rejected: " + applied.unwrap_err().message,
                               ErrorCode::EngineError});
                return;
            }
            if (candidates->empty()) {
                then();
                return;
            }

            auto remaining = std::make_shared<size_t>(candidates->size());
            for (const auto& candidate : *candidates) {
                engine_->add_remote_candidate(
                    candidate,
                    guarded([this, remaining, then, line = candidate.candidate](Result<void, Error> added) {
                        if (added.is_err()) {
                            qCWarning(qrlinkSignalingLog) << qPrintable(sessionTag()) << "Failed to add candidate:" << line
                                                          << added.unwrap_err().message.c_str();
                        }
                        if (--*remaining == 0) {
                            then();
                        }
                    }));
                if (!engine_) {
                    return;
                }
            }
        }));
}

void ConnectionController::requestLocalDescription(SessionRole role) {
    engine_->create_local_description(
        role,
        guarded([this, role](Result<SessionDescription, Error> created) {
            if (created.is_err()) {
                failWith(Error{"Local description failed: " + created.unwrap_err().message,
                               ErrorCode::EngineError});
                return;
            }
            local_description_ = std::move(created).unwrap();
            if (role == SessionRole::Answer) {
                enterConnecting();
            }
            beginGathering();
        }));
}

// ============================================================================
// Candidate gathering race
// ============================================================================

void ConnectionController::beginGathering() {
    if (gather_pending_ || gather_finalized_) {
        return;
    }
    gather_pending_ = true;
    gather_timer_.start(config_.gather_timeout_ms);

    if (engine_->gathering_state() == GatheringState::Complete) {
        finishGathering("complete");
    } else if (static_cast<int>(local_candidates_.size()) >= config_.candidate_threshold) {
        finishGathering("threshold");
    }
}

void ConnectionController::ingestLocalCandidate(const QString& candidate) {
    if (candidate.isEmpty()) {
        return;
    }
    if (gather_finalized_) {
        qCDebug(qrlinkSignalingLog) << "late candidate ignored:" << candidate;
        return;
    }
    local_candidates_.push_back(candidate);
    qCDebug(qrlinkSignalingLog) << "local candidate" << local_candidates_.size() << candidate;

    if (gather_pending_ &&
        static_cast<int>(local_candidates_.size()) >= config_.candidate_threshold) {
        finishGathering("threshold");
    }
}

void ConnectionController::finishGathering(const char* reason) {
    if (!gather_pending_) {
        return;
    }
    gather_pending_ = false;
    gather_finalized_ = true;
    gather_timer_.stop();

    qCInfo(qrlinkSignalingLog) << qPrintable(sessionTag()) << "gathering finished by" << reason << "with"
                               << local_candidates_.size() << "candidates";

    auto token = compress(*local_description_, local_candidates_);
    if (token.is_err()) {
        failWith(token.unwrap_err());
        return;
    }

    if (role_ == SessionRole::Offer) {
        emit offerReady(token.unwrap());
    } else {
        emit answerReady(token.unwrap());
    }
}

// ============================================================================
// Connection state
// ============================================================================

void ConnectionController::onPathStateChanged(PathState path_state) {
    qCDebug(qrlinkSignalingLog) << "path state:" << path_state_name(path_state);

    switch (path_state) {
        case PathState::Connected:
        case PathState::Completed:
            path_usable_ = true;
            checkConnected();
            break;
        case PathState::Failed:
            path_usable_ = false;
            if (state_ != ConnectionState::Failed && state_ != ConnectionState::Disconnected) {
                failWith(Error{"ICE connection failed", ErrorCode::PathFailed});
            }
            break;
        case PathState::Disconnected:
        case PathState::Closed:
            path_usable_ = false;
            if (state_ == ConnectionState::Connected) {
                setState(ConnectionState::Disconnected);
            }
            break;
        case PathState::New:
        case PathState::Checking:
            break;
    }
}

void ConnectionController::onChannelOpen() {
    qCDebug(qrlinkSignalingLog) << "data channel open";
    channel_open_ = true;
    checkConnected();
}

void ConnectionController::onChannelClosed() {
    qCDebug(qrlinkSignalingLog) << "data channel closed";
    channel_open_ = false;
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
        setState(ConnectionState::Disconnected);
    }
}

void ConnectionController::onChannelMessage(const QString& text) {
    emit messageReceived(deserialize_message(text));
}

void ConnectionController::checkConnected() {
    if (path_usable_ && channel_open_ && state_ == ConnectionState::Connecting) {
        setState(ConnectionState::Connected);
    }
}

void ConnectionController::enterConnecting() {
    if (state_ == ConnectionState::Failed || state_ == ConnectionState::Disconnected ||
        state_ == ConnectionState::Connected) {
        return;
    }
    setState(ConnectionState::Connecting);
    // Both signals may already have arrived while descriptions were applied.
    checkConnected();
}

void ConnectionController::failWith(Error error) {
    qCWarning(qrlinkSignalingLog) << qPrintable(sessionTag()) << to_string(error.code) << error.message.c_str();
    gather_pending_ = false;
    gather_timer_.stop();
    setState(ConnectionState::Failed);
    emit errorOccurred(error);
}

void ConnectionController::setState(ConnectionState state) {
    if (state_ != state) {
        qCInfo(qrlinkSignalingLog) << qPrintable(sessionTag()) << "state" << state_ << "->" << state;
        state_ = state;
        emit stateChanged(state);
    }
}

void ConnectionController::releaseEngine(bool deferred) {
    std::shared_ptr<DataChannel> channel = std::move(channel_);
    std::shared_ptr<NegotiationEngine> engine(std::move(engine_));

    if (channel) {
        channel->close();
    }
    if (engine) {
        engine->close();
    }

    // close() may run inside one of the engine's own callbacks, so the
    // objects are destroyed once control is back in the event loop.
    if (deferred && (channel || engine)) {
        QMetaObject::invokeMethod(this, [channel, engine]() {}, Qt::QueuedConnection);
    }
}

} // namespace qrlink::network
