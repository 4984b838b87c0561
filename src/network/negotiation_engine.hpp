#pragma once

#include "core/result.hpp"
#include "network/session_description.hpp"
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

namespace qrlink::network {

/**
 * PathState - ICE connection state as reported by the engine.
 */
enum class PathState {
    New,
    Checking,
    Connected,
    Completed,
    Disconnected,
    Failed,
    Closed
};

/**
 * GatheringState - Local candidate discovery progress.
 */
enum class GatheringState {
    New,
    Gathering,
    Complete
};

/**
 * ChannelState - Data channel ready state.
 */
enum class ChannelState {
    Connecting,
    Open,
    Closing,
    Closed
};

/**
 * DataChannel - Bidirectional text channel handle owned by the engine.
 *
 * Callbacks are invoked on the thread that owns the controller.
 */
class DataChannel {
public:
    virtual ~DataChannel() = default;
    
    [[nodiscard]] virtual QString label() const = 0;
    [[nodiscard]] virtual ChannelState state() const = 0;
    virtual Result<void, Error> send(const QString& text) = 0;
    virtual void close() = 0;
    
    // Callbacks
    std::function<void()> on_open;
    std::function<void()> on_close;
    std::function<void(QString)> on_message;
    std::function<void(QString)> on_error;
};

/**
 * EngineConfig - Settings handed to the engine at construction.
 */
struct EngineConfig {
    QStringList ice_servers;
};

/**
 * NegotiationEngine - Abstract interface for the ICE/DTLS/SCTP stack.
 *
 * The controller drives exactly one engine per lifecycle. Asynchronous
 * operations report through their completion callback; a rejected remote
 * candidate is reported there as well and never thrown. All callbacks,
 * completion and event alike, must be delivered on the controller's thread.
 */
class NegotiationEngine {
public:
    using Completion = std::function<void(Result<void, Error>)>;
    using DescriptionCompletion = std::function<void(Result<SessionDescription, Error>)>;
    
    virtual ~NegotiationEngine() = default;
    
    virtual std::shared_ptr<DataChannel> create_channel(const QString& label) = 0;
    
    virtual void create_local_description(SessionRole role, DescriptionCompletion done) = 0;
    virtual void set_remote_description(const SessionDescription& description,
                                        Completion done) = 0;
    virtual void add_remote_candidate(const RemoteCandidate& candidate, Completion done) = 0;
    
    [[nodiscard]] virtual GatheringState gathering_state() const = 0;
    
    virtual void close() = 0;
    
    // Callbacks
    std::function<void(QString)> on_local_candidate;
    std::function<void()> on_gathering_complete;
    std::function<void(PathState)> on_path_state_changed;
    std::function<void(std::shared_ptr<DataChannel>)> on_remote_channel;
};

using EngineFactory =
    std::function<Result<std::unique_ptr<NegotiationEngine>, Error>(const EngineConfig&)>;

} // namespace qrlink::network
