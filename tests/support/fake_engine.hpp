#pragma once

#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "network/negotiation_engine.hpp"
#include "support/test_helpers.hpp"

namespace qrlink::test {

using network::ChannelState;
using network::DataChannel;
using network::GatheringState;
using network::NegotiationEngine;
using network::PathState;
using network::RemoteCandidate;
using network::SessionDescription;
using network::SessionRole;

/**
 * FakeChannel - DataChannel the test opens, closes and feeds by hand.
 */
class FakeChannel : public DataChannel {
public:
    explicit FakeChannel(QString label, ChannelState initial = ChannelState::Connecting)
        : label_(std::move(label))
        , state_(initial)
    {
    }

    QString label() const override { return label_; }
    ChannelState state() const override { return state_; }

    Result<void, Error> send(const QString& text) override {
        if (state_ != ChannelState::Open) {
            return fail<void>(ErrorCode::ChannelNotOpen, "fake channel not open");
        }
        sent.push_back(text);
        return Result<void, Error>::ok();
    }

    void close() override {
        if (state_ == ChannelState::Closed) {
            return;
        }
        state_ = ChannelState::Closed;
        ++close_calls;
        if (on_close) on_close();
    }

    void open() {
        state_ = ChannelState::Open;
        if (on_open) on_open();
    }

    void remoteClose() {
        state_ = ChannelState::Closed;
        if (on_close) on_close();
    }

    void deliver(const QString& text) {
        if (on_message) on_message(text);
    }

    void raiseError(const QString& message) {
        if (on_error) on_error(message);
    }

    std::vector<QString> sent;
    int close_calls = 0;

private:
    QString label_;
    ChannelState state_;
};

/**
 * FakeEngine - NegotiationEngine whose completions run synchronously unless
 * the script asks to hold the local description back.
 */
class FakeEngine : public NegotiationEngine {
public:
    struct Script {
        bool fail_channel = false;
        bool fail_local_description = false;
        bool fail_remote_description = false;
        bool defer_local_description = false;
        bool omit_fingerprint = false;
        QStringList rejected_candidates;  // Substrings that make add_remote_candidate fail
    };

    struct Probe {
        FakeEngine* engine = nullptr;
        int created = 0;
        int destroyed = 0;
        QStringList ice_servers;
    };

    FakeEngine(Script script, std::shared_ptr<Probe> probe)
        : script_(std::move(script))
        , probe_(std::move(probe))
    {
    }

    ~FakeEngine() override {
        ++probe_->destroyed;
        if (probe_->engine == this) {
            probe_->engine = nullptr;
        }
    }

    std::shared_ptr<DataChannel> create_channel(const QString& label) override {
        if (script_.fail_channel) {
            return nullptr;
        }
        channel = std::make_shared<FakeChannel>(label);
        return channel;
    }

    void create_local_description(SessionRole role, DescriptionCompletion done) override {
        local_requests.push_back(role);
        const auto ufrag = role == SessionRole::Offer ? QStringLiteral("offr") : QStringLiteral("answ");
        const auto fingerprint = script_.omit_fingerprint ? QString() : sampleFingerprint(0x5C);
        auto sdp = sampleSdp(ufrag, QStringLiteral("fakepasswordfakepassword"), fingerprint);
        if (script_.omit_fingerprint) {
            sdp.remove(QStringLiteral("a=fingerprint:sha-256 \r\n"));
        }

        auto result = script_.fail_local_description
            ? fail<SessionDescription>(ErrorCode::EngineError, "local description refused")
            : Result<SessionDescription, Error>::ok(SessionDescription{.role = role, .sdp = sdp});

        if (script_.defer_local_description) {
            pending_local_ = [done, result]() { done(result); };
            return;
        }
        done(result);
    }

    void set_remote_description(const SessionDescription& description, Completion done) override {
        remote_descriptions.push_back(description);
        if (script_.fail_remote_description) {
            done(fail<void>(ErrorCode::EngineError, "remote description refused"));
            return;
        }
        done(Result<void, Error>::ok());
    }

    void add_remote_candidate(const RemoteCandidate& candidate, Completion done) override {
        for (const auto& rejected : script_.rejected_candidates) {
            if (candidate.candidate.contains(rejected)) {
                rejected_candidates.push_back(candidate);
                done(fail<void>(ErrorCode::EngineError, "candidate refused"));
                return;
            }
        }
        remote_candidates.push_back(candidate);
        done(Result<void, Error>::ok());
    }

    GatheringState gathering_state() const override { return gathering_; }

    void close() override {
        ++close_calls;
    }

    // Test drivers

    void releaseLocalDescription() {
        if (pending_local_) {
            auto pending = std::move(pending_local_);
            pending_local_ = nullptr;
            pending();
        }
    }

    void emitCandidate(const QString& line) {
        gathering_ = GatheringState::Gathering;
        if (on_local_candidate) on_local_candidate(line);
    }

    void completeGathering() {
        gathering_ = GatheringState::Complete;
        if (on_gathering_complete) on_gathering_complete();
    }

    void setPathState(PathState state) {
        if (on_path_state_changed) on_path_state_changed(state);
    }

    std::shared_ptr<FakeChannel> announceRemoteChannel(const QString& label,
                                                       ChannelState initial = ChannelState::Connecting) {
        channel = std::make_shared<FakeChannel>(label, initial);
        if (on_remote_channel) on_remote_channel(channel);
        return channel;
    }

    std::shared_ptr<FakeChannel> channel;
    std::vector<SessionRole> local_requests;
    std::vector<SessionDescription> remote_descriptions;
    std::vector<RemoteCandidate> remote_candidates;
    std::vector<RemoteCandidate> rejected_candidates;
    int close_calls = 0;

private:
    Script script_;
    std::shared_ptr<Probe> probe_;
    GatheringState gathering_ = GatheringState::New;
    std::function<void()> pending_local_;
};

inline network::EngineFactory fakeFactory(std::shared_ptr<FakeEngine::Probe> probe,
                                          FakeEngine::Script script = {}) {
    return [probe, script](const network::EngineConfig& config)
               -> Result<std::unique_ptr<NegotiationEngine>, Error> {
        auto engine = std::make_unique<FakeEngine>(script, probe);
        probe->engine = engine.get();
        probe->ice_servers = config.ice_servers;
        ++probe->created;
        return Result<std::unique_ptr<NegotiationEngine>, Error>::ok(std::move(engine));
    };
}

inline network::EngineFactory failingFactory() {
    return [](const network::EngineConfig&) -> Result<std::unique_ptr<NegotiationEngine>, Error> {
        return fail<std::unique_ptr<NegotiationEngine>>(ErrorCode::EngineError, "no ICE stack");
    };
}

} // namespace qrlink::test
