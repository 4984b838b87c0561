#pragma once

#include <QByteArray>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QStringList>
#include <QtGlobal>

#include <functional>
#include <vector>

#include "network/connection_config.hpp"
#include "network/negotiation_codec.hpp"

namespace qrlink::test {

class EnvVarGuard {
public:
    explicit EnvVarGuard(const char* name)
        : name_(name)
        , old_(qgetenv(name))
        , had_(qEnvironmentVariableIsSet(name))
    {
    }

    ~EnvVarGuard() {
        if (had_) {
            qputenv(name_.constData(), old_);
        } else {
            qunsetenv(name_.constData());
        }
    }

private:
    QByteArray name_;
    QByteArray old_;
    bool had_ = false;
};

inline bool spinUntil(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

inline void drainEvents() {
    for (int i = 0; i < 5; ++i) {
        QCoreApplication::processEvents(QEventLoop::AllEvents);
    }
}

// Fixed 32-byte fingerprint, "AB:AB:...".
inline QString sampleFingerprint(uint8_t fill = 0xAB) {
    return network::format_fingerprint(std::vector<uint8_t>(32, fill));
}

inline QString sampleSdp(const QString& ufrag,
                         const QString& pwd = QStringLiteral("abcdefghijklmnopqrstuvwx"),
                         const QString& fingerprint = sampleFingerprint()) {
    const QStringList lines{
        QStringLiteral("v=0"),
        QStringLiteral("o=- 4611731400430051336 2 IN IP4 127.0.0.1"),
        QStringLiteral("s=-"),
        QStringLiteral("t=0 0"),
        QStringLiteral("a=group:BUNDLE 0"),
        QStringLiteral("m=application 9 UDP/DTLS/SCTP webrtc-datachannel"),
        QStringLiteral("c=IN IP4 0.0.0.0"),
        QStringLiteral("a=ice-ufrag:") + ufrag,
        QStringLiteral("a=ice-pwd:") + pwd,
        QStringLiteral("a=ice-options:trickle"),
        QStringLiteral("a=fingerprint:sha-256 ") + fingerprint,
        QStringLiteral("a=setup:actpass"),
        QStringLiteral("a=mid:0"),
        QStringLiteral("a=sctp-port:5000"),
    };
    return lines.join(QStringLiteral("\r\n")) + QStringLiteral("\r\n");
}

inline QString hostCandidate(const QString& ip, int port, const QString& typ = QStringLiteral("host")) {
    return QStringLiteral("candidate:1 1 udp 2122260223 %1 %2 typ %3 generation 0")
        .arg(ip)
        .arg(port)
        .arg(typ);
}

inline QString makeToken(network::SessionRole role,
                         const QString& ufrag,
                         const std::vector<QString>& candidates = {}) {
    return network::compress(network::SessionDescription{.role = role, .sdp = sampleSdp(ufrag)},
                             candidates)
        .unwrap();
}

inline network::ControllerConfig fastConfig(int gatherTimeoutMs = 3000) {
    network::ControllerConfig config;
    config.gather_timeout_ms = gatherTimeoutMs;
    return config;
}

} // namespace qrlink::test
