#include "network/connection_config.hpp"

#include <QDebug>
#include <QtGlobal>

namespace qrlink::network {
namespace {

bool read_positive_int(const char* name, int* out) {
    if (!qEnvironmentVariableIsSet(name)) {
        return false;
    }
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value <= 0) {
        qWarning() << "Ignoring invalid" << name << "=" << qgetenv(name);
        return false;
    }
    *out = value;
    return true;
}

} // namespace

QStringList ControllerConfig::defaultIceServers() {
    return {
        QStringLiteral("stun:stun.l.google.com:19302"),
        QStringLiteral("stun:stun1.l.google.com:19302"),
        QStringLiteral("stun:stun2.l.google.com:19302"),
        QStringLiteral("stun:stun.cloudflare.com:3478"),
        QStringLiteral("stun:stun.stunprotocol.org:3478"),
    };
}

ControllerConfig ControllerConfig::fromEnvironment() {
    ControllerConfig config;

    const auto servers = qEnvironmentVariable("QRLINK_ICE_SERVERS");
    if (!servers.isEmpty()) {
        QStringList list;
        for (const auto& entry : servers.split(QLatin1Char(','))) {
            const auto url = entry.trimmed();
            if (!url.isEmpty()) {
                list.append(url);
            }
        }
        if (list.isEmpty()) {
            qWarning() << "Ignoring empty QRLINK_ICE_SERVERS";
        } else {
            config.ice_servers = list;
        }
    }

    read_positive_int("QRLINK_GATHER_TIMEOUT_MS", &config.gather_timeout_ms);
    read_positive_int("QRLINK_CANDIDATE_THRESHOLD", &config.candidate_threshold);

    return config;
}

} // namespace qrlink::network
