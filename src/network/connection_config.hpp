#pragma once

#include <QString>
#include <QStringList>

namespace qrlink::network {

/**
 * ControllerConfig - Tunables for ConnectionController.
 *
 * Environment overrides (applied by fromEnvironment()):
 *   QRLINK_ICE_SERVERS          comma separated STUN/TURN URLs
 *   QRLINK_GATHER_TIMEOUT_MS    upper bound on the candidate wait
 *   QRLINK_CANDIDATE_THRESHOLD  candidates that end the wait early
 */
struct ControllerConfig {
    static constexpr int DEFAULT_GATHER_TIMEOUT_MS = 3000;
    static constexpr int DEFAULT_CANDIDATE_THRESHOLD = 3;
    
    QStringList ice_servers = defaultIceServers();
    QString channel_label = QStringLiteral("p2p-stream");
    int gather_timeout_ms = DEFAULT_GATHER_TIMEOUT_MS;
    int candidate_threshold = DEFAULT_CANDIDATE_THRESHOLD;
    
    /**
     * Public STUN servers. STUN needs no credentials and covers most NATs.
     */
    [[nodiscard]] static QStringList defaultIceServers();
    
    /**
     * Defaults with environment overrides applied.
     */
    [[nodiscard]] static ControllerConfig fromEnvironment();
};

} // namespace qrlink::network
