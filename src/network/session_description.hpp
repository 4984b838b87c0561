#pragma once

#include <QHostAddress>
#include <QMetaType>
#include <QString>
#include <cstdint>

namespace qrlink::network {

/**
 * SessionRole - Which side of the offer/answer exchange a description belongs to.
 */
enum class SessionRole {
    Offer,
    Answer
};

/**
 * PathKind - ICE candidate type. Peer-reflexive candidates travel as Host.
 */
enum class PathKind : uint8_t {
    Host,
    ServerReflexive,
    Relayed
};

/**
 * NetworkPath - One IPv4 address/port an endpoint may be reachable at.
 */
struct NetworkPath {
    QHostAddress address;
    uint16_t port = 0;
    PathKind kind = PathKind::Host;
    
    bool operator==(const NetworkPath& other) const {
        return address == other.address && port == other.port && kind == other.kind;
    }
};

/**
 * SessionDescription - A full SDP offer or answer as the engine produces it.
 */
struct SessionDescription {
    SessionRole role = SessionRole::Offer;
    QString sdp;
};

/**
 * RemoteCandidate - A candidate ready to be handed to the engine.
 */
struct RemoteCandidate {
    QString candidate;
    QString sdp_mid = QStringLiteral("0");
    int sdp_mline_index = 0;
};

[[nodiscard]] inline QString role_name(SessionRole role) {
    return role == SessionRole::Offer ? QStringLiteral("offer") : QStringLiteral("answer");
}

} // namespace qrlink::network

Q_DECLARE_METATYPE(qrlink::network::SessionRole)
