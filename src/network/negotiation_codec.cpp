#include "network/negotiation_codec.hpp"

#include "crypto/identity.hpp"

#include <QByteArrayList>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QStringList>

namespace qrlink::network {

Q_LOGGING_CATEGORY(qrlinkCodecLog, "qrlink.codec", QtInfoMsg)

namespace {

// Reconstructed candidates count down from the highest host priority so the
// original discovery order is also the engine's preference order.
constexpr quint32 kBasePriority = 2113937151;
constexpr quint32 kPriorityStep = 100;
constexpr int kPackedPathSize = 6;

QString capture_line(const QString& sdp, const QRegularExpression& re) {
    const auto match = re.match(sdp);
    if (!match.hasMatch()) {
        return {};
    }
    return match.captured(1).trimmed();
}

// "key":<compact JSON value>
QByteArray json_member(const char* key, const QJsonValue& value) {
    const auto wrapped = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
    return '"' + QByteArray(key) + "\":" + wrapped.mid(1, wrapped.size() - 2);
}

QChar kind_letter(PathKind kind) {
    switch (kind) {
        case PathKind::Host: return QLatin1Char('h');
        case PathKind::ServerReflexive: return QLatin1Char('s');
        case PathKind::Relayed: return QLatin1Char('r');
    }
    return QLatin1Char('h');
}

PathKind kind_from_letter(QChar c) {
    if (c == QLatin1Char('s')) return PathKind::ServerReflexive;
    if (c == QLatin1Char('r')) return PathKind::Relayed;
    return PathKind::Host;
}

QString kind_name(PathKind kind) {
    switch (kind) {
        case PathKind::Host: return QStringLiteral("host");
        case PathKind::ServerReflexive: return QStringLiteral("srflx");
        case PathKind::Relayed: return QStringLiteral("relay");
    }
    return QStringLiteral("host");
}

QString encode_path(const NetworkPath& path) {
    const quint32 ip = path.address.toIPv4Address();
    QByteArray packed;
    packed.reserve(kPackedPathSize);
    packed.append(static_cast<char>((ip >> 24) & 0xFF));
    packed.append(static_cast<char>((ip >> 16) & 0xFF));
    packed.append(static_cast<char>((ip >> 8) & 0xFF));
    packed.append(static_cast<char>(ip & 0xFF));
    packed.append(static_cast<char>((path.port >> 8) & 0xFF));
    packed.append(static_cast<char>(path.port & 0xFF));
    return QString::fromLatin1(packed.toBase64()) + QLatin1Char(':') + kind_letter(path.kind);
}

std::optional<NetworkPath> decode_path(const QString& entry) {
    const auto parts = entry.split(QLatin1Char(':'));
    if (parts.size() != 2 || parts[1].size() != 1) {
        return std::nullopt;
    }
    const auto decoded = QByteArray::fromBase64Encoding(
        parts[0].toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded || decoded.decoded.size() != kPackedPathSize) {
        return std::nullopt;
    }
    const auto& b = decoded.decoded;
    const quint32 ip = (static_cast<quint32>(static_cast<uint8_t>(b[0])) << 24) |
                       (static_cast<quint32>(static_cast<uint8_t>(b[1])) << 16) |
                       (static_cast<quint32>(static_cast<uint8_t>(b[2])) << 8) |
                       static_cast<quint32>(static_cast<uint8_t>(b[3]));
    NetworkPath path;
    path.address = QHostAddress(ip);
    path.port = static_cast<uint16_t>((static_cast<uint8_t>(b[4]) << 8) |
                                      static_cast<uint8_t>(b[5]));
    path.kind = kind_from_letter(parts[1].at(0));
    return path;
}

QString build_sdp(SessionRole role, const IceParameters& ice) {
    const QStringList lines{
        QStringLiteral("v=0"),
        QStringLiteral("o=- %1 2 IN IP4 127.0.0.1").arg(QDateTime::currentMSecsSinceEpoch()),
        QStringLiteral("s=-"),
        QStringLiteral("t=0 0"),
        QStringLiteral("a=group:BUNDLE 0"),
        QStringLiteral("a=msid-semantic: WMS"),
        QStringLiteral("m=application 9 UDP/DTLS/SCTP webrtc-datachannel"),
        QStringLiteral("c=IN IP4 0.0.0.0"),
        QStringLiteral("a=ice-ufrag:") + ice.ufrag,
        QStringLiteral("a=ice-pwd:") + ice.pwd,
        QStringLiteral("a=ice-options:trickle"),
        QStringLiteral("a=fingerprint:sha-256 ") + ice.fingerprint,
        role == SessionRole::Offer ? QStringLiteral("a=setup:actpass")
                                   : QStringLiteral("a=setup:active"),
        QStringLiteral("a=mid:0"),
        QStringLiteral("a=sctp-port:5000"),
        QStringLiteral("a=max-message-size:262144"),
    };
    return lines.join(QStringLiteral("\r\n")) + QStringLiteral("\r\n");
}

Result<DecodedNegotiation, Error> invalid_token(const std::string& why) {
    return fail<DecodedNegotiation>(ErrorCode::InvalidToken, "Invalid token: " + why);
}

} // namespace

std::optional<IceParameters> extract_ice_parameters(const QString& sdp) {
    static const QRegularExpression ufragRe(QStringLiteral("a=ice-ufrag:([^\\r\\n]+)"));
    static const QRegularExpression pwdRe(QStringLiteral("a=ice-pwd:([^\\r\\n]+)"));
    static const QRegularExpression fingerprintRe(
        QStringLiteral("a=fingerprint:sha-256 ([^\\r\\n]+)"));

    IceParameters ice{
        .ufrag = capture_line(sdp, ufragRe),
        .pwd = capture_line(sdp, pwdRe),
        .fingerprint = capture_line(sdp, fingerprintRe),
    };
    if (ice.ufrag.isEmpty() || ice.pwd.isEmpty() || ice.fingerprint.isEmpty()) {
        return std::nullopt;
    }
    return ice;
}

Result<std::vector<uint8_t>, Error> parse_fingerprint(const QString& text) {
    const auto groups = text.trimmed().split(QLatin1Char(':'));
    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<size_t>(groups.size()));
    for (const auto& group : groups) {
        bool ok = false;
        const auto value = group.toUInt(&ok, 16);
        if (!ok || group.size() > 2 || value > 0xFF) {
            return fail<std::vector<uint8_t>>(ErrorCode::MalformedNegotiationData,
                                              "Invalid fingerprint byte: " + group.toStdString());
        }
        bytes.push_back(static_cast<uint8_t>(value));
    }
    return Result<std::vector<uint8_t>, Error>::ok(std::move(bytes));
}

QString format_fingerprint(const std::vector<uint8_t>& bytes) {
    QStringList groups;
    groups.reserve(static_cast<qsizetype>(bytes.size()));
    for (uint8_t b : bytes) {
        groups.append(QStringLiteral("%1").arg(static_cast<int>(b), 2, 16, QLatin1Char('0')).toUpper());
    }
    return groups.join(QLatin1Char(':'));
}

std::optional<NetworkPath> parse_candidate(const QString& line) {
    static const QRegularExpression re(
        QStringLiteral("(\\d+\\.\\d+\\.\\d+\\.\\d+) (\\d+) typ (\\w+)"));
    const auto match = re.match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    QHostAddress address;
    if (!address.setAddress(match.captured(1)) ||
        address.protocol() != QAbstractSocket::IPv4Protocol) {
        return std::nullopt;
    }

    bool ok = false;
    const auto port = match.captured(2).toUInt(&ok);
    if (!ok || port > 65535) {
        return std::nullopt;
    }

    const auto typ = match.captured(3);
    PathKind kind = PathKind::Host;
    if (typ == QStringLiteral("srflx")) {
        kind = PathKind::ServerReflexive;
    } else if (typ == QStringLiteral("relay")) {
        kind = PathKind::Relayed;
    }

    return NetworkPath{.address = address, .port = static_cast<uint16_t>(port), .kind = kind};
}

QString candidate_line(const NetworkPath& path, int index) {
    const quint32 priority = kBasePriority - static_cast<quint32>(index) * kPriorityStep;
    return QStringLiteral("candidate:%1 1 udp %2 %3 %4 typ %5")
        .arg(index)
        .arg(priority)
        .arg(path.address.toString())
        .arg(path.port)
        .arg(kind_name(path.kind));
}

Result<QString, Error> compress(const SessionDescription& description,
                                const std::vector<QString>& candidates) {
    const auto ice = extract_ice_parameters(description.sdp);
    if (!ice) {
        return fail<QString>(ErrorCode::MalformedNegotiationData,
                             "Could not extract required SDP fields");
    }

    auto fingerprint = parse_fingerprint(ice->fingerprint);
    if (fingerprint.is_err()) {
        return Result<QString, Error>::err(fingerprint.unwrap_err());
    }
    const auto& fp = fingerprint.unwrap();
    if (fp.size() != crypto::FINGERPRINT_SIZE) {
        return fail<QString>(ErrorCode::MalformedNegotiationData,
                             "Fingerprint is not a SHA-256 digest");
    }
    const QByteArray fp_bytes(reinterpret_cast<const char*>(fp.data()),
                              static_cast<qsizetype>(fp.size()));

    QJsonArray paths;
    size_t dropped = 0;
    for (const auto& line : candidates) {
        if (line.isEmpty()) continue;
        const auto path = parse_candidate(line);
        if (!path) continue;
        if (static_cast<size_t>(paths.size()) >= MAX_TOKEN_PATHS) {
            ++dropped;
            continue;
        }
        paths.append(encode_path(*path));
    }
    if (dropped > 0) {
        qCDebug(qrlinkCodecLog) << "dropped" << dropped << "candidates beyond the token cap";
    }

    // QJsonObject sorts its keys; the record keeps the role tag first.
    const QByteArrayList members{
        json_member("t", description.role == SessionRole::Offer ? QStringLiteral("o")
                                                                : QStringLiteral("a")),
        json_member("u", ice->ufrag),
        json_member("p", ice->pwd),
        json_member("f", QString::fromLatin1(fp_bytes.toBase64())),
        json_member("c", paths),
    };
    const auto json = '{' + members.join(',') + '}';
    return Result<QString, Error>::ok(QString::fromLatin1(json.toBase64()));
}

Result<DecodedNegotiation, Error> decompress(const QString& token) {
    const auto raw = QByteArray::fromBase64Encoding(
        token.trimmed().toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!raw || raw.decoded.isEmpty()) {
        return invalid_token("not base64");
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(raw.decoded, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return invalid_token("not a JSON record");
    }

    const auto obj = doc.object();
    const auto tag = obj["t"].toString();
    const auto ufrag = obj["u"].toString();
    const auto pwd = obj["p"].toString();
    const auto fp_b64 = obj["f"].toString();
    if (tag.isEmpty() || ufrag.isEmpty() || pwd.isEmpty() || fp_b64.isEmpty()) {
        return invalid_token("missing fields");
    }
    if (tag != QStringLiteral("o") && tag != QStringLiteral("a")) {
        return invalid_token("unknown role tag");
    }

    const auto fp = QByteArray::fromBase64Encoding(
        fp_b64.toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!fp || static_cast<size_t>(fp.decoded.size()) != crypto::FINGERPRINT_SIZE) {
        return invalid_token("bad fingerprint");
    }

    DecodedNegotiation out;
    out.description.role = tag == QStringLiteral("o") ? SessionRole::Offer : SessionRole::Answer;
    out.description.sdp = build_sdp(
        out.description.role,
        IceParameters{
            .ufrag = ufrag,
            .pwd = pwd,
            .fingerprint = format_fingerprint(
                std::vector<uint8_t>(fp.decoded.begin(), fp.decoded.end())),
        });

    const auto entries = obj["c"].toArray();
    for (const auto& entry : entries) {
        const auto path = decode_path(entry.toString());
        if (!path) {
            qCWarning(qrlinkCodecLog) << "skipping undecodable path entry" << entry.toString();
            continue;
        }
        const int index = static_cast<int>(out.paths.size());
        out.candidates.push_back(RemoteCandidate{.candidate = candidate_line(*path, index)});
        out.paths.push_back(*path);
    }

    return Result<DecodedNegotiation, Error>::ok(std::move(out));
}

} // namespace qrlink::network
