#include "ui/cli/token_commands.hpp"

#include <QFile>
#include <QStringList>
#include <vector>

#include "network/negotiation_codec.hpp"

namespace qrlink::ui {

namespace {

[[nodiscard]] Result<QString> read_text(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return Result<QString>::err(Error{("Cannot read " + path + ": " + file.errorString()).toStdString()});
    }
    return Result<QString>::ok(QString::fromUtf8(file.readAll()));
}

[[nodiscard]] Result<network::SessionRole> parse_role(const QString& type) {
    if (type == QStringLiteral("offer")) {
        return Result<network::SessionRole>::ok(network::SessionRole::Offer);
    }
    if (type == QStringLiteral("answer")) {
        return Result<network::SessionRole>::ok(network::SessionRole::Answer);
    }
    return Result<network::SessionRole>::err(Error{"--type must be 'offer' or 'answer'"});
}

[[nodiscard]] std::vector<QString> split_candidates(const QString& text) {
    std::vector<QString> out;
    for (auto line : text.split(QLatin1Char('\n'), Qt::SkipEmptyParts)) {
        line = line.trimmed();
        if (line.startsWith(QStringLiteral("a="))) {
            line = line.mid(2);
        }
        if (line.startsWith(QStringLiteral("candidate:"))) {
            out.push_back(line);
        }
    }
    return out;
}

} // namespace

Result<QString> encode_token(const EncodeOptions& options) {
    auto role = parse_role(options.type);
    if (role.is_err()) {
        return Result<QString>::err(role.unwrap_err());
    }

    auto sdp = read_text(options.sdpPath);
    if (sdp.is_err()) {
        return sdp;
    }

    // Candidates embedded in the SDP count too, ahead of the separate list.
    auto candidates = split_candidates(sdp.unwrap());
    if (!options.candidatesPath.isEmpty()) {
        auto extra = read_text(options.candidatesPath);
        if (extra.is_err()) {
            return extra;
        }
        for (auto& line : split_candidates(extra.unwrap())) {
            candidates.push_back(std::move(line));
        }
    }

    const network::SessionDescription description{.role = role.unwrap(), .sdp = sdp.unwrap()};
    return network::compress(description, candidates);
}

Result<QString> decode_token(const QString& token) {
    return network::decompress(token).map([](network::DecodedNegotiation decoded) -> QString {
        QString out = decoded.description.sdp;
        for (const auto& candidate : decoded.candidates) {
            out += QStringLiteral("a=") + candidate.candidate + QStringLiteral("\r\n");
        }
        return out;
    });
}

} // namespace qrlink::ui
