#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QCryptographicHash>
#include <QRandomGenerator>
#include <QString>
#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#ifdef QRLINK_HAS_SODIUM
#include <sodium.h>
#endif

namespace qrlink::crypto {

// DTLS fingerprints carried in the token are always SHA-256.
constexpr size_t FINGERPRINT_SIZE = 32;

// ICE credential lengths (RFC 8839 minimums are 4 and 22 characters).
constexpr int ICE_UFRAG_LENGTH = 4;
constexpr int ICE_PWD_LENGTH = 24;

using Fingerprint = std::array<uint8_t, FINGERPRINT_SIZE>;

/**
 * Initialize the crypto library.
 */
[[nodiscard]] inline Result<void, Error> init() {
#ifdef QRLINK_HAS_SODIUM
    if (sodium_init() < 0) {
        return Result<void, Error>::err(
            Error{"Failed to initialize libsodium", ErrorCode::EngineInitError});
    }
#endif
    return Result<void, Error>::ok();
}

/**
 * Generate random bytes.
 */
[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
#ifdef QRLINK_HAS_SODIUM
    randombytes_buf(bytes.data(), count);
#else
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(QRandomGenerator::system()->bounded(256));
    }
#endif
    return bytes;
}

/**
 * Generate an ICE credential string (ice-char = ALPHA / DIGIT / "+" / "/").
 */
[[nodiscard]] inline QString generate_ice_credential(int length) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    const auto bytes = random_bytes(static_cast<size_t>(length));
    QString out;
    out.reserve(length);
    for (uint8_t b : bytes) {
        out.append(QLatin1Char(chars[b & 0x3F]));
    }
    return out;
}

/**
 * SHA-256 digest, used as the DTLS certificate fingerprint.
 */
[[nodiscard]] inline Fingerprint sha256(const std::vector<uint8_t>& data) {
    Fingerprint out{};
#ifdef QRLINK_HAS_SODIUM
    crypto_hash_sha256(out.data(), data.data(), data.size());
#else
    const auto digest = QCryptographicHash::hash(
        QByteArray::fromRawData(reinterpret_cast<const char*>(data.data()),
                                static_cast<qsizetype>(data.size())),
        QCryptographicHash::Sha256);
    std::copy(digest.begin(), digest.end(), out.begin());
#endif
    return out;
}

} // namespace qrlink::crypto
