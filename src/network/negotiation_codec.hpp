#pragma once

#include "core/result.hpp"
#include "network/session_description.hpp"
#include <QString>
#include <optional>
#include <vector>

namespace qrlink::network {

/**
 * Compact token codec for carrying SDP over a QR code.
 *
 * Only the fields a peer cannot do without survive compression: the role,
 * the ICE credentials, the DTLS fingerprint and at most MAX_TOKEN_PATHS IPv4
 * candidates. Decompression synthesizes the remaining SDP lines with fixed
 * values a data-channel-only engine accepts, so the round trip is lossy but
 * functional.
 *
 * Token format: base64 of the compact JSON record
 *   {"t":"o"|"a","u":"<ufrag>","p":"<pwd>","f":"<b64 fingerprint>","c":["<b64>:<h|s|r>",...]}
 * with the keys in that order. Each path entry packs 4 address bytes and a
 * big-endian port; the fingerprint is the 32-byte SHA-256 digest.
 */

constexpr size_t MAX_TOKEN_PATHS = 5;

/**
 * IceParameters - The three SDP fields compression requires.
 */
struct IceParameters {
    QString ufrag;
    QString pwd;
    QString fingerprint;  // "AB:CD:..." as written after "a=fingerprint:sha-256 "
};

/**
 * DecodedNegotiation - Result of decompress().
 */
struct DecodedNegotiation {
    SessionDescription description;
    std::vector<RemoteCandidate> candidates;
    std::vector<NetworkPath> paths;  // Parallel to candidates
};

/**
 * Read ice-ufrag, ice-pwd and the sha-256 fingerprint from SDP text.
 * Returns nullopt if any of them is missing or empty.
 */
[[nodiscard]] std::optional<IceParameters> extract_ice_parameters(const QString& sdp);

/**
 * Parse "AB:CD:EF..." into bytes.
 */
[[nodiscard]] Result<std::vector<uint8_t>, Error> parse_fingerprint(const QString& text);

/**
 * Format bytes as upper-case, colon separated hex.
 */
[[nodiscard]] QString format_fingerprint(const std::vector<uint8_t>& bytes);

/**
 * Parse an ICE candidate line. Returns nullopt for non-IPv4 candidates.
 */
[[nodiscard]] std::optional<NetworkPath> parse_candidate(const QString& line);

/**
 * Build the candidate line decompression hands to the engine for path #index.
 */
[[nodiscard]] QString candidate_line(const NetworkPath& path, int index);

/**
 * Compress a description and its local candidates into a token.
 * Fails with MalformedNegotiationData if a required field is missing.
 */
[[nodiscard]] Result<QString, Error> compress(const SessionDescription& description,
                                              const std::vector<QString>& candidates);

/**
 * Reverse compress(). Fails with InvalidToken on undecodable input.
 */
[[nodiscard]] Result<DecodedNegotiation, Error> decompress(const QString& token);

} // namespace qrlink::network
