#pragma once

#include <QString>

#include "core/result.hpp"

namespace qrlink::ui {

struct EncodeOptions {
    QString type;            // "offer" or "answer"
    QString sdpPath;
    QString candidatesPath;  // Optional, one candidate per line
};

// Reads an SDP document (and optional candidate list) from disk and prints its token.
[[nodiscard]] Result<QString> encode_token(const EncodeOptions& options);

// Expands a token into SDP text with the surviving candidates appended as
// "a=candidate:" lines.
[[nodiscard]] Result<QString> decode_token(const QString& token);

} // namespace qrlink::ui
