#pragma once

#include <QString>
#include <QTextStream>

#include "network/connection_config.hpp"

namespace qrlink::ui {

struct DemoOptions {
    network::ControllerConfig config;
    int timeoutMs = 10000;
    QString message = QStringLiteral("hello over qrlink");
};

// Runs an offerer and an answerer over the in-process loopback engine,
// passing tokens between them the way two QR scans would. Returns 0 when
// both sides connected and the message made it across, 2 on timeout,
// 1 on error. Requires a running QCoreApplication.
int run_loopback_demo(const DemoOptions& options, QTextStream& out);

} // namespace qrlink::ui
