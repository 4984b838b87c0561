#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>

#include "crypto/identity.hpp"
#include "network/connection_config.hpp"
#include "ui/cli/demo.hpp"
#include "ui/cli/token_commands.hpp"
#include "ui/logging.hpp"

namespace {

int print_result(const qrlink::Result<QString>& result) {
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        QTextStream(stderr) << qrlink::to_string(error.code) << ": "
                            << QString::fromStdString(error.message) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << result.unwrap() << QLatin1Char('\n');
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("qrlink");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("qrlink");
    app.setOrganizationDomain("qrlink.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("QR-code signaled peer-to-peer data channel"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption typeOption(
        QStringList{QStringLiteral("type")},
        QStringLiteral("Role of the SDP for 'encode': offer or answer."),
        QStringLiteral("role"),
        QStringLiteral("offer"));
    parser.addOption(typeOption);

    const QCommandLineOption sdpOption(
        QStringList{QStringLiteral("sdp")},
        QStringLiteral("SDP file for 'encode'."),
        QStringLiteral("path"));
    parser.addOption(sdpOption);

    const QCommandLineOption candidatesOption(
        QStringList{QStringLiteral("candidates")},
        QStringLiteral("File with one ICE candidate per line for 'encode'."),
        QStringLiteral("path"));
    parser.addOption(candidatesOption);

    const QCommandLineOption messageOption(
        QStringList{QStringLiteral("message")},
        QStringLiteral("Text the 'demo' host sends once connected."),
        QStringLiteral("text"));
    parser.addOption(messageOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("timeout")},
        QStringLiteral("Overall 'demo' timeout in milliseconds."),
        QStringLiteral("ms"),
        QStringLiteral("10000"));
    parser.addOption(timeoutOption);

    const QCommandLineOption gatherTimeoutOption(
        QStringList{QStringLiteral("gather-timeout")},
        QStringLiteral("Candidate gathering timeout (sets QRLINK_GATHER_TIMEOUT_MS for this run)."),
        QStringLiteral("ms"));
    parser.addOption(gatherTimeoutOption);

    const QCommandLineOption debugSignalingOption(
        QStringList{QStringLiteral("debug-signaling")},
        QStringLiteral("Enable signaling debug logging (also sets QRLINK_DEBUG_SIGNALING=1)."));
    parser.addOption(debugSignalingOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: encode, decode <token> or demo."));
    parser.process(app);

    if (parser.isSet(gatherTimeoutOption)) {
        qputenv("QRLINK_GATHER_TIMEOUT_MS", parser.value(gatherTimeoutOption).toUtf8());
    }

    const bool debugSignaling = parser.isSet(debugSignalingOption)
        || qEnvironmentVariableIsSet("QRLINK_DEBUG_SIGNALING");
    if (debugSignaling) {
        qputenv("QRLINK_DEBUG_SIGNALING", "1");
        qrlink::ui::enable_signaling_debug();
    }

    auto crypto_result = qrlink::crypto::init();
    if (crypto_result.is_err()) {
        qCritical() << "Failed to initialize crypto:"
                    << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QString() : positional.first();

    if (command == QStringLiteral("encode")) {
        if (!parser.isSet(sdpOption)) {
            QTextStream(stderr) << "encode requires --sdp <path>\n";
            return 1;
        }
        qrlink::ui::EncodeOptions options;
        options.type = parser.value(typeOption);
        options.sdpPath = parser.value(sdpOption);
        options.candidatesPath = parser.value(candidatesOption);
        return print_result(qrlink::ui::encode_token(options));
    }

    if (command == QStringLiteral("decode")) {
        if (positional.size() < 2) {
            QTextStream(stderr) << "decode requires a token argument\n";
            return 1;
        }
        return print_result(qrlink::ui::decode_token(positional.at(1)));
    }

    if (command == QStringLiteral("demo")) {
        auto logOptions = qrlink::ui::LogOptions::fromEnvironment();
        logOptions.signaling_debug = debugSignaling;
        const auto logPath = qrlink::ui::install_logging(logOptions);
        if (!logPath.isEmpty()) {
            QTextStream(stdout) << "logging to " << logPath << QLatin1Char('\n');
        }
        if (debugSignaling) {
            qInfo() << "signaling debug enabled";
        }

        bool ok = false;
        qrlink::ui::DemoOptions options;
        options.config = qrlink::network::ControllerConfig::fromEnvironment();
        options.timeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok || options.timeoutMs <= 0) {
            QTextStream(stderr) << "--timeout must be a positive integer\n";
            return 1;
        }
        if (parser.isSet(messageOption)) {
            options.message = parser.value(messageOption);
        }

        QTextStream out(stdout);
        return qrlink::ui::run_loopback_demo(options, out);
    }

    parser.showHelp(1);
}
