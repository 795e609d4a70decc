/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QUrl>
#include <atomic>
#include <csignal>
#include <memory>
#include <vector>

#include "config.h"
#include "credentialresolver.h"
#include "discovery.h"
#include "downloader.h"
#include "errors.h"
#include "handoff.h"
#include "logger.hpp"
#include "qtlogger.hpp"
#include "scanner.h"
#include "scantransfer.h"
#include "scheduler.h"
#include "settings.h"
#include "taskexecutor.h"

static volatile std::sig_atomic_t stopRequested = 0;

static void signalHandler(int) { stopRequested = 1; }

struct CmdOptions {
    bool valid = true;
    bool verbose = false;
    bool once = false;
    bool keepRemote = false;
    bool noRename = false;
    int interval = 0;
    QString logFile;
    QString outputDir;
    QString credentials;
    QString handoff;
    std::vector<QUrl> urls;
};

struct CycleConfig {
    int httpTimeout = 0;
    ScanTransfer::Options transfer;
    QString handoffCommand;
    std::vector<QUrl> urls;
};

static CmdOptions checkOptions(const QCoreApplication& app) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Downloads scans from Doxie scanners found on the local network."));

    QCommandLineOption verboseOpt{QStringLiteral("verbose"),
                                  QStringLiteral("Enables debug output.")};
    parser.addOption(verboseOpt);

    QCommandLineOption logFileOpt{
        QStringLiteral("log-file"),
        QStringLiteral("Write logs to <log-file> instead of stderr."),
        QStringLiteral("log-file")};
    parser.addOption(logFileOpt);

    QCommandLineOption onceOpt{
        QStringLiteral("once"),
        QStringLiteral("Run a single cycle and exit. Exit code is 1 when any "
                       "device failed.")};
    parser.addOption(onceOpt);

    QCommandLineOption intervalOpt{
        QStringLiteral("interval"),
        QStringLiteral("Seconds between cycles."), QStringLiteral("seconds")};
    parser.addOption(intervalOpt);

    QCommandLineOption outputDirOpt{
        QStringLiteral("output-dir"),
        QStringLiteral("Directory where scans are saved."),
        QStringLiteral("dir")};
    parser.addOption(outputDirOpt);

    QCommandLineOption credentialsOpt{
        QStringLiteral("credentials"),
        QStringLiteral("INI file with device passwords."),
        QStringLiteral("file")};
    parser.addOption(credentialsOpt);

    QCommandLineOption handoffOpt{
        QStringLiteral("handoff"),
        QStringLiteral("Program run as '<program> <file> <label>' for every "
                       "saved scan. The file is removed when it exits with "
                       "0."),
        QStringLiteral("program")};
    parser.addOption(handoffOpt);

    QCommandLineOption keepRemoteOpt{
        QStringLiteral("keep-remote"),
        QStringLiteral("Do not delete scans on the device.")};
    parser.addOption(keepRemoteOpt);

    QCommandLineOption noRenameOpt{
        QStringLiteral("no-rename"),
        QStringLiteral("Keep device file names, without device name prefix.")};
    parser.addOption(noRenameOpt);

    QCommandLineOption urlOpt{
        QStringLiteral("url"),
        QStringLiteral("Use the device at <url> instead of discovery. Can be "
                       "repeated."),
        QStringLiteral("url")};
    parser.addOption(urlOpt);

    parser.addHelpOption();
    parser.addVersionOption();

    parser.process(app);

    CmdOptions options;
    options.verbose = parser.isSet(verboseOpt);
    options.once = parser.isSet(onceOpt);
    options.keepRemote = parser.isSet(keepRemoteOpt);
    options.noRename = parser.isSet(noRenameOpt);
    options.logFile = parser.value(logFileOpt);
    options.outputDir = parser.value(outputDirOpt);
    options.credentials = parser.value(credentialsOpt);
    options.handoff = parser.value(handoffOpt);

    if (parser.isSet(intervalOpt)) {
        bool ok = false;
        options.interval = parser.value(intervalOpt).toInt(&ok);
        if (!ok || options.interval <= 0) {
            qWarning() << "invalid interval:" << parser.value(intervalOpt);
            options.valid = false;
        }
    }

    for (const auto& value : parser.values(urlOpt)) {
        auto url = Discovery::baseUrl(value);
        if (!url) {
            qWarning() << "invalid device url:" << value;
            options.valid = false;
            continue;
        }
        options.urls.push_back(std::move(*url));
    }

    return options;
}

static bool processDevice(const QUrl& url, const CycleConfig& config,
                          const CredentialResolver& credentials) {
    try {
        auto transport = std::make_shared<Downloader>(config.httpTimeout);
        Scanner scanner{url, transport, credentials};

        LOGI("device: " << scanner.description());

        ScanTransfer::Handoff handoff;
        if (!config.handoffCommand.isEmpty())
            handoff = CommandHandoff{config.handoffCommand};

        ScanTransfer transfer{config.transfer, std::move(handoff)};
        auto report = transfer.run(scanner);

        if (report.transferred.empty() && report.skipped.isEmpty()) {
            LOGI("no new scans: " << scanner.identity().name);
        } else {
            LOGI("cycle done: " << scanner.identity().name
                                << ", saved=" << report.transferred.size()
                                << ", handed off=" << report.handedOff
                                << ", unavailable=" << report.skipped.size());
        }

        return true;
    } catch (const CredentialNotFound& err) {
        LOGE("password required but not provisioned: " << err.what());
    } catch (const DeviceAuthError& err) {
        LOGE("device rejected password: " << err.what());
    } catch (const DeviceUnreachable& err) {
        LOGW("device unreachable: " << err.what());
    } catch (const DeviceProtocolError& err) {
        LOGE("unexpected device response: " << err.what());
    } catch (const std::exception& err) {
        LOGE("cycle failed for " << url << ": " << err.what());
    }

    return false;
}

static bool runCycle(const CycleConfig& config, const Discovery& discovery,
                     const CredentialResolver& credentials) {
    auto urls =
        config.urls.empty() ? discovery.discover(Scanner::serviceType)
                            : config.urls;

    if (urls.empty()) {
        LOGI("no devices found");
        return true;
    }

    std::atomic_bool ok{true};

    // devices share nothing but the read-only credential resolver
    TaskExecutor executor{nullptr, static_cast<int>(urls.size())};
    for (const auto& url : urls) {
        executor.startTask([&config, &credentials, &ok, url] {
            if (!processDevice(url, config, credentials)) ok = false;
        });
    }
    executor.waitForDone();

    return ok;
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral(APP_ID));
    QCoreApplication::setOrganizationName(QStringLiteral(APP_ORG));
    QCoreApplication::setOrganizationDomain(QStringLiteral(APP_DOMAIN));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    auto cmdOpts = checkOptions(app);

    if (!cmdOpts.valid) return 1;

#ifdef USE_TRACE_LOGS
    const auto verboseLevel = DoxiegrabLogger::LogType::Trace;
#else
    const auto verboseLevel = DoxiegrabLogger::LogType::Debug;
#endif
    DoxiegrabLogger::init(
        cmdOpts.verbose ? verboseLevel : DoxiegrabLogger::LogType::Info,
        cmdOpts.logFile.toStdString());
    initQtLogger();

    LOGD("version: " << APP_VERSION);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    auto* settings = Settings::instance();

    CycleConfig config;
    config.httpTimeout = settings->httpTimeout();
    config.transfer.destinationDir = cmdOpts.outputDir.isEmpty()
                                         ? settings->outputDir()
                                         : cmdOpts.outputDir;
    config.transfer.rename = !cmdOpts.noRename && settings->renameScans();
    config.transfer.deleteRemote =
        !cmdOpts.keepRemote && settings->deleteRemote();
    config.handoffCommand = cmdOpts.handoff.isEmpty()
                                ? settings->handoffCommand()
                                : cmdOpts.handoff;
    config.urls = cmdOpts.urls;

    if (!QDir::root().mkpath(config.transfer.destinationDir)) {
        LOGE("cannot create output dir: " << config.transfer.destinationDir);
        return 1;
    }

    LOGI("saving scans to: " << config.transfer.destinationDir);

    IniCredentialResolver credentials{cmdOpts.credentials.isEmpty()
                                          ? settings->credentialsPath()
                                          : cmdOpts.credentials};

    Discovery discovery{settings->discoveryWindow(),
                        Discovery::upnpSource(settings->networkInterface())};

    Scheduler scheduler{
        cmdOpts.interval > 0 ? cmdOpts.interval : settings->interval(),
        settings->maxBackoff()};

    int exitCode = 0;

    while (!stopRequested) {
        auto ok = runCycle(config, discovery, credentials);

        if (cmdOpts.once) {
            exitCode = ok ? 0 : 1;
            break;
        }

        auto delay = scheduler.nextDelay(ok);
        LOGD("next cycle in " << delay << "s");

        for (int i = 0; i < delay && !stopRequested; ++i) QThread::sleep(1);
    }

    LOGD("exiting");

    if (config.urls.empty()) Discovery::terminate();

    return exitCode;
}
