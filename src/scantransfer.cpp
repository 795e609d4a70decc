/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scantransfer.h"

#include <QFile>
#include <utility>

#include "errors.h"
#include "logger.hpp"
#include "scanner.h"

ScanTransfer::ScanTransfer(Options options, Handoff handoff)
    : m_options{std::move(options)}, m_handoff{std::move(handoff)} {}

QString ScanTransfer::label(const Item &item) {
    return QStringLiteral("Scan %1 from %2")
        .arg(item.remoteName.section('/', -1), item.device);
}

QString ScanTransfer::localName(const QString &baseName,
                                const QString &deviceName) const {
    if (!m_options.rename) return baseName;

    auto prefix = deviceName;
    prefix.replace('/', '_');

    return QStringLiteral("%1_%2").arg(prefix, baseName);
}

ScanTransfer::Report ScanTransfer::run(Scanner &scanner) const {
    Report report;

    const auto scans = scanner.listScans();
    if (scans.empty()) {
        LOGD("no scans on " << scanner.identity().name);
        return report;
    }

    const auto device = scanner.description();

    LOGI("transferring " << scans.size() << " scan(s) from " << device);

    for (const auto &scan : scans) {
        // saved under its final name, other devices may write to the same
        // directory at the same time
        QString path;
        try {
            path = scanner.downloadScan(
                scan, m_options.destinationDir,
                localName(scan.baseName(), scanner.identity().name));
        } catch (const ScanUnavailable &err) {
            LOGW("skipping scan: " << err.what());
            report.skipped.push_back(scan.name);
            continue;
        }

        LOGI("saved " << scan.name << " => " << path);

        Item item{path, scan.name, device};

        if (m_handoff && m_handoff(item)) {
            if (!QFile::remove(path)) {
                LOGW("cannot remove handed off file: " << path);
            }
            ++report.handedOff;
        }

        report.transferred.push_back(std::move(item));
    }

    if (m_options.deleteRemote) {
        QStringList names;
        names.reserve(static_cast<int>(scans.size()));
        for (const auto &scan : scans) names.push_back(scan.name);

        scanner.deleteScans(names);
        report.remoteDeleted = true;

        LOGI("deleted " << names.size() << " scan(s) on "
                        << scanner.identity().name);
    }

    return report;
}
