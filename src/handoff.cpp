/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "handoff.h"

#include <QProcess>

#include "logger.hpp"

CommandHandoff::CommandHandoff(const QString &command, int timeout)
    : m_timeout{timeout} {
    m_args = QProcess::splitCommand(command);
    if (!m_args.isEmpty()) m_program = m_args.takeFirst();
}

bool CommandHandoff::operator()(const ScanTransfer::Item &item) const {
    if (!valid()) return false;

    auto label = ScanTransfer::label(item);

    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    auto args = m_args;
    args << item.localPath << label;
    process.start(m_program, args);

    if (!process.waitForStarted()) {
        LOGE("cannot start handoff command " << m_program << ": "
                                             << process.errorString());
        return false;
    }

    if (!process.waitForFinished(m_timeout)) {
        LOGE("handoff command timed out: " << m_program);
        process.kill();
        process.waitForFinished();
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit ||
        process.exitCode() != 0) {
        LOGW("handoff command failed (exit code " << process.exitCode()
                                                  << "), keeping "
                                                  << item.localPath);
        return false;
    }

    LOGI("handed off: " << label);

    return true;
}
