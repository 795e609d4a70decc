/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "qtlogger.hpp"

#include <QMessageLogContext>
#include <QString>
#include <QtGlobal>

#include "logger.hpp"

static DoxiegrabLogger::LogType logType(QtMsgType qtType) {
    switch (qtType) {
        case QtDebugMsg:
            return DoxiegrabLogger::LogType::Debug;
        case QtInfoMsg:
            return DoxiegrabLogger::LogType::Info;
        case QtWarningMsg:
            return DoxiegrabLogger::LogType::Warning;
        case QtCriticalMsg:
        case QtFatalMsg:
            return DoxiegrabLogger::LogType::Error;
    }
    return DoxiegrabLogger::LogType::Debug;
}

static void qtLog(QtMsgType qtType, const QMessageLogContext &qtContext,
                  const QString &qtMsg) {
    DoxiegrabLogger::Message msg{
        logType(qtType), qtContext.file ? qtContext.file : "",
        qtContext.function ? qtContext.function : "", qtContext.line};
    msg << qtMsg;
}

void initQtLogger() { qInstallMessageHandler(qtLog); }
