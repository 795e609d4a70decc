/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

#include "credentialresolver.h"
#include "discovery.h"

QString Settings::settingsFilepath() {
    QDir confDir{
        QStandardPaths::writableLocation(QStandardPaths::ConfigLocation)};
    confDir.mkpath(QCoreApplication::applicationName());
    return confDir.absolutePath() + QDir::separator() +
           QCoreApplication::applicationName() + QDir::separator() +
           settingsFilename;
}

Settings::Settings() : QSettings{settingsFilepath(), QSettings::IniFormat} {
    qDebug() << "settings file:" << fileName();
}

QString Settings::outputDir() const {
    return value(QStringLiteral("output_dir"), QDir::currentPath()).toString();
}

int Settings::discoveryWindow() const {
    return value(QStringLiteral("discovery_window"), Discovery::defaultWindow)
        .toInt();
}

int Settings::httpTimeout() const {
    return value(QStringLiteral("http_timeout"), 10000).toInt();
}

int Settings::interval() const {
    return value(QStringLiteral("interval"), 30).toInt();
}

int Settings::maxBackoff() const {
    return value(QStringLiteral("max_backoff"), 600).toInt();
}

QString Settings::credentialsPath() const {
    return value(QStringLiteral("credentials"),
                 IniCredentialResolver::defaultPath())
        .toString();
}

QString Settings::handoffCommand() const {
    return value(QStringLiteral("handoff_command")).toString();
}

bool Settings::renameScans() const {
    return value(QStringLiteral("rename_scans"), true).toBool();
}

bool Settings::deleteRemote() const {
    return value(QStringLiteral("delete_remote"), true).toBool();
}

QString Settings::networkInterface() const {
    return value(QStringLiteral("network_interface")).toString();
}

