/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>

#include "singleton.h"

class Settings : public QSettings, public Singleton<Settings> {
   public:
    Settings();

    QString outputDir() const;
    int discoveryWindow() const;
    int httpTimeout() const;
    int interval() const;
    int maxBackoff() const;
    QString credentialsPath() const;
    QString handoffCommand() const;
    bool renameScans() const;
    bool deleteRemote() const;
    QString networkInterface() const;

   private:
    inline static const QString settingsFilename =
        QStringLiteral("doxiegrab.conf");

    static QString settingsFilepath();
};

#endif  // SETTINGS_H
