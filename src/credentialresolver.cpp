/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "credentialresolver.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QVariant>

#include "errors.h"
#include "logger.hpp"

const char *const IniCredentialResolver::envPathVar =
    "DOXIEGRABBER_CONFIG_PATH";

static QString expandHome(const QString &path) {
    if (path == QLatin1String("~")) return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

QString IniCredentialResolver::defaultPath() {
    auto path = qEnvironmentVariable(envPathVar);
    if (path.isEmpty()) path = QStringLiteral("~/.doxiegrabber.ini");
    return expandHome(path);
}

IniCredentialResolver::IniCredentialResolver(QString path)
    : m_path{expandHome(path)} {
    if (!QFileInfo::exists(m_path)) {
        LOGW("credentials file does not exist: " << m_path);
    }
}

QString IniCredentialResolver::resolve(const QString &deviceId) const {
    // QSettings is not thread-safe, every lookup gets its own reader
    QSettings store{m_path, QSettings::IniFormat};

    if (store.status() != QSettings::NoError) {
        LOGW("cannot read credentials file: " << m_path);
        throw CredentialNotFound{deviceId, m_path};
    }

    auto value = store.value(deviceId + QStringLiteral("/password"));

    // unquoted values with commas are read back as lists
    auto password = value.type() == QVariant::StringList
                        ? value.toStringList().join(QLatin1Char(','))
                        : value.toString();

    if (password.isEmpty()) {
        LOGE("no password for " << deviceId << " in " << m_path);
        throw CredentialNotFound{deviceId, m_path};
    }

    LOGD("password found for " << deviceId);

    return password;
}
