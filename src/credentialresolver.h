/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CREDENTIALRESOLVER_H
#define CREDENTIALRESOLVER_H

#include <QString>

class CredentialResolver {
   public:
    virtual ~CredentialResolver() = default;

    // Returns the password for the device with the given hardware address.
    // Throws CredentialNotFound when there is none. Safe to call from many
    // threads at once.
    virtual QString resolve(const QString &deviceId) const = 0;
};

/*
 * Reads passwords from an INI file with one section per hardware address:
 *
 *   [00:11:E5:06:2B:08]
 *   password = secret
 *
 * Values are parsed as QSettings INI: an unquoted ';' starts a comment and
 * '\' starts an escape. Passwords with such characters must be written in
 * double quotes, with '"' and '\' escaped by a backslash:
 *
 *   password = "se;cr\"et"
 */
class IniCredentialResolver final : public CredentialResolver {
   public:
    static const char *const envPathVar;

    explicit IniCredentialResolver(QString path = defaultPath());
    QString resolve(const QString &deviceId) const final;
    inline const auto &path() const { return m_path; }

    // DOXIEGRABBER_CONFIG_PATH if set, ~/.doxiegrabber.ini otherwise
    static QString defaultPath();

   private:
    QString m_path;
};

#endif  // CREDENTIALRESOLVER_H
