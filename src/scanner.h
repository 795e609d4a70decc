/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SCANNER_H
#define SCANNER_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>

#include "transport.h"

class CredentialResolver;
class QJsonDocument;

/*
 * Client for one Doxie scanner.
 *
 * The identity (hello.json) is loaded by the constructor and never fetched
 * again. Firmware detail comes from hello_extra.json, which the device is
 * slow to answer, so it is cached for the lifetime of the object. Scan
 * listings are never cached.
 *
 * Not thread-safe: one object serves one thread, several objects talking to
 * different devices may run in parallel.
 */
class Scanner {
   public:
    enum class Mode { Host, Client };
    friend std::ostream &operator<<(std::ostream &os, Mode mode);

    struct Identity {
        QString model;
        QString name;
        QString mac;
        Mode mode = Mode::Host;
        QString firmwareWifi;
        // only reported in client mode
        std::optional<QString> network;
        bool hasPassword = false;
    };

    struct Scan {
        // remote path, e.g. /DOXIE/JPEG/IMG_0001.JPG
        QString name;
        std::optional<qint64> size;
        QString modified;
        QString baseName() const;
    };

    static const QString serviceType;
    static const QString userName;

    Scanner(QUrl baseUrl, std::shared_ptr<Transport> transport,
            const CredentialResolver &credentials);

    inline const auto &identity() const { return m_identity; }
    inline const auto &baseUrl() const { return m_baseUrl; }
    inline bool authenticated() const { return m_password.has_value(); }
    QString description() const;

    QString firmwareDetail();
    bool isOnExternalPower();
    std::vector<Scan> listScans();
    // Saves the scan as destinationDir/fileName, the remote base name when
    // fileName is empty. Returns the path of the saved file.
    QString downloadScan(const Scan &scan, const QString &destinationDir,
                         const QString &fileName = {});
    void deleteScans(const QStringList &names);
    void restartNetwork();

    static Identity parseIdentity(const QByteArray &data);
    static std::vector<Scan> parseScans(const QByteArray &data);
    static QByteArray basicAuthorization(const QString &user,
                                         const QString &password);

   private:
    QUrl m_baseUrl;
    std::shared_ptr<Transport> m_transport;
    Identity m_identity;
    std::optional<QString> m_password;
    std::optional<QString> m_firmware;

    QUrl apiUrl(const QString &path) const;
    Transport::Request makeRequest(const QUrl &url) const;
    QByteArray call(const QString &path);
    QJsonDocument callJson(const QString &path);
    static void checkStatus(int status, const QUrl &url);
};

#endif  // SCANNER_H
