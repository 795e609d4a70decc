/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scanner.h"

#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <utility>

#include "credentialresolver.h"
#include "errors.h"
#include "logger.hpp"

const QString Scanner::serviceType =
    QStringLiteral("urn:schemas-getdoxie-com:device:Scanner:1");
// fixed by the device firmware
const QString Scanner::userName = QStringLiteral("doxie");

std::ostream &operator<<(std::ostream &os, Scanner::Mode mode) {
    switch (mode) {
        case Scanner::Mode::Host:
            os << "host";
            break;
        case Scanner::Mode::Client:
            os << "client";
            break;
    }
    return os;
}

static QJsonDocument parseJson(const QByteArray &data, const char *what) {
    QJsonParseError err;
    auto json = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        LOGW("error parsing " << what << ": " << err.errorString());
        throw DeviceProtocolError{QStringLiteral("invalid json in %1: %2")
                                      .arg(QLatin1String(what),
                                           err.errorString())};
    }
    return json;
}

static QJsonObject jsonObject(const QJsonDocument &json, const char *what) {
    if (!json.isObject())
        throw DeviceProtocolError{
            QStringLiteral("%1 is not an object").arg(QLatin1String(what))};
    return json.object();
}

static QJsonValue requiredField(const QJsonObject &obj, const char *key,
                                const char *what) {
    auto value = obj.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull())
        throw DeviceProtocolError{QStringLiteral("missing %1 in %2")
                                      .arg(QLatin1String(key),
                                           QLatin1String(what))};
    return value;
}

static QString requiredString(const QJsonObject &obj, const char *key,
                              const char *what) {
    auto value = requiredField(obj, key, what);
    if (!value.isString())
        throw DeviceProtocolError{QStringLiteral("%1 in %2 is not a string")
                                      .arg(QLatin1String(key),
                                           QLatin1String(what))};
    return value.toString();
}

static bool requiredBool(const QJsonObject &obj, const char *key,
                         const char *what) {
    auto value = requiredField(obj, key, what);
    if (!value.isBool())
        throw DeviceProtocolError{QStringLiteral("%1 in %2 is not a bool")
                                      .arg(QLatin1String(key),
                                           QLatin1String(what))};
    return value.toBool();
}

QString Scanner::Scan::baseName() const { return name.section('/', -1); }

Scanner::Identity Scanner::parseIdentity(const QByteArray &data) {
    auto obj = jsonObject(parseJson(data, "hello"), "hello");

    Identity identity;
    identity.model = requiredString(obj, "model", "hello");
    identity.name = requiredString(obj, "name", "hello");
    identity.mac = requiredString(obj, "MAC", "hello");
    identity.firmwareWifi = requiredString(obj, "firmwareWiFi", "hello");
    identity.hasPassword = requiredBool(obj, "hasPassword", "hello");

    auto mode = requiredString(obj, "mode", "hello");
    if (mode == QLatin1String("Client")) {
        identity.mode = Mode::Client;
        identity.network = requiredString(obj, "network", "hello");
    } else if (mode == QLatin1String("AP") || mode == QLatin1String("Host")) {
        identity.mode = Mode::Host;
    } else {
        throw DeviceProtocolError{
            QStringLiteral("unknown mode in hello: %1").arg(mode)};
    }

    return identity;
}

std::vector<Scanner::Scan> Scanner::parseScans(const QByteArray &data) {
    std::vector<Scan> scans;

    // device answers with an empty body when there is nothing to list
    if (data.trimmed().isEmpty()) return scans;

    auto json = parseJson(data, "scans");
    if (!json.isArray())
        throw DeviceProtocolError{QStringLiteral("scans is not an array")};

    const auto array = json.array();
    scans.reserve(array.size());

    for (const auto &item : array) {
        if (!item.isObject())
            throw DeviceProtocolError{
                QStringLiteral("scan entry is not an object")};
        auto obj = item.toObject();

        Scan scan;
        scan.name = requiredString(obj, "name", "scans");
        if (scan.baseName().isEmpty())
            throw DeviceProtocolError{
                QStringLiteral("invalid scan name: %1").arg(scan.name)};
        if (auto size = obj.value(QLatin1String("size")); size.isDouble())
            scan.size = static_cast<qint64>(size.toDouble());
        scan.modified = obj.value(QLatin1String("modified")).toString();

        scans.push_back(std::move(scan));
    }

    return scans;
}

QByteArray Scanner::basicAuthorization(const QString &user,
                                       const QString &password) {
    return QByteArrayLiteral("Basic ") +
           QStringLiteral("%1:%2").arg(user, password).toUtf8().toBase64();
}

Scanner::Scanner(QUrl baseUrl, std::shared_ptr<Transport> transport,
                 const CredentialResolver &credentials)
    : m_baseUrl{std::move(baseUrl)}, m_transport{std::move(transport)} {
    m_identity = parseIdentity(call(QStringLiteral("hello.json")));

    LOGD("identity: model=" << m_identity.model << ", name="
                            << m_identity.name << ", mac=" << m_identity.mac
                            << ", mode=" << m_identity.mode
                            << ", wifi firmware=" << m_identity.firmwareWifi);

    if (m_identity.hasPassword) {
        m_password = credentials.resolve(m_identity.mac);
    }
}

QString Scanner::description() const {
    return QStringLiteral("Doxie model %1 (%2) at %3")
        .arg(m_identity.model, m_identity.name, m_baseUrl.toString());
}

QUrl Scanner::apiUrl(const QString &path) const {
    auto url = m_baseUrl;
    url.setPath(path.startsWith('/') ? path : '/' + path);
    return url;
}

Transport::Request Scanner::makeRequest(const QUrl &url) const {
    Transport::Request request;
    request.url = url;
    if (m_password)
        request.authorization = basicAuthorization(userName, *m_password);
    return request;
}

void Scanner::checkStatus(int status, const QUrl &url) {
    if (status == 401 || status == 403) {
        LOGE("device rejected credentials: " << url);
        throw DeviceAuthError{
            QStringLiteral("%1: authentication failed (status %2)")
                .arg(url.toString())
                .arg(status)};
    }

    if (!Transport::success(status)) {
        LOGW("unexpected status " << status << ": " << url);
        throw DeviceProtocolError{QStringLiteral("%1: unexpected status %2")
                                      .arg(url.toString())
                                      .arg(status)};
    }
}

QByteArray Scanner::call(const QString &path) {
    auto request = makeRequest(apiUrl(path));

    LOGT("api call: " << request.url);

    auto reply = m_transport->send(request);
    checkStatus(reply.status, request.url);

    return reply.body;
}

QJsonDocument Scanner::callJson(const QString &path) {
    return parseJson(call(path), "reply");
}

QString Scanner::firmwareDetail() {
    if (!m_firmware) {
        auto obj =
            jsonObject(callJson(QStringLiteral("hello_extra.json")), "hello_extra");
        m_firmware = requiredString(obj, "firmware", "hello_extra");
    }

    return *m_firmware;
}

bool Scanner::isOnExternalPower() {
    auto obj =
        jsonObject(callJson(QStringLiteral("hello_extra.json")), "hello_extra");

    // same reply carries the firmware, no reason to ask for it again later
    if (obj.value(QLatin1String("firmware")).isString())
        m_firmware = obj.value(QLatin1String("firmware")).toString();

    return requiredBool(obj, "connectedToExternalPower", "hello_extra");
}

std::vector<Scanner::Scan> Scanner::listScans() {
    auto scans = parseScans(call(QStringLiteral("scans.json")));

    LOGD("scans on " << m_identity.name << ": " << scans.size());

    return scans;
}

QString Scanner::downloadScan(const Scan &scan, const QString &destinationDir,
                              const QString &fileName) {
    const auto baseName = fileName.isEmpty() ? scan.baseName() : fileName;
    if (baseName.isEmpty() || baseName.contains('/'))
        throw DeviceProtocolError{
            QStringLiteral("invalid scan name: %1").arg(scan.name)};

    QDir dir{destinationDir};
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOGF("cannot create output dir: " << destinationDir);
    }

    const auto outputPath = dir.absoluteFilePath(baseName);

    // output replaces the existing file only after the whole body arrived
    QSaveFile output{outputPath};
    if (!output.open(QIODevice::WriteOnly)) {
        LOGF("cannot open output file for writing: " << outputPath << ": "
                                                     << output.errorString());
    }

    auto request = makeRequest(apiUrl(
        QStringLiteral("/scans") +
        (scan.name.startsWith('/') ? scan.name : '/' + scan.name)));

    LOGD("downloading: " << request.url << " => " << outputPath);

    auto status = m_transport->receive(request, output);

    if (status == 401 || status == 403) {
        output.cancelWriting();
        checkStatus(status, request.url);
    }

    if (!Transport::success(status)) {
        output.cancelWriting();
        LOGW("scan is unavailable: " << scan.name << " (status " << status
                                     << ")");
        throw ScanUnavailable{scan.name, status};
    }

    if (!output.commit()) {
        LOGF("cannot save downloaded scan: " << outputPath << ": "
                                             << output.errorString());
    }

    return outputPath;
}

void Scanner::deleteScans(const QStringList &names) {
    if (names.isEmpty()) return;

    auto request = makeRequest(apiUrl(QStringLiteral("scans/delete.json")));
    request.verb = QByteArrayLiteral("POST");
    request.mime = QStringLiteral("application/json");
    request.body = QJsonDocument{QJsonArray::fromStringList(names)}.toJson(
        QJsonDocument::Compact);

    LOGD("deleting " << names.size() << " scan(s) on " << m_identity.name);

    auto reply = m_transport->send(request);

    if (reply.status == 404) {
        LOGW("scans already gone: " << names.join(QStringLiteral(", ")));
        return;
    }

    checkStatus(reply.status, request.url);
}

void Scanner::restartNetwork() {
    auto request = makeRequest(apiUrl(QStringLiteral("restart.json")));

    LOGI("restarting network on " << m_identity.name);

    try {
        checkStatus(m_transport->send(request).status, request.url);
    } catch (const DeviceUnreachable &err) {
        // device drops wifi while handling the call
        LOGI("connection closed by restarting device: " << err.what());
    }
}
