/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "discovery.h"

#include <QDebug>
#include <algorithm>
#include <string>
#include <utility>

#include "libupnpp/control/description.hxx"
#include "libupnpp/control/discovery.hxx"
#include "libupnpp/upnpplib.hxx"
#include "logger.hpp"

Discovery::Discovery(int window, LocationSource source)
    : m_window{window}, m_source{std::move(source)} {}

std::optional<QUrl> Discovery::baseUrl(const QString &location) {
    QUrl url{location.trimmed(), QUrl::StrictMode};

    if (!url.isValid() || url.host().isEmpty()) return std::nullopt;

    const auto scheme = url.scheme().toLower();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https"))
        return std::nullopt;

    QUrl base;
    base.setScheme(scheme);
    base.setHost(url.host());
    if (url.port() != -1) base.setPort(url.port());
    base.setPath(QStringLiteral("/"));

    return base;
}

std::vector<QUrl> Discovery::discover(const QString &serviceType) const {
    LOGD("discovering " << serviceType << " for " << m_window << "s");

    std::vector<QUrl> urls;

    for (const auto &location : m_source(serviceType, m_window)) {
        auto url = baseUrl(location);
        if (!url) {
            LOGW("ignoring invalid location: " << location);
            continue;
        }

        if (std::find(urls.cbegin(), urls.cend(), *url) != urls.cend()) continue;

        LOGD("device found: " << *url);
        urls.push_back(std::move(*url));
    }

    LOGI("discovery end: " << urls.size() << " device(s)");

    return urls;
}

Discovery::LocationSource Discovery::upnpSource(const QString &ifname) {
    return [ifname](const QString &serviceType, int windowSecs) {
        std::vector<QString> locations;

        qDebug() << "LibUPnP init:" << (ifname.isEmpty() ? "*" : ifname);

        auto *lib = UPnPP::LibUPnP::getLibUPnP(
            false, nullptr,
            ifname.isEmpty() ? std::string{"*"} : ifname.toStdString());

        if (!lib || !lib->ok()) {
            qWarning() << "Cannot initialize UPnPP lib:"
                       << QString::fromStdString(UPnPP::LibUPnP::errAsString(
                              "init", UPnPP::LibUPnP::getInitError()));
            return locations;
        }

        UPnPP::LibUPnP::setLogLevel(UPnPP::LibUPnP::LogLevelError);

        // search window is fixed when the directory is created
        auto *directory =
            UPnPClient::UPnPDeviceDirectory::getTheDir(windowSecs);

        if (!directory || !directory->ok()) {
            qWarning() << "Cannot initialize UPnPP directory:"
                       << (directory ? QString::fromStdString(
                                           directory->getReason())
                                     : QStringLiteral("null"));
            return locations;
        }

        const auto type = serviceType.toStdString();

        directory->traverse([&](const UPnPClient::UPnPDeviceDesc &ddesc,
                                const UPnPClient::UPnPServiceDesc &) {
            if (ddesc.deviceType == type) {
#ifdef QT_DEBUG
                qDebug() << "UDN:" << QString::fromStdString(ddesc.UDN)
                         << "friendly name:"
                         << QString::fromStdString(ddesc.friendlyName);
#endif
                locations.push_back(QString::fromStdString(ddesc.URLBase));
            }
            return true;
        });

        return locations;
    };
}

void Discovery::terminate() { UPnPClient::UPnPDeviceDirectory::terminate(); }
