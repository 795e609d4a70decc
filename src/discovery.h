/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <QString>
#include <QUrl>
#include <functional>
#include <optional>
#include <vector>

/*
 * SSDP discovery of devices of one type.
 *
 * Every call is a snapshot: it searches for the configured window, then
 * returns one base address (scheme, host, port, path "/") per responding
 * device. Nobody answering is not an error.
 */
class Discovery {
   public:
    // Location URLs advertised by devices of the given type, duplicates
    // allowed. Must return after at most windowSecs seconds.
    using LocationSource = std::function<std::vector<QString>(
        const QString &serviceType, int windowSecs)>;

    static const int defaultWindow = 3;  // 3s

    explicit Discovery(int window = defaultWindow,
                       LocationSource source = upnpSource());

    std::vector<QUrl> discover(const QString &serviceType) const;
    inline auto window() const { return m_window; }

    static std::optional<QUrl> baseUrl(const QString &location);

    // libupnpp device directory, ifname empty means all interfaces
    static LocationSource upnpSource(const QString &ifname = {});
    static void terminate();

   private:
    int m_window;
    LocationSource m_source;
};

#endif  // DISCOVERY_H
