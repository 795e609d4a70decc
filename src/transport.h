/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <QByteArray>
#include <QString>
#include <QUrl>

class QIODevice;

/*
 * Blocking HTTP exchange with one device.
 *
 * Both calls throw DeviceUnreachable when the exchange fails below HTTP
 * (connection refused, timeout, reply cut short). Any HTTP status, including
 * error statuses, is returned to the caller for interpretation.
 */
class Transport {
   public:
    struct Request {
        QUrl url;
        QByteArray verb = QByteArrayLiteral("GET");
        // Value of the Authorization header, empty when not authenticating
        QByteArray authorization;
        QByteArray body;
        QString mime;
    };

    struct Reply {
        int status = 0;
        QByteArray body;
    };

    virtual ~Transport() = default;

    virtual Reply send(const Request &request) = 0;

    // Streams the body of a 2xx reply into output as it arrives. The body of
    // any other reply is discarded. Returns the HTTP status.
    virtual int receive(const Request &request, QIODevice &output) = 0;

    static inline bool success(int status) {
        return status >= 200 && status < 300;
    }
};

#endif  // TRANSPORT_H
