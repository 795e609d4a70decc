/* Copyright (C) 2021-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <memory>

#include "transport.h"

/*
 * Qt Network implementation of Transport.
 *
 * Each call runs a local event loop until the reply finishes, so the object
 * must be used from a single thread. The access manager is created in that
 * thread on first use.
 */
class Downloader final : public QObject, public Transport {
   public:
    explicit Downloader(int timeout = httpTimeout, QObject *parent = nullptr);
    ~Downloader() final;

    Reply send(const Request &request) final;
    int receive(const Request &request, QIODevice &output) final;
    void cancel();
    inline auto canceled() const { return mCancelRequested; }
    inline auto timeout() const { return mTimeout; }

   private:
    static constexpr int httpTimeout = 10000;            // 10s
    static constexpr qint64 readBufferSize = 64 * 1024;  // 64 KiB
    int mTimeout;
    bool mCancelRequested = false;
    QNetworkReply *mReply = nullptr;
    std::unique_ptr<QNetworkAccessManager> mNam;

    QNetworkReply *start(const Request &request);
    void finish(const QUrl &url);
    int statusOrThrow(const QUrl &url) const;
};

#endif  // DOWNLOADER_H
