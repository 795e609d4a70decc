/* Copyright (C) 2021-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "downloader.h"

#include <QDebug>
#include <QEventLoop>
#include <QIODevice>
#include <QNetworkRequest>
#include <QThread>
#include <QTimer>

#include "config.h"
#include "errors.h"
#include "logger.hpp"

static const QByteArray userAgent =
    QByteArrayLiteral(APP_BINARY_ID "/" APP_VERSION);

static void setRequestProps(QNetworkRequest &request,
                            const Transport::Request &props) {
#if QT_VERSION >= QT_VERSION_CHECK(5, 9, 0)
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
#else
    request.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
#endif
    request.setRawHeader(QByteArrayLiteral("User-Agent"), userAgent);
    if (!props.authorization.isEmpty())
        request.setRawHeader(QByteArrayLiteral("Authorization"),
                             props.authorization);
    if (!props.body.isEmpty())
        request.setHeader(QNetworkRequest::KnownHeaders::ContentTypeHeader,
                          props.mime);
}

Downloader::Downloader(int timeout, QObject *parent)
    : QObject{parent}, mTimeout{timeout} {}

Downloader::~Downloader() {
    if (mReply) {
        mReply->abort();
        mReply->deleteLater();
    }
}

QNetworkReply *Downloader::start(const Request &props) {
    if (mReply) {
        LOGF("downloader is busy");
    }

    if (!mNam) mNam = std::make_unique<QNetworkAccessManager>();

    mCancelRequested = false;

    QNetworkRequest request{props.url};
    setRequestProps(request, props);

    if (props.verb == "GET")
        mReply = mNam->get(request);
    else if (props.verb == "POST")
        mReply = mNam->post(request, props.body);
    else
        mReply = mNam->sendCustomRequest(request, props.verb, props.body);

    return mReply;
}

void Downloader::finish(const QUrl &url) {
#ifdef QT_DEBUG
    qDebug() << "request finished:" << url;
#else
    Q_UNUSED(url);
#endif
    mReply->deleteLater();
    mReply = nullptr;
}

int Downloader::statusOrThrow(const QUrl &url) const {
    auto status = mReply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    auto err = mReply->error();

    // errors below 100 are transport level, a status may still be present
    // when the connection dropped in the middle of the body
    if (!status.isValid() ||
        (err != QNetworkReply::NoError &&
         err < QNetworkReply::ProxyConnectionRefusedError)) {
        qWarning() << "network error:" << err << url;
        throw DeviceUnreachable{
            QStringLiteral("%1: %2").arg(url.toString(), mReply->errorString())};
    }

    return status.toInt();
}

Transport::Reply Downloader::send(const Request &props) {
#ifdef QT_DEBUG
    qDebug() << "send:" << props.verb << props.url;
#endif

    auto *reply = start(props);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    timer.setInterval(mTimeout);

    QObject::connect(&timer, &QTimer::timeout, reply, [reply] {
        qWarning() << "timeout => aborting";
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::readyRead, reply, [this, reply] {
        if (mCancelRequested ||
            QThread::currentThread()->isInterruptionRequested()) {
            qWarning() << "cancel was requested";
            reply->abort();
        }
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, [&loop, &timer] {
        timer.stop();
        loop.quit();
    });

    timer.start();
    loop.exec();
    timer.stop();

    Reply result;
    try {
        result.status = statusOrThrow(props.url);
    } catch (const DeviceUnreachable &) {
        finish(props.url);
        throw;
    }

    result.body = reply->readAll();
    finish(props.url);

    return result;
}

int Downloader::receive(const Request &props, QIODevice &output) {
#ifdef QT_DEBUG
    qDebug() << "receive:" << props.url;
#endif

    auto *reply = start(props);
    reply->setReadBufferSize(readBufferSize);

    bool writeFailed = false;

    auto drain = [&output, &writeFailed](QNetworkReply *reply) {
        auto status =
            reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        auto data = reply->read(readBufferSize);
        while (!data.isEmpty()) {
            if (Transport::success(status) && !writeFailed &&
                output.write(data) != data.size()) {
                qWarning() << "write error:" << output.errorString();
                writeFailed = true;
                reply->abort();
                return;
            }
            data = reply->read(readBufferSize);
        }
    };

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    timer.setInterval(mTimeout);

    QObject::connect(&timer, &QTimer::timeout, reply, [reply] {
        qWarning() << "inactivity timeout => aborting";
        reply->abort();
    });
    QObject::connect(
        reply, &QNetworkReply::readyRead, reply,
        [this, reply, &timer, &drain] {
            if (mCancelRequested ||
                QThread::currentThread()->isInterruptionRequested()) {
                qWarning() << "cancel was requested";
                reply->abort();
                return;
            }
            timer.start();
            drain(reply);
        });
    QObject::connect(reply, &QNetworkReply::finished, &loop, [&loop, &timer] {
        timer.stop();
        loop.quit();
    });

    timer.start();
    loop.exec();
    timer.stop();

    if (writeFailed) {
        finish(props.url);
        LOGF("cannot write downloaded data: " << output.errorString());
    }

    int status = 0;
    try {
        status = statusOrThrow(props.url);
    } catch (const DeviceUnreachable &) {
        finish(props.url);
        throw;
    }

    drain(reply);
    finish(props.url);

    if (writeFailed) {
        LOGF("cannot write downloaded data: " << output.errorString());
    }

    return status;
}

void Downloader::cancel() {
    mCancelRequested = true;
    if (mReply) {
        qWarning() << "cancel requested";
        mReply->abort();
    }
}
