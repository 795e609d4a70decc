/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SCANTRANSFER_H
#define SCANTRANSFER_H

#include <QString>
#include <QStringList>
#include <functional>
#include <vector>

class Scanner;

/*
 * One "fetch everything, hand it off, clean up" cycle for one scanner.
 *
 * Scans are downloaded in listing order. A scan that is listed but cannot be
 * fetched anymore is skipped. After the listing was processed, one delete
 * request names every listed scan, skipped ones included. Any other error
 * ends the cycle and reaches the caller.
 */
class ScanTransfer {
   public:
    struct Item {
        QString localPath;
        QString remoteName;
        // Scanner::description() of the source device
        QString device;
    };

    // Returns true when the receiver took ownership of the file, the local
    // copy is removed then. Otherwise the file stays where it is.
    using Handoff = std::function<bool(const Item &item)>;

    struct Options {
        QString destinationDir;
        // prefix local files with the device name
        bool rename = true;
        bool deleteRemote = true;
    };

    struct Report {
        std::vector<Item> transferred;
        QStringList skipped;
        int handedOff = 0;
        bool remoteDeleted = false;
    };

    ScanTransfer(Options options, Handoff handoff);

    Report run(Scanner &scanner) const;
    inline const auto &options() const { return m_options; }

    // "Scan <basename> from <device>"
    static QString label(const Item &item);

   private:
    Options m_options;
    Handoff m_handoff;

    QString localName(const QString &baseName,
                      const QString &deviceName) const;
};

#endif  // SCANTRANSFER_H
