/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef HANDOFF_H
#define HANDOFF_H

#include <QString>
#include <QStringList>

#include "scantransfer.h"

/*
 * Hands a downloaded scan to an external program, invoked as:
 *
 *   <command> <local path> <label>
 *
 * Exit code 0 means the program took ownership of the file.
 */
class CommandHandoff {
   public:
    explicit CommandHandoff(const QString &command, int timeout = 60000);
    bool operator()(const ScanTransfer::Item &item) const;
    inline bool valid() const { return !m_program.isEmpty(); }

   private:
    QString m_program;
    QStringList m_args;
    int m_timeout;
};

#endif  // HANDOFF_H
