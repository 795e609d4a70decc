/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

// Delay between polling cycles. Doubles with every failed cycle in a row,
// never exceeding maxBackoff, and drops back to interval after a good one.
class Scheduler {
   public:
    Scheduler(int interval, int maxBackoff);

    int nextDelay(bool cycleOk);
    inline auto failures() const { return m_failures; }
    inline auto interval() const { return m_interval; }

   private:
    int m_interval;
    int m_maxBackoff;
    int m_failures = 0;
};

#endif  // SCHEDULER_H
