/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scheduler.h"

#include <algorithm>

#include "logger.hpp"

Scheduler::Scheduler(int interval, int maxBackoff)
    : m_interval{std::max(interval, 1)},
      m_maxBackoff{std::max(maxBackoff, m_interval)} {}

int Scheduler::nextDelay(bool cycleOk) {
    if (cycleOk) {
        if (m_failures > 0) LOGD("backoff reset after " << m_failures);
        m_failures = 0;
        return m_interval;
    }

    ++m_failures;

    auto delay = m_interval;
    for (int i = 0; i < m_failures && delay < m_maxBackoff; ++i) {
        if (delay > m_maxBackoff / 2) {
            delay = m_maxBackoff;
            break;
        }
        delay *= 2;
    }

    LOGD("failed cycles: " << m_failures << ", next in " << delay << "s");

    return delay;
}
