/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "taskexecutor.h"

#include <algorithm>
#include <utility>

TaskExecutor::Task::Task(std::function<void()> job) : m_job{std::move(job)} {}

void TaskExecutor::Task::run() { m_job(); }

TaskExecutor::TaskExecutor(QObject* parent, int threadCount) : m_pool{parent} {
    m_pool.setMaxThreadCount(std::max(threadCount, 1));
}

void TaskExecutor::startTask(std::function<void()> job) {
    auto* task = new Task{std::move(job)};
    task->setAutoDelete(true);
    m_pool.start(task);
}

void TaskExecutor::waitForDone() { m_pool.waitForDone(); }
