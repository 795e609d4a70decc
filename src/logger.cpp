/* Copyright (C) 2022-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "logger.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <threads.h>

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <chrono>
#include <cstdio>

DoxiegrabLogger::LogType DoxiegrabLogger::m_level =
    DoxiegrabLogger::LogType::Info;
std::optional<std::ofstream> DoxiegrabLogger::m_file = std::nullopt;
std::mutex DoxiegrabLogger::m_mtx;

std::ostream &operator<<(std::ostream &os, DoxiegrabLogger::LogType type) {
    switch (type) {
        case DoxiegrabLogger::LogType::Trace:
            os << "trace";
            break;
        case DoxiegrabLogger::LogType::Debug:
            os << "debug";
            break;
        case DoxiegrabLogger::LogType::Info:
            os << "info";
            break;
        case DoxiegrabLogger::LogType::Warning:
            os << "warning";
            break;
        case DoxiegrabLogger::LogType::Error:
            os << "error";
            break;
        case DoxiegrabLogger::LogType::Quiet:
            os << "quiet";
            break;
    }
    return os;
}

void DoxiegrabLogger::init(LogType level, const std::string &file) {
    m_level = level;

    setFile(file);
}

void DoxiegrabLogger::setLevel(LogType level) {
    if (m_level != level) {
        auto old = m_level;
        m_level = level;
        LOGD("logging level changed: " << old << " => " << m_level);
    }
}

void DoxiegrabLogger::setFile(const std::string &file) {
    if (file.empty()) {
        {
            std::lock_guard lock{m_mtx};
            m_file.reset();
        }
        LOGD("logging to stderr enabled");
    } else {
        bool ok = false;
        {
            std::lock_guard lock{m_mtx};
            m_file.emplace(file, std::ios::app);
            ok = m_file->good();
            if (!ok) m_file.reset();
        }
        if (ok) {
            LOGI("logging to file enabled: " << file);
        } else {
            LOGW("failed to create log file: " << file);
        }
    }
}

DoxiegrabLogger::LogType DoxiegrabLogger::level() { return m_level; }

bool DoxiegrabLogger::match(LogType type) {
    return static_cast<int>(type) >= static_cast<int>(m_level);
}

DoxiegrabLogger::Message::Message(LogType type, const char *file,
                                  const char *function, int line)
    : m_type{type}, m_file{file}, m_fun{function}, m_line{line} {}

DoxiegrabLogger::Message &DoxiegrabLogger::Message::operator<<(
    const QString &s) {
    m_os << s.toStdString();
    return *this;
}

DoxiegrabLogger::Message &DoxiegrabLogger::Message::operator<<(
    const QByteArray &s) {
    m_os << s.toStdString();
    return *this;
}

DoxiegrabLogger::Message &DoxiegrabLogger::Message::operator<<(
    const QUrl &url) {
    m_os << url.toString().toStdString();
    return *this;
}

std::string DoxiegrabLogger::Message::text() const {
    return fmt::format("{}:{} - {}", m_fun ? m_fun : m_emptyStr, m_line,
                       m_os.str());
}

inline static auto typeToChar(DoxiegrabLogger::LogType type) {
    switch (type) {
        case DoxiegrabLogger::LogType::Trace:
            return 'T';
        case DoxiegrabLogger::LogType::Debug:
            return 'D';
        case DoxiegrabLogger::LogType::Info:
            return 'I';
        case DoxiegrabLogger::LogType::Warning:
            return 'W';
        case DoxiegrabLogger::LogType::Error:
            return 'E';
        case DoxiegrabLogger::LogType::Quiet:
            return 'Q';
    }
    return '-';
}

DoxiegrabLogger::Message::~Message() {
    if (!match(m_type)) return;

    auto now = std::chrono::system_clock::now();
    auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000;

    const auto str = m_os.str();
    if (str.empty()) return;

    if (m_fun == nullptr || m_fun[0] == '\0') m_fun = m_emptyStr;

    auto fmt =
        fmt::format("[{{0}}] {{1:%H:%M:%S}}.{{2:03}} {{3:#10x}} {{4}}{}- "
                    "{{5}}{}",
                    m_line > 0 ? ":{6} " : " ", str.back() == '\n' ? "" : "\n");
    try {
        auto line = fmt::format(
            fmt::runtime(fmt), typeToChar(m_type), now, msecs,
            thrd_current(), m_fun, str, m_line);

        std::lock_guard lock{DoxiegrabLogger::m_mtx};
        if (DoxiegrabLogger::m_file) {
            *DoxiegrabLogger::m_file << line;
            DoxiegrabLogger::m_file->flush();
        } else {
            fmt::print(stderr, "{}", line);
            fflush(stderr);
        }
    } catch (const std::runtime_error &e) {
        fmt::print(stderr, "logger error: {}\n", e.what());
        fmt::print(stderr, "{}\n", str);
    }
}
