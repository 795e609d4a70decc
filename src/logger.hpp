/* Copyright (C) 2022-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DOXIEGRAB_LOGGER_H
#define DOXIEGRAB_LOGGER_H

#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#ifdef USE_TRACE_LOGS
#define LOGT(msg)                                                        \
    DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Trace, __FILE__, \
                             __func__, __LINE__)                         \
        << msg
#else
#define LOGT(msg)
#endif
#define LOGD(msg)                                                        \
    DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Debug, __FILE__, \
                             __func__, __LINE__)                         \
        << msg
#define LOGI(msg)                                                       \
    DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Info, __FILE__, \
                             __func__, __LINE__)                        \
        << msg
#define LOGW(msg)                                                          \
    DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Warning, __FILE__, \
                             __func__, __LINE__)                           \
        << msg
#define LOGE(msg)                                                        \
    DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Error, __FILE__, \
                             __func__, __LINE__)                         \
        << msg
// Logs an error and throws std::runtime_error with the same text
#define LOGF(msg)                                                          \
    throw std::runtime_error {                                             \
        (DoxiegrabLogger::Message(DoxiegrabLogger::LogType::Error, __FILE__, \
                                  __func__, __LINE__)                      \
         << msg)                                                           \
            .text()                                                        \
    }

class QString;
class QByteArray;
class QUrl;

class DoxiegrabLogger {
   public:
    enum class LogType {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Quiet = 5
    };
    friend std::ostream &operator<<(std::ostream &os, LogType type);

    class Message {
        std::ostringstream m_os;
        LogType m_type;
        const char *m_file;
        const char *m_fun;
        int m_line;

       public:
        Message(LogType type, const char *file, const char *function, int line);
        ~Message();

        template <typename T>
        Message &operator<<(const T &t) {
            m_os << std::boolalpha << t;
            return *this;
        }
        Message &operator<<(const QString &s);
        Message &operator<<(const QByteArray &s);
        Message &operator<<(const QUrl &url);

        // "<function>:<line> - <message>"
        std::string text() const;
    };

    static void init(LogType level, const std::string &file = {});
    static void setLevel(LogType level);
    static LogType level();
    static void setFile(const std::string &file);
    static inline bool logToFileEnabled() { return m_file.has_value(); }
    static bool match(LogType type);
    DoxiegrabLogger() = delete;

   private:
    inline static const char *m_emptyStr = "()";
    static LogType m_level;
    static std::optional<std::ofstream> m_file;
    static std::mutex m_mtx;
};

#endif  // DOXIEGRAB_LOGGER_H
