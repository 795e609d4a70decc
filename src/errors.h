/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <QString>
#include <stdexcept>

class DeviceError : public std::runtime_error {
   public:
    explicit DeviceError(const QString &what)
        : std::runtime_error{what.toStdString()} {}
};

// Network or connection failure, including timeouts.
class DeviceUnreachable : public DeviceError {
   public:
    using DeviceError::DeviceError;
};

// Response with an unexpected status or a shape that cannot be parsed.
class DeviceProtocolError : public DeviceError {
   public:
    using DeviceError::DeviceError;
};

// Device rejected the credential (or got none when one is required).
class DeviceAuthError : public DeviceError {
   public:
    using DeviceError::DeviceError;
};

class CredentialNotFound : public DeviceError {
   public:
    CredentialNotFound(const QString &deviceId, const QString &store)
        : DeviceError{QStringLiteral("no password for device %1 in %2")
                          .arg(deviceId, store)},
          m_deviceId{deviceId} {}
    inline const auto &deviceId() const { return m_deviceId; }

   private:
    QString m_deviceId;
};

// Listed scan whose file cannot be fetched anymore. Recoverable.
class ScanUnavailable : public DeviceError {
   public:
    ScanUnavailable(const QString &name, int status)
        : DeviceError{QStringLiteral("scan %1 is unavailable (status %2)")
                          .arg(name)
                          .arg(status)},
          m_name{name},
          m_status{status} {}
    inline const auto &name() const { return m_name; }
    inline auto status() const { return m_status; }

   private:
    QString m_name;
    int m_status;
};

#endif  // ERRORS_H
