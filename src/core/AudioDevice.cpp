// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "AudioDevice.h"

#include <QJsonValue>

QJsonObject AudioDevice::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("transportType")] = transportKindToString(transportKind);
    obj[QStringLiteral("isInput")] = isInput;
    obj[QStringLiteral("isOutput")] = isOutput;
    return obj;
}

AudioDevice AudioDevice::fromJson(const QJsonObject &obj)
{
    AudioDevice device;
    device.id = obj[QStringLiteral("id")].toString();
    device.name = obj[QStringLiteral("name")].toString();
    device.transportKind = transportKindFromString(obj[QStringLiteral("transportType")].toString());
    device.isInput = obj[QStringLiteral("isInput")].toBool();
    device.isOutput = obj[QStringLiteral("isOutput")].toBool();
    return device;
}

QString AudioDevice::transportKindToString(TransportKind kind)
{
    switch (kind) {
    case TransportKind::BuiltIn:
        return QStringLiteral("builtin");
    case TransportKind::USB:
        return QStringLiteral("usb");
    case TransportKind::Bluetooth:
        return QStringLiteral("bluetooth");
    case TransportKind::Other:
        break;
    }
    return QStringLiteral("other");
}

AudioDevice::TransportKind AudioDevice::transportKindFromString(const QString &value)
{
    const QString lower = value.toLower();
    if (lower == QLatin1String("builtin") || lower == QLatin1String("built-in")) {
        return TransportKind::BuiltIn;
    }
    if (lower == QLatin1String("usb")) {
        return TransportKind::USB;
    }
    if (lower == QLatin1String("bluetooth")) {
        return TransportKind::Bluetooth;
    }
    return TransportKind::Other;
}

QJsonObject DeviceHistoryEntry::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("device")] = device.toJson();
    obj[QStringLiteral("lastSeen")] = lastSeen.toUTC().toString(Qt::ISODateWithMs);
    obj[QStringLiteral("isCurrentlyActive")] = isCurrentlyActive;
    return obj;
}

DeviceHistoryEntry DeviceHistoryEntry::fromJson(const QJsonObject &obj)
{
    DeviceHistoryEntry entry;
    entry.device = AudioDevice::fromJson(obj[QStringLiteral("device")].toObject());
    entry.isCurrentlyActive = obj[QStringLiteral("isCurrentlyActive")].toBool();

    // Timestamps are written as ISO-8601; epoch milliseconds are accepted too
    const QJsonValue lastSeen = obj[QStringLiteral("lastSeen")];
    if (lastSeen.isDouble()) {
        entry.lastSeen = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(lastSeen.toDouble())).toUTC();
    } else {
        entry.lastSeen = QDateTime::fromString(lastSeen.toString(), Qt::ISODateWithMs);
        if (!entry.lastSeen.isValid()) {
            entry.lastSeen = QDateTime::fromString(lastSeen.toString(), Qt::ISODate);
        }
    }

    if (!entry.lastSeen.isValid()) {
        entry.device.id.clear();
    }
    return entry;
}
