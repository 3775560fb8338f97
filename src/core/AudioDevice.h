// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief Which side of the audio graph a default-device change applies to
 */
enum class DeviceKind {
    Input,
    Output
};

/**
 * @brief Represents an audio endpoint (sink or source)
 *
 * Identity is the hardware-persistent UID (the PulseAudio/PipeWire node name),
 * never the transient object index reported by the sound server.
 */
struct AudioDevice {
    Q_GADGET
    Q_PROPERTY(QString id MEMBER id)
    Q_PROPERTY(QString name MEMBER name)
    Q_PROPERTY(TransportKind transportKind MEMBER transportKind)
    Q_PROPERTY(bool isInput MEMBER isInput)
    Q_PROPERTY(bool isOutput MEMBER isOutput)

public:
    enum class TransportKind {
        BuiltIn,
        USB,
        Bluetooth,
        Other
    };
    Q_ENUM(TransportKind)

    QString id;   // Persistent UID, e.g. "alsa_output.usb-Dock_1234-00.analog-stereo"
    QString name; // Human readable description
    TransportKind transportKind = TransportKind::Other;
    bool isInput = false;
    bool isOutput = false;

    bool supports(DeviceKind kind) const
    {
        return kind == DeviceKind::Input ? isInput : isOutput;
    }

    bool operator==(const AudioDevice &other) const
    {
        return id == other.id && name == other.name && transportKind == other.transportKind
            && isInput == other.isInput && isOutput == other.isOutput;
    }
    bool operator!=(const AudioDevice &other) const { return !(*this == other); }

    QJsonObject toJson() const;
    static AudioDevice fromJson(const QJsonObject &obj);

    static QString transportKindToString(TransportKind kind);
    static TransportKind transportKindFromString(const QString &value);
};

Q_DECLARE_METATYPE(AudioDevice)

/**
 * @brief History record for a device that has been observed at least once
 */
struct DeviceHistoryEntry {
    AudioDevice device;
    QDateTime lastSeen;
    bool isCurrentlyActive = false;

    QJsonObject toJson() const;

    /**
     * @brief Decode a history entry
     * @return Entry with an empty device id when the object is unusable
     */
    static DeviceHistoryEntry fromJson(const QJsonObject &obj);
};
