// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Hotkey.h"

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QUuid>

#include <functional>
#include <optional>

/**
 * @brief Which pair of priority lists a profile applies
 *
 * Public is typically speakers, Private typically headphones.
 */
enum class ProfileMode {
    Public,
    Private
};

QString profileModeToString(ProfileMode mode);
ProfileMode profileModeFromString(const QString &value, ProfileMode fallback = ProfileMode::Public);

/**
 * @brief A named audio configuration with trigger devices and device priorities
 *
 * Device lists hold persistent device UIDs. They may reference devices that
 * are not currently connected; such references survive as long as the device
 * is still present in the device history.
 */
struct Profile {
    QUuid id;
    QString name;
    QString iconName;
    QStringList triggerDeviceIds;
    QStringList publicOutputPriority;
    QStringList publicInputPriority;
    QStringList privateOutputPriority;
    QStringList privateInputPriority;
    std::optional<Hotkey> hotkey;
    ProfileMode preferredMode = ProfileMode::Public;

    static const QString SYSTEM_DEFAULT_NAME;
    static const QString DEFAULT_ICON;

    /**
     * @brief Schema version written by toJson()
     *
     * Version 1 profiles predate preferredMode and optional icons.
     */
    static constexpr int SCHEMA_VERSION = 2;

    bool isSystemDefault() const { return name == SYSTEM_DEFAULT_NAME; }

    QStringList outputPriority(ProfileMode mode) const
    {
        return mode == ProfileMode::Public ? publicOutputPriority : privateOutputPriority;
    }

    QStringList inputPriority(ProfileMode mode) const
    {
        return mode == ProfileMode::Public ? publicInputPriority : privateInputPriority;
    }

    /**
     * @brief Check if any of the five device lists references a device
     */
    bool referencesDevice(const QString &deviceId) const;

    /**
     * @brief Remove a device from all five device lists
     * @return true if anything was removed
     */
    bool removeDevice(const QString &deviceId);

    /**
     * @brief Keep only device ids accepted by the predicate, in all five lists
     * @return true if anything was removed
     */
    bool retainDevices(const std::function<bool(const QString &)> &keep);

    bool operator==(const Profile &other) const;
    bool operator!=(const Profile &other) const { return !(*this == other); }

    /**
     * @brief Factory for a new user profile with empty lists
     */
    static Profile createNew(const QString &name = QStringLiteral("New Profile"));

    /**
     * @brief Factory for the fallback profile that is always present
     */
    static Profile createSystemDefault();

    QJsonObject toJson() const;

    /**
     * @brief Decode a profile written with the given schema version
     *
     * Missing optional fields get their defaults: preferredMode Public,
     * no hotkey, DEFAULT_ICON, empty device lists. Invalid hotkeys are dropped.
     *
     * @return std::nullopt if the id is not a UUID or the name is empty
     */
    static std::optional<Profile> fromJson(const QJsonObject &obj, int schemaVersion);
};

Q_DECLARE_METATYPE(Profile)
Q_DECLARE_METATYPE(ProfileMode)
