// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QDBusContext>
#include <QDBusError>
#include <QObject>
#include <QString>
#include <QVariantMap>

class ProfileController;

/**
 * ProfilesDBusAdaptor - Session bus control interface of the daemon
 *
 * D-Bus interface: io.github.audioprofiles.Daemon
 * Object path: /AudioProfiles
 *
 * Profiles and devices are exchanged as JSON strings using the same
 * layout as profiles.json. Every call runs on the main thread, so it is
 * serialized with device-change evaluations.
 */
class ProfilesDBusAdaptor : public QObject, protected QDBusContext
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "io.github.audioprofiles.Daemon")

public:
    static const QString SERVICE_NAME;
    static const QString OBJECT_PATH;

    explicit ProfilesDBusAdaptor(ProfileController *controller, QObject *parent = nullptr);
    ~ProfilesDBusAdaptor() override;

public Q_SLOTS:
    QString Version();

    /**
     * @return JSON array of profiles in display order, each with an extra "active" flag
     */
    QString ListProfiles();

    /**
     * @return Id of the active profile, empty if none
     */
    QString ActiveProfile();

    /**
     * @return "public" or "private"
     */
    QString ActiveMode();

    /**
     * Activate a profile as a manual selection
     */
    bool ActivateProfile(const QString &id);

    void ToggleMode();

    /**
     * Create or update a profile
     *
     * @param json Profile object; a missing id creates a new profile
     * @return Id of the stored profile, empty on failure
     */
    QString UpsertProfile(const QString &json);

    bool RemoveProfile(const QString &id);
    bool MoveProfile(int from, int to);

    /**
     * Suspend automatic switching
     *
     * @param kind "hours", "endOfDay" or "forever"
     * @param hours Duration for kind "hours", ignored otherwise
     */
    bool DisableAutoSwitching(const QString &kind, int hours);

    void EnableAutoSwitching();
    void TriggerAutoDetection();

    /**
     * Remove a device from the history and from every profile
     */
    bool ForgetDevice(const QString &deviceId);

    /**
     * @return JSON array of connected and previously seen devices, each with a "connected" flag
     */
    QString KnownDevices();

    /**
     * @return {"disabled": bool, "until": ISO-8601 or "", "remaining": "Xh Ym" or ""}
     */
    QVariantMap AutoSwitchingStatus();

Q_SIGNALS:
    void ActiveProfileChanged(const QString &id, const QString &name);
    void AutoSwitchingChanged(bool disabled, const QString &remaining);

private:
    void fail(QDBusError::ErrorType type, const QString &message);

    ProfileController *m_controller = nullptr;
};
