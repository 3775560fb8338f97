// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioDevice.h"
#include "AutoSwitchingController.h"
#include "Clock.h"
#include "ManualOverridePolicy.h"
#include "Notifier.h"
#include "Profile.h"

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QUuid>

#include <optional>

class DeviceChangeDebouncer;
class DeviceController;
class DeviceEnumerator;
class DeviceHistoryManager;
class DeviceMonitor;
class HotkeyManager;
class HotkeyRegistrar;
class ProfileActivator;
class ProfileManager;
class QTimer;
class SettingsManager;
class StateStore;

/**
 * @brief Snapshot of the state owned by ProfileController
 */
struct ActivationState {
    std::optional<QUuid> activeProfileId;
    ProfileMode activeMode = ProfileMode::Public;
    std::optional<QDateTime> lastManualSwitchTimestamp;
    bool isAutoSwitchingDisabled = false;
    std::optional<QDateTime> autoSwitchingDisabledUntil;
    QSet<QString> lastEvaluatedDeviceIds;
};

/**
 * @brief Trigger detection orchestrator and the daemon's public API
 *
 * Wires device monitoring, history, matching, override policy, suspension
 * and activation together. It is the only component that mutates the
 * activation state; all entry points run on the main thread and trigger
 * evaluations are strictly serialized.
 *
 * Evaluation of a device snapshot:
 *  1. automatic evaluations stop while auto-switching is disabled
 *  2. the device history is updated
 *  3. automatic evaluations stop if the device id set did not change
 *  4. the id set is recorded and the best trigger match computed
 *  5. automatic matches are checked against the manual override
 *  6. the arbiter's command is applied, notified and remembered
 */
class ProfileController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString activeProfileName READ activeProfileName NOTIFY activeProfileChanged)
    Q_PROPERTY(bool autoSwitchingDisabled READ isAutoSwitchingDisabled NOTIFY autoSwitchingChanged)
    Q_PROPERTY(QString remainingDisableTime READ remainingDisableTime NOTIFY remainingDisableTimeChanged)

public:
    /**
     * @brief External collaborators, owned by the caller
     *
     * enumerator, controller and store are required. The others may be null,
     * which disables the corresponding feature.
     */
    struct Dependencies {
        DeviceEnumerator *enumerator = nullptr;
        DeviceController *controller = nullptr;
        DeviceMonitor *monitor = nullptr;
        StateStore *store = nullptr;
        Notifier *notifier = nullptr;
        HotkeyRegistrar *hotkeyRegistrar = nullptr;
        SettingsManager *settings = nullptr;
    };

    explicit ProfileController(const Dependencies &deps, QObject *parent = nullptr);
    ~ProfileController() override;

    /**
     * @brief Load state, restore the last profile and run a forced evaluation
     */
    void start();

    // Observable state
    QList<Profile> profiles() const;
    std::optional<Profile> activeProfile() const;
    QString activeProfileName() const;
    ProfileMode activeMode() const;
    bool isAutoSwitchingDisabled() const;
    std::optional<QDateTime> autoSwitchingDisabledUntil() const;
    QString remainingDisableTime() const;
    ActivationState activationState() const;

    /**
     * @brief Activate a profile
     *
     * Manual activations record the override timestamp and notify
     * ManualSwitch; automatic ones clear the override.
     *
     * @return false if the profile does not exist
     */
    bool activateProfile(const QUuid &id, bool isManual);

    void toggleMode();

    /**
     * @brief Validate and store a profile
     * @param triggerAutoDetect Run a forced evaluation afterwards
     * @return false if validation failed, errorOccurred() carries the reason
     */
    bool upsertProfile(const Profile &profile, bool triggerAutoDetect = true);

    /**
     * @brief Delete a profile, deactivating it first if it is active
     * @return false for System Default and unknown ids
     */
    bool removeProfile(const QUuid &id);

    bool moveProfile(int from, int to);

    void disableAutoSwitching(const DisableDuration &duration);
    void enableAutoSwitching();

    /**
     * @brief Snapshot the current devices and run a forced evaluation
     */
    void triggerAutoDetection();

    /**
     * @brief Forget a device and strip it from every profile
     */
    bool forgetDevice(const QString &deviceId);

    /**
     * @brief Prune expired history and stale profile references
     */
    void periodicCleanup();

    /**
     * @brief Connected plus previously seen devices, sorted by name
     */
    QList<AudioDevice> knownDevices() const;

    /**
     * @brief Display name for a device id, "Unknown Device" if never seen
     */
    QString deviceName(const QString &deviceId) const;

    const DeviceHistoryManager *history() const { return m_history; }
    ProfileManager *profileManager() const { return m_profiles; }

    void setClock(Clock clock);

public Q_SLOTS:
    /**
     * @brief Feed a raw device snapshot; evaluated after the debounce period
     */
    void onDevicesChanged(const QList<AudioDevice> &devices);

Q_SIGNALS:
    void profilesChanged();
    void activeProfileChanged();
    void activeModeChanged(ProfileMode mode);
    void autoSwitchingChanged(bool disabled);
    void remainingDisableTimeChanged(const QString &remaining);
    void errorOccurred(const QString &message);

private:
    struct PendingEvaluation {
        QList<AudioDevice> devices;
        bool isManual = false;
    };

    void evaluate(const QList<AudioDevice> &devices, bool isManual);
    void runEvaluation(const QList<AudioDevice> &devices, bool isManual);
    void sendNotification(NotificationKind kind, const NotificationPayload &payload);
    void restoreStartupProfile();
    void onDeviceForgotten(const QString &deviceId, const QString &name);
    void syncActiveProfile();
    QList<AudioDevice> currentDevices() const;

    static QSet<QString> idSet(const QList<AudioDevice> &devices);

    Dependencies m_deps;
    Clock m_clock = systemClock();

    DeviceHistoryManager *m_history = nullptr;
    ProfileManager *m_profiles = nullptr;
    HotkeyManager *m_hotkeys = nullptr;
    ProfileActivator *m_activator = nullptr;
    AutoSwitchingController *m_autoSwitching = nullptr;
    DeviceChangeDebouncer *m_debouncer = nullptr;
    QTimer *m_cleanupTimer = nullptr;

    ManualOverridePolicy m_override;
    QSet<QString> m_lastEvaluatedDeviceIds;

    bool m_evaluating = false;
    QList<PendingEvaluation> m_pendingEvaluations;
};
