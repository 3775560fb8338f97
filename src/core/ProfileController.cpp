// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ProfileController.h"
#include "ActivationArbiter.h"
#include "AudioBackend.h"
#include "DeviceChangeDebouncer.h"
#include "DeviceHistoryManager.h"
#include "HotkeyManager.h"
#include "Logging.h"
#include "ProfileActivator.h"
#include "ProfileManager.h"
#include "SettingsManager.h"
#include "TriggerMatcher.h"

#include <QTimer>

#include <algorithm>

ProfileController::ProfileController(const Dependencies &deps, QObject *parent)
    : QObject(parent)
    , m_deps(deps)
    , m_history(new DeviceHistoryManager(deps.store, this))
    , m_profiles(new ProfileManager(deps.store, m_history, this))
    , m_hotkeys(new HotkeyManager(deps.hotkeyRegistrar, this))
    , m_activator(new ProfileActivator(deps.enumerator, deps.controller, this))
    , m_autoSwitching(new AutoSwitchingController(this))
    , m_debouncer(new DeviceChangeDebouncer(this))
    , m_cleanupTimer(new QTimer(this))
{
    connect(m_profiles, &ProfileManager::profilesChanged, this, &ProfileController::profilesChanged);
    connect(m_profiles, &ProfileManager::errorOccurred, this, &ProfileController::errorOccurred);

    connect(m_history, &DeviceHistoryManager::deviceRemoved, this, &ProfileController::onDeviceForgotten);

    connect(m_activator, &ProfileActivator::activeProfileChanged, this, &ProfileController::activeProfileChanged);
    connect(m_activator, &ProfileActivator::activeModeChanged, this, &ProfileController::activeModeChanged);

    connect(m_autoSwitching, &AutoSwitchingController::stateChanged, this, &ProfileController::autoSwitchingChanged);
    connect(m_autoSwitching, &AutoSwitchingController::remainingTimeChanged,
            this, &ProfileController::remainingDisableTimeChanged);
    // Devices may have changed while switching was suspended
    connect(m_autoSwitching, &AutoSwitchingController::reEnabled, this, &ProfileController::triggerAutoDetection);

    connect(m_hotkeys, &HotkeyManager::hotkeyActivated, this, [this](const QUuid &id) {
        activateProfile(id, true);
    });

    connect(m_debouncer, &DeviceChangeDebouncer::settled, this, [this](const QList<AudioDevice> &devices) {
        evaluate(devices, false);
    });

    if (m_deps.monitor) {
        connect(m_deps.monitor, &DeviceMonitor::devicesChanged, this, &ProfileController::onDevicesChanged);
    }

    connect(m_cleanupTimer, &QTimer::timeout, this, &ProfileController::periodicCleanup);

    if (m_deps.settings) {
        SettingsManager *settings = m_deps.settings;
        m_debouncer->setInterval(settings->debounceInterval());
        m_history->setRetentionDays(settings->historyRetentionDays());
        m_cleanupTimer->setInterval(settings->cleanupInterval() * 60 * 1000);

        connect(settings, &SettingsManager::debounceIntervalChanged, this, [this, settings]() {
            m_debouncer->setInterval(settings->debounceInterval());
        });
        connect(settings, &SettingsManager::historyRetentionDaysChanged, this, [this, settings]() {
            m_history->setRetentionDays(settings->historyRetentionDays());
        });
        connect(settings, &SettingsManager::cleanupIntervalChanged, this, [this, settings]() {
            m_cleanupTimer->setInterval(settings->cleanupInterval() * 60 * 1000);
        });
    } else {
        m_cleanupTimer->setInterval(5 * 60 * 1000);
    }
}

ProfileController::~ProfileController() = default;

void ProfileController::start()
{
    m_history->load();

    const QList<AudioDevice> devices = currentDevices();
    m_profiles->load(idSet(devices));
    m_hotkeys->refreshHotkeys(m_profiles->profiles());

    m_history->update(devices);

    if (!m_activator->activeProfile()) {
        restoreStartupProfile();
    }

    if (m_deps.monitor) {
        m_deps.monitor->startMonitoring();
    }
    m_cleanupTimer->start();

    qCInfo(audioprofilesCore) << "Trigger detection started with" << devices.size() << "devices and"
                              << m_profiles->count() << "profiles";
    triggerAutoDetection();
}

void ProfileController::restoreStartupProfile()
{
    if (m_deps.settings && m_deps.settings->restoreLastProfile()) {
        const QUuid lastUsed = m_deps.settings->lastUsedProfileId();
        if (!lastUsed.isNull() && m_profiles->profile(lastUsed)) {
            qCInfo(audioprofilesCore) << "Restoring last used profile:" << m_profiles->profile(lastUsed)->name;
            activateProfile(lastUsed, false);
            return;
        }
    }

    if (const auto systemDefault = m_profiles->systemDefault()) {
        qCInfo(audioprofilesCore) << "Activating System Default profile";
        activateProfile(systemDefault->id, false);
    }
}

QList<Profile> ProfileController::profiles() const
{
    return m_profiles->profiles();
}

std::optional<Profile> ProfileController::activeProfile() const
{
    return m_activator->activeProfile();
}

QString ProfileController::activeProfileName() const
{
    const auto active = m_activator->activeProfile();
    return active ? active->name : QString();
}

ProfileMode ProfileController::activeMode() const
{
    return m_activator->activeMode();
}

bool ProfileController::isAutoSwitchingDisabled() const
{
    return m_autoSwitching->isDisabled();
}

std::optional<QDateTime> ProfileController::autoSwitchingDisabledUntil() const
{
    return m_autoSwitching->disabledUntil();
}

QString ProfileController::remainingDisableTime() const
{
    return m_autoSwitching->remainingTime();
}

ActivationState ProfileController::activationState() const
{
    ActivationState state;
    if (const auto active = m_activator->activeProfile()) {
        state.activeProfileId = active->id;
    }
    state.activeMode = m_activator->activeMode();
    state.lastManualSwitchTimestamp = m_override.lastManualSwitch();
    state.isAutoSwitchingDisabled = m_autoSwitching->isDisabled();
    state.autoSwitchingDisabledUntil = m_autoSwitching->disabledUntil();
    state.lastEvaluatedDeviceIds = m_lastEvaluatedDeviceIds;
    return state;
}

bool ProfileController::activateProfile(const QUuid &id, bool isManual)
{
    const auto profile = m_profiles->profile(id);
    if (!profile) {
        qCWarning(audioprofilesCore) << "Cannot activate unknown profile" << id;
        return false;
    }

    m_activator->activate(*profile);

    if (isManual) {
        m_override.recordManualSwitch(m_clock());
        qCInfo(audioprofilesCore) << "Manual profile selection:" << profile->name << "- timestamp recorded";

        NotificationPayload payload;
        payload.profileName = profile->name;
        sendNotification(NotificationKind::ManualSwitch, payload);
    } else {
        m_override.clear();
    }

    if (!profile->isSystemDefault() && m_deps.settings) {
        m_deps.settings->setLastUsedProfileId(id);
    }
    return true;
}

void ProfileController::toggleMode()
{
    m_activator->toggleMode();
}

bool ProfileController::upsertProfile(const Profile &profile, bool triggerAutoDetect)
{
    const auto oldProfile = m_profiles->profile(profile.id);
    if (!m_profiles->upsert(profile)) {
        return false;
    }

    const auto stored = m_profiles->profile(profile.id);
    if (!stored) {
        return false;
    }

    m_hotkeys->handleProfileChange(oldProfile, *stored, m_profiles->profiles());

    const auto active = m_activator->activeProfile();
    if (active && active->id == stored->id) {
        m_activator->refreshActiveProfile(*stored, true);
    }

    if (triggerAutoDetect) {
        triggerAutoDetection();
    }
    return true;
}

bool ProfileController::removeProfile(const QUuid &id)
{
    const auto profile = m_profiles->profile(id);
    if (!profile) {
        return false;
    }

    if (!m_profiles->remove(id)) {
        return false;
    }

    const auto active = m_activator->activeProfile();
    if (active && active->id == id) {
        m_activator->deactivate();
    }

    if (profile->hotkey) {
        m_hotkeys->refreshHotkeys(m_profiles->profiles());
    }

    if (m_deps.settings && m_deps.settings->lastUsedProfileId() == id) {
        m_deps.settings->setLastUsedProfileId(QUuid());
    }

    triggerAutoDetection();
    return true;
}

bool ProfileController::moveProfile(int from, int to)
{
    return m_profiles->move(from, to);
}

void ProfileController::disableAutoSwitching(const DisableDuration &duration)
{
    // An explicit suspension supersedes the override heuristics
    m_override.clear();
    m_autoSwitching->disable(duration);
}

void ProfileController::enableAutoSwitching()
{
    m_autoSwitching->enable();
}

void ProfileController::triggerAutoDetection()
{
    evaluate(currentDevices(), true);
}

bool ProfileController::forgetDevice(const QString &deviceId)
{
    return m_history->remove(deviceId);
}

void ProfileController::periodicCleanup()
{
    m_history->cleanup();
    if (m_profiles->cleanupAll(idSet(currentDevices()))) {
        syncActiveProfile();
    }
}

QList<AudioDevice> ProfileController::knownDevices() const
{
    QList<AudioDevice> devices = currentDevices();
    devices.append(m_history->previouslySeen(devices));

    std::sort(devices.begin(), devices.end(), [](const AudioDevice &a, const AudioDevice &b) {
        return a.name < b.name;
    });
    return devices;
}

QString ProfileController::deviceName(const QString &deviceId) const
{
    for (const AudioDevice &device : currentDevices()) {
        if (device.id == deviceId) {
            return device.name;
        }
    }
    if (const auto device = m_history->device(deviceId)) {
        return device->name;
    }
    return QStringLiteral("Unknown Device");
}

void ProfileController::setClock(Clock clock)
{
    m_clock = clock;
    m_history->setClock(clock);
    m_autoSwitching->setClock(std::move(clock));
}

void ProfileController::onDevicesChanged(const QList<AudioDevice> &devices)
{
    m_debouncer->submit(devices);
}

void ProfileController::evaluate(const QList<AudioDevice> &devices, bool isManual)
{
    m_pendingEvaluations.append(PendingEvaluation{devices, isManual});

    // A request arriving during an evaluation (e.g. from a signal emitted by
    // it) runs after the current one finishes
    if (m_evaluating) {
        return;
    }

    m_evaluating = true;
    while (!m_pendingEvaluations.isEmpty()) {
        const PendingEvaluation next = m_pendingEvaluations.takeFirst();
        runEvaluation(next.devices, next.isManual);
    }
    m_evaluating = false;
}

void ProfileController::runEvaluation(const QList<AudioDevice> &devices, bool isManual)
{
    if (!isManual && m_autoSwitching->isDisabled()) {
        qCInfo(audioprofilesTriggers) << "Ignoring device change - auto-switching is disabled";
        return;
    }

    m_history->update(devices);

    const QSet<QString> currentIds = idSet(devices);
    if (!isManual && currentIds == m_lastEvaluatedDeviceIds) {
        qCDebug(audioprofilesTriggers) << "Device set unchanged, skipping evaluation";
        return;
    }
    m_lastEvaluatedDeviceIds = currentIds;

    qCDebug(audioprofilesTriggers) << (isManual ? "Manual trigger requested" : "Device list changed")
                                   << "- evaluating" << currentIds.size() << "devices";

    const QList<Profile> profiles = m_profiles->profiles();
    const auto match = TriggerMatcher::findBestMatch(profiles, currentIds);

    if (!isManual && match && !m_override.shouldApplyTrigger(match->profile.triggerDeviceIds, *m_history)) {
        return;
    }

    std::optional<QUuid> activeId;
    if (const auto active = m_activator->activeProfile()) {
        activeId = active->id;
    }

    const auto command = ActivationArbiter::applyOrFallback(match, activeId, isManual, profiles, *m_history);
    if (!command) {
        return;
    }

    if (command->reapply) {
        if (const auto profile = m_profiles->profile(command->profileId)) {
            m_activator->refreshActiveProfile(*profile, true);
            m_override.clear();
        }
        return;
    }

    if (command->shouldNotify) {
        sendNotification(command->notificationKind, command->payload);
    }
    activateProfile(command->profileId, false);
}

void ProfileController::sendNotification(NotificationKind kind, const NotificationPayload &payload)
{
    if (!m_deps.notifier) {
        return;
    }
    if (m_deps.settings && !m_deps.settings->notificationsEnabled()) {
        qCDebug(audioprofilesNotify) << "Notifications disabled, not showing switch to" << payload.profileName;
        return;
    }
    m_deps.notifier->notify(kind, payload);
}

void ProfileController::onDeviceForgotten(const QString &deviceId, const QString &name)
{
    if (m_profiles->stripDevice(deviceId)) {
        qCInfo(audioprofilesCore) << "Removed device" << name << "from history and all profiles";
        syncActiveProfile();
    } else {
        qCInfo(audioprofilesCore) << "Removed device" << name << "from history";
    }
}

void ProfileController::syncActiveProfile()
{
    const auto active = m_activator->activeProfile();
    if (!active) {
        return;
    }
    if (const auto current = m_profiles->profile(active->id)) {
        m_activator->syncActiveProfile(*current);
    }
}

QList<AudioDevice> ProfileController::currentDevices() const
{
    return m_deps.enumerator ? m_deps.enumerator->listCurrentDevices() : QList<AudioDevice>();
}

QSet<QString> ProfileController::idSet(const QList<AudioDevice> &devices)
{
    QSet<QString> ids;
    for (const AudioDevice &device : devices) {
        ids.insert(device.id);
    }
    return ids;
}
