// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "DeviceHistoryManager.h"
#include "Logging.h"
#include "StateStore.h"

#include <QSet>

#include <algorithm>

DeviceHistoryManager::DeviceHistoryManager(StateStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

DeviceHistoryManager::~DeviceHistoryManager() = default;

void DeviceHistoryManager::load()
{
    m_entries.clear();
    if (m_store) {
        m_entries = m_store->loadHistory();
    }
    qCDebug(audioprofilesHistory) << "Loaded" << m_entries.size() << "devices from history";

    // Clean up devices that expired while we were not running
    cleanup();
    Q_EMIT historyChanged();
}

void DeviceHistoryManager::update(const QList<AudioDevice> &currentDevices)
{
    const QDateTime now = m_clock();

    QSet<QString> currentIds;
    for (const AudioDevice &device : currentDevices) {
        currentIds.insert(device.id);
    }

    // Phase 1: mark existing entries
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        const bool present = currentIds.contains(it.key());
        it->isCurrentlyActive = present;
        if (present) {
            it->lastSeen = now;
        }
    }

    // Phase 2: add new devices, refresh metadata of known ones
    for (const AudioDevice &device : currentDevices) {
        if (device.id.isEmpty()) {
            continue;
        }

        auto it = m_entries.find(device.id);
        if (it == m_entries.end()) {
            qCDebug(audioprofilesHistory) << "New device:" << device.name << device.id;
            m_entries.insert(device.id, DeviceHistoryEntry{device, now, true});
        } else {
            it->device = device;
            it->lastSeen = now;
            it->isCurrentlyActive = true;
        }
    }

    prune();
    save();
    Q_EMIT historyChanged();
}

QList<AudioDevice> DeviceHistoryManager::previouslySeen(const QList<AudioDevice> &excluding) const
{
    QSet<QString> excludedIds;
    for (const AudioDevice &device : excluding) {
        excludedIds.insert(device.id);
    }

    const QDateTime limit = cutoff();
    QList<AudioDevice> result;
    for (const DeviceHistoryEntry &entry : m_entries) {
        if (entry.isCurrentlyActive || excludedIds.contains(entry.device.id)) {
            continue;
        }
        if (entry.lastSeen < limit) {
            continue;
        }
        result.append(entry.device);
    }

    std::sort(result.begin(), result.end(), [](const AudioDevice &a, const AudioDevice &b) {
        return a.name < b.name;
    });
    return result;
}

std::optional<AudioDevice> DeviceHistoryManager::device(const QString &id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    return it->device;
}

std::optional<DeviceHistoryEntry> DeviceHistoryManager::entry(const QString &id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

bool DeviceHistoryManager::remove(const QString &id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }

    const QString name = it->device.name;
    m_entries.erase(it);
    save();

    qCInfo(audioprofilesHistory) << "Removed device from history:" << name;
    Q_EMIT deviceRemoved(id, name);
    Q_EMIT historyChanged();
    return true;
}

int DeviceHistoryManager::prune()
{
    const QDateTime limit = cutoff();
    const qsizetype removed = m_entries.removeIf([&limit](const QHash<QString, DeviceHistoryEntry>::iterator it) {
        return it->lastSeen < limit;
    });

    if (removed > 0) {
        qCInfo(audioprofilesHistory) << "Pruned" << removed << "expired devices from history";
    }
    return static_cast<int>(removed);
}

int DeviceHistoryManager::cleanup()
{
    const int removed = prune();
    if (removed > 0) {
        save();
        Q_EMIT historyChanged();
    }
    return removed;
}

void DeviceHistoryManager::setRetentionDays(int days)
{
    m_retentionDays = qMax(1, days);
}

QDateTime DeviceHistoryManager::cutoff() const
{
    return m_clock().addDays(-m_retentionDays);
}

void DeviceHistoryManager::save()
{
    if (!m_store) {
        return;
    }
    if (!m_store->saveHistory(m_entries)) {
        qCWarning(audioprofilesHistory) << "Failed to save device history";
    }
}
