// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioDevice.h"
#include "Clock.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include <optional>

class StateStore;

/**
 * @brief Remembers every audio device seen within the retention window
 *
 * Each entry records when the device was last present and whether it is
 * present right now. Entries whose lastSeen is older than the retention
 * window (30 days by default) are pruned on load and after every update.
 * The history is persisted through the StateStore after each change.
 */
class DeviceHistoryManager : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_RETENTION_DAYS = 30;

    explicit DeviceHistoryManager(StateStore *store = nullptr, QObject *parent = nullptr);
    ~DeviceHistoryManager() override;

    /**
     * @brief Replace the in-memory history with the stored one, then prune
     */
    void load();

    /**
     * @brief Merge a snapshot of the currently present devices
     *
     * Existing entries are marked first (present ones get lastSeen = now),
     * then new devices are inserted and known ones get their metadata
     * refreshed. A device that vanished and came back between two snapshots
     * is never seen as inactive.
     */
    void update(const QList<AudioDevice> &currentDevices);

    /**
     * @brief Devices seen before but not present now, sorted by name
     * @param excluding Devices to leave out (usually the current ones)
     */
    QList<AudioDevice> previouslySeen(const QList<AudioDevice> &excluding) const;

    std::optional<AudioDevice> device(const QString &id) const;
    std::optional<DeviceHistoryEntry> entry(const QString &id) const;
    bool contains(const QString &id) const { return m_entries.contains(id); }
    int count() const { return m_entries.size(); }
    QHash<QString, DeviceHistoryEntry> entries() const { return m_entries; }

    /**
     * @brief Forget a device
     *
     * Emits deviceRemoved() so profile references can be stripped.
     * If the device shows up again it is tracked from scratch.
     *
     * @return false if the device was not in the history
     */
    bool remove(const QString &id);

    /**
     * @brief Drop entries older than the retention window
     *
     * Does not persist; see cleanup().
     *
     * @return Number of entries removed
     */
    int prune();

    /**
     * @brief prune() and persist if anything expired
     * @return Number of entries removed
     */
    int cleanup();

    int retentionDays() const { return m_retentionDays; }
    void setRetentionDays(int days);

    void setClock(Clock clock) { m_clock = std::move(clock); }

Q_SIGNALS:
    void historyChanged();
    void deviceRemoved(const QString &id, const QString &name);

private:
    QDateTime cutoff() const;
    void save();

    StateStore *m_store = nullptr;
    Clock m_clock = systemClock();
    int m_retentionDays = DEFAULT_RETENTION_DAYS;
    QHash<QString, DeviceHistoryEntry> m_entries;
};
