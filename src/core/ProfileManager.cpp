// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ProfileManager.h"
#include "DeviceHistoryManager.h"
#include "HotkeyManager.h"
#include "Logging.h"
#include "StateStore.h"

#include <algorithm>

namespace
{
QStringList uniqueIds(const QStringList &ids)
{
    QStringList result;
    for (const QString &id : ids) {
        if (!id.isEmpty() && !result.contains(id)) {
            result.append(id);
        }
    }
    return result;
}
}

ProfileManager::ProfileManager(StateStore *store, const DeviceHistoryManager *history, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_history(history)
{
}

ProfileManager::~ProfileManager() = default;

void ProfileManager::load(const QSet<QString> &connectedIds)
{
    QList<Profile> loaded = m_store ? m_store->loadProfiles() : QList<Profile>();

    // Clean up references to devices that expired while we were not running
    bool changed = false;
    for (Profile &profile : loaded) {
        Profile cleaned = cleanupInvalidDevices(profile, connectedIds);
        if (cleaned != profile) {
            profile = cleaned;
            changed = true;
        }
    }
    if (changed) {
        qCInfo(audioprofilesProfiles) << "Cleaned up invalid device references on profile load";
    }

    const bool hasSystemDefault = std::any_of(loaded.cbegin(), loaded.cend(), [](const Profile &p) {
        return p.isSystemDefault();
    });
    if (!hasSystemDefault) {
        qCWarning(audioprofilesProfiles) << "No System Default profile found, creating one";
        loaded.append(Profile::createSystemDefault());
    }

    m_profiles = withSystemDefaultFirst(loaded);

    // Reordering or dropping a duplicate System Default also counts as a change
    if (changed || !hasSystemDefault || m_profiles != loaded) {
        save();
    }

    qCInfo(audioprofilesProfiles) << "Loaded" << m_profiles.size() << "profiles";
    Q_EMIT profilesChanged();
}

std::optional<Profile> ProfileManager::profile(const QUuid &id) const
{
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_profiles.at(index);
}

std::optional<Profile> ProfileManager::systemDefault() const
{
    for (const Profile &p : m_profiles) {
        if (p.isSystemDefault()) {
            return p;
        }
    }
    return std::nullopt;
}

int ProfileManager::indexOf(const QUuid &id) const
{
    for (int i = 0; i < m_profiles.size(); ++i) {
        if (m_profiles.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

QString ProfileManager::validate(const Profile &profile) const
{
    if (profile.id.isNull()) {
        return QStringLiteral("Profile has no id");
    }

    const QString name = profile.name.trimmed();
    if (name.isEmpty()) {
        return QStringLiteral("Profile name cannot be empty");
    }

    const auto existing = this->profile(profile.id);
    if (existing && existing->isSystemDefault() && name != Profile::SYSTEM_DEFAULT_NAME) {
        return QStringLiteral("The System Default profile cannot be renamed");
    }

    if (profile.hotkey && !profile.hotkey->isValid()) {
        return QStringLiteral("Hotkey needs at least one modifier and a key");
    }

    for (const Profile &other : m_profiles) {
        if (other.id == profile.id) {
            continue;
        }
        if (other.name == name) {
            return QStringLiteral("A profile named '%1' already exists").arg(name);
        }
    }

    if (profile.hotkey) {
        if (const auto other = HotkeyManager::conflictingProfile(m_profiles, *profile.hotkey, profile.id)) {
            return QStringLiteral("Hotkey %1 is already used by '%2'").arg(profile.hotkey->toString(), other->name);
        }
    }

    return QString();
}

bool ProfileManager::upsert(const Profile &profile)
{
    const QString error = validate(profile);
    if (!error.isEmpty()) {
        qCWarning(audioprofilesProfiles) << "Rejected profile" << profile.name << ":" << error;
        Q_EMIT errorOccurred(error);
        return false;
    }

    const Profile clean = normalized(profile);
    const int index = indexOf(clean.id);
    if (index >= 0) {
        m_profiles[index] = clean;
    } else {
        m_profiles.append(clean);
    }
    m_profiles = withSystemDefaultFirst(m_profiles);

    save();
    qCInfo(audioprofilesProfiles) << (index >= 0 ? "Updated" : "Added") << "profile" << clean.name;
    Q_EMIT profilesChanged();
    return true;
}

bool ProfileManager::remove(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    if (m_profiles.at(index).isSystemDefault()) {
        Q_EMIT errorOccurred(QStringLiteral("The System Default profile cannot be deleted"));
        return false;
    }

    const QString name = m_profiles.at(index).name;
    m_profiles.removeAt(index);
    save();

    qCInfo(audioprofilesProfiles) << "Removed profile" << name;
    Q_EMIT profilesChanged();
    return true;
}

bool ProfileManager::move(int from, int to)
{
    const bool hasSystemDefault = !m_profiles.isEmpty() && m_profiles.first().isSystemDefault();
    const int offset = hasSystemDefault ? 1 : 0;
    const int userCount = m_profiles.size() - offset;

    // Indices relative to the user profiles that follow System Default
    const int source = from - offset;
    const int destination = to - offset;

    if (source < 0 || source >= userCount || destination < 0 || destination >= userCount || source == destination) {
        return false;
    }

    m_profiles.move(from, to);
    save();

    qCInfo(audioprofilesProfiles) << "Moved profile" << m_profiles.at(to).name << "from" << from << "to" << to;
    Q_EMIT profilesChanged();
    return true;
}

Profile ProfileManager::cleanupInvalidDevices(const Profile &profile, const QSet<QString> &connectedIds) const
{
    Profile cleaned = profile;
    cleaned.retainDevices([&](const QString &deviceId) {
        return connectedIds.contains(deviceId) || (m_history && m_history->contains(deviceId));
    });
    return cleaned;
}

bool ProfileManager::cleanupAll(const QSet<QString> &connectedIds)
{
    bool changed = false;
    for (Profile &profile : m_profiles) {
        Profile cleaned = cleanupInvalidDevices(profile, connectedIds);
        if (cleaned != profile) {
            profile = cleaned;
            changed = true;
        }
    }

    if (changed) {
        qCInfo(audioprofilesProfiles) << "Periodic cleanup removed invalid device references";
        save();
        Q_EMIT profilesChanged();
    }
    return changed;
}

bool ProfileManager::stripDevice(const QString &deviceId)
{
    bool changed = false;
    for (Profile &profile : m_profiles) {
        if (profile.removeDevice(deviceId)) {
            changed = true;
        }
    }

    if (changed) {
        qCInfo(audioprofilesProfiles) << "Removed device" << deviceId << "from all profiles";
        save();
        Q_EMIT profilesChanged();
    }
    return changed;
}

Profile ProfileManager::normalized(const Profile &profile)
{
    Profile p = profile;
    p.name = p.name.trimmed();
    if (p.iconName.isEmpty()) {
        p.iconName = Profile::DEFAULT_ICON;
    }
    p.triggerDeviceIds = uniqueIds(p.triggerDeviceIds);
    p.publicOutputPriority = uniqueIds(p.publicOutputPriority);
    p.publicInputPriority = uniqueIds(p.publicInputPriority);
    p.privateOutputPriority = uniqueIds(p.privateOutputPriority);
    p.privateInputPriority = uniqueIds(p.privateInputPriority);
    return p;
}

QList<Profile> ProfileManager::withSystemDefaultFirst(const QList<Profile> &profiles)
{
    QList<Profile> result;
    result.reserve(profiles.size());

    // Only the first System Default survives, duplicates would break the invariant
    bool seenSystemDefault = false;
    for (const Profile &p : profiles) {
        if (p.isSystemDefault()) {
            if (seenSystemDefault) {
                qCWarning(audioprofilesProfiles) << "Dropping duplicate System Default profile" << p.id;
                continue;
            }
            seenSystemDefault = true;
            result.prepend(p);
        } else {
            result.append(p);
        }
    }
    return result;
}

bool ProfileManager::save()
{
    if (!m_store) {
        return true;
    }
    if (!m_store->saveProfiles(m_profiles)) {
        qCWarning(audioprofilesProfiles) << "Failed to save profiles";
        Q_EMIT errorOccurred(QStringLiteral("Failed to save profiles"));
        return false;
    }
    return true;
}
