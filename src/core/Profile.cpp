// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "Profile.h"
#include "Logging.h"

#include <QJsonArray>

const QString Profile::SYSTEM_DEFAULT_NAME = QStringLiteral("System Default");
const QString Profile::DEFAULT_ICON = QStringLiteral("audio-speakers");

QString profileModeToString(ProfileMode mode)
{
    return mode == ProfileMode::Private ? QStringLiteral("private") : QStringLiteral("public");
}

ProfileMode profileModeFromString(const QString &value, ProfileMode fallback)
{
    const QString lower = value.toLower();
    if (lower == QLatin1String("public")) {
        return ProfileMode::Public;
    }
    if (lower == QLatin1String("private")) {
        return ProfileMode::Private;
    }
    return fallback;
}

static QJsonArray toJsonArray(const QStringList &list)
{
    return QJsonArray::fromStringList(list);
}

static QStringList toStringList(const QJsonValue &value)
{
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        const QString id = item.toString();
        if (!id.isEmpty() && !result.contains(id)) {
            result.append(id);
        }
    }
    return result;
}

bool Profile::referencesDevice(const QString &deviceId) const
{
    return triggerDeviceIds.contains(deviceId)
        || publicOutputPriority.contains(deviceId)
        || publicInputPriority.contains(deviceId)
        || privateOutputPriority.contains(deviceId)
        || privateInputPriority.contains(deviceId);
}

bool Profile::removeDevice(const QString &deviceId)
{
    return retainDevices([&deviceId](const QString &id) { return id != deviceId; });
}

bool Profile::retainDevices(const std::function<bool(const QString &)> &keep)
{
    bool changed = false;
    for (QStringList *list : {&triggerDeviceIds, &publicOutputPriority, &publicInputPriority,
                              &privateOutputPriority, &privateInputPriority}) {
        const qsizetype removed = list->removeIf([&keep](const QString &id) { return !keep(id); });
        changed = changed || removed > 0;
    }
    return changed;
}

bool Profile::operator==(const Profile &other) const
{
    return id == other.id
        && name == other.name
        && iconName == other.iconName
        && triggerDeviceIds == other.triggerDeviceIds
        && publicOutputPriority == other.publicOutputPriority
        && publicInputPriority == other.publicInputPriority
        && privateOutputPriority == other.privateOutputPriority
        && privateInputPriority == other.privateInputPriority
        && hotkey == other.hotkey
        && preferredMode == other.preferredMode;
}

Profile Profile::createNew(const QString &name)
{
    Profile profile;
    profile.id = QUuid::createUuid();
    profile.name = name;
    profile.iconName = DEFAULT_ICON;
    profile.preferredMode = ProfileMode::Public;
    return profile;
}

Profile Profile::createSystemDefault()
{
    return createNew(SYSTEM_DEFAULT_NAME);
}

QJsonObject Profile::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id.toString(QUuid::WithoutBraces);
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("iconName")] = iconName;
    obj[QStringLiteral("triggerDeviceIDs")] = toJsonArray(triggerDeviceIds);
    obj[QStringLiteral("publicOutputPriority")] = toJsonArray(publicOutputPriority);
    obj[QStringLiteral("publicInputPriority")] = toJsonArray(publicInputPriority);
    obj[QStringLiteral("privateOutputPriority")] = toJsonArray(privateOutputPriority);
    obj[QStringLiteral("privateInputPriority")] = toJsonArray(privateInputPriority);
    if (hotkey) {
        obj[QStringLiteral("hotkey")] = hotkey->toJson();
    }
    obj[QStringLiteral("preferredMode")] = profileModeToString(preferredMode);
    return obj;
}

std::optional<Profile> Profile::fromJson(const QJsonObject &obj, int schemaVersion)
{
    Profile profile;
    profile.id = QUuid::fromString(obj[QStringLiteral("id")].toString());
    profile.name = obj[QStringLiteral("name")].toString().trimmed();

    if (profile.id.isNull() || profile.name.isEmpty()) {
        qCWarning(audioprofilesProfiles) << "Skipping profile without valid id or name:"
                                         << obj[QStringLiteral("name")].toString();
        return std::nullopt;
    }

    // Fields present in every schema version; missing lists decode as empty
    profile.triggerDeviceIds = toStringList(obj[QStringLiteral("triggerDeviceIDs")]);
    profile.publicOutputPriority = toStringList(obj[QStringLiteral("publicOutputPriority")]);
    profile.publicInputPriority = toStringList(obj[QStringLiteral("publicInputPriority")]);
    profile.privateOutputPriority = toStringList(obj[QStringLiteral("privateOutputPriority")]);
    profile.privateInputPriority = toStringList(obj[QStringLiteral("privateInputPriority")]);

    profile.iconName = obj[QStringLiteral("iconName")].toString();
    if (profile.iconName.isEmpty()) {
        profile.iconName = DEFAULT_ICON;
    }

    if (obj.contains(QStringLiteral("hotkey")) && obj[QStringLiteral("hotkey")].isObject()) {
        const Hotkey hotkey = Hotkey::fromJson(obj[QStringLiteral("hotkey")].toObject());
        if (hotkey.isValid()) {
            profile.hotkey = hotkey;
        } else {
            qCWarning(audioprofilesProfiles) << "Dropping invalid hotkey of profile" << profile.name;
        }
    }

    // preferredMode was introduced with schema version 2; older profiles are public
    if (obj.contains(QStringLiteral("preferredMode"))) {
        profile.preferredMode = profileModeFromString(obj[QStringLiteral("preferredMode")].toString());
    } else {
        if (schemaVersion >= 2) {
            qCDebug(audioprofilesProfiles) << "Profile" << profile.name << "has no preferredMode, using public";
        }
        profile.preferredMode = ProfileMode::Public;
    }

    return profile;
}
