// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ProfilesDBusAdaptor.h"
#include "DeviceHistoryManager.h"
#include "Logging.h"
#include "ProfileController.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUuid>

const QString ProfilesDBusAdaptor::SERVICE_NAME = QStringLiteral("io.github.audioprofiles");
const QString ProfilesDBusAdaptor::OBJECT_PATH = QStringLiteral("/AudioProfiles");

ProfilesDBusAdaptor::ProfilesDBusAdaptor(ProfileController *controller, QObject *parent)
    : QObject(parent)
    , m_controller(controller)
{
    connect(m_controller, &ProfileController::activeProfileChanged, this, [this]() {
        const auto active = m_controller->activeProfile();
        Q_EMIT ActiveProfileChanged(active ? active->id.toString(QUuid::WithoutBraces) : QString(),
                                    active ? active->name : QString());
    });

    auto emitAutoSwitching = [this]() {
        Q_EMIT AutoSwitchingChanged(m_controller->isAutoSwitchingDisabled(), m_controller->remainingDisableTime());
    };
    connect(m_controller, &ProfileController::autoSwitchingChanged, this, emitAutoSwitching);
    connect(m_controller, &ProfileController::remainingDisableTimeChanged, this, emitAutoSwitching);
}

ProfilesDBusAdaptor::~ProfilesDBusAdaptor() = default;

QString ProfilesDBusAdaptor::Version()
{
    return QCoreApplication::applicationVersion();
}

QString ProfilesDBusAdaptor::ListProfiles()
{
    const auto active = m_controller->activeProfile();

    QJsonArray array;
    for (const Profile &profile : m_controller->profiles()) {
        QJsonObject obj = profile.toJson();
        obj[QStringLiteral("active")] = active && active->id == profile.id;
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

QString ProfilesDBusAdaptor::ActiveProfile()
{
    const auto active = m_controller->activeProfile();
    return active ? active->id.toString(QUuid::WithoutBraces) : QString();
}

QString ProfilesDBusAdaptor::ActiveMode()
{
    return profileModeToString(m_controller->activeMode());
}

bool ProfilesDBusAdaptor::ActivateProfile(const QString &id)
{
    const QUuid uuid = QUuid::fromString(id);
    if (uuid.isNull() || !m_controller->activateProfile(uuid, true)) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Unknown profile: %1").arg(id));
        return false;
    }
    return true;
}

void ProfilesDBusAdaptor::ToggleMode()
{
    m_controller->toggleMode();
}

QString ProfilesDBusAdaptor::UpsertProfile(const QString &json)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Invalid profile JSON: %1").arg(error.errorString()));
        return QString();
    }

    QJsonObject obj = doc.object();
    if (QUuid::fromString(obj[QStringLiteral("id")].toString()).isNull()) {
        obj[QStringLiteral("id")] = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    // Hotkeys are validated by the controller, not silently dropped
    const QJsonValue hotkeyValue = obj[QStringLiteral("hotkey")];
    if (hotkeyValue.isObject() && !Hotkey::fromJson(hotkeyValue.toObject()).isValid()) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Hotkey needs at least one modifier and a key"));
        return QString();
    }

    const auto profile = Profile::fromJson(obj, Profile::SCHEMA_VERSION);
    if (!profile) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Profile needs a name"));
        return QString();
    }

    // Capture the validation message of a rejected profile
    QString rejection;
    const auto connection = connect(m_controller, &ProfileController::errorOccurred, this,
                                    [&rejection](const QString &message) {
                                        rejection = message;
                                    });
    const bool ok = m_controller->upsertProfile(*profile);
    disconnect(connection);

    if (!ok) {
        fail(QDBusError::InvalidArgs, rejection.isEmpty() ? QStringLiteral("Profile rejected") : rejection);
        return QString();
    }
    return profile->id.toString(QUuid::WithoutBraces);
}

bool ProfilesDBusAdaptor::RemoveProfile(const QString &id)
{
    const QUuid uuid = QUuid::fromString(id);
    if (uuid.isNull() || !m_controller->removeProfile(uuid)) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Cannot remove profile: %1").arg(id));
        return false;
    }
    return true;
}

bool ProfilesDBusAdaptor::MoveProfile(int from, int to)
{
    if (!m_controller->moveProfile(from, to)) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Cannot move profile from %1 to %2").arg(from).arg(to));
        return false;
    }
    return true;
}

bool ProfilesDBusAdaptor::DisableAutoSwitching(const QString &kind, int hours)
{
    if (kind == QLatin1String("hours")) {
        if (hours <= 0) {
            fail(QDBusError::InvalidArgs, QStringLiteral("Hours must be positive"));
            return false;
        }
        m_controller->disableAutoSwitching(DisableDuration::forHours(hours));
    } else if (kind == QLatin1String("endOfDay")) {
        m_controller->disableAutoSwitching(DisableDuration::untilEndOfDay());
    } else if (kind == QLatin1String("forever")) {
        m_controller->disableAutoSwitching(DisableDuration::forever());
    } else {
        fail(QDBusError::InvalidArgs, QStringLiteral("Unknown duration kind: %1").arg(kind));
        return false;
    }
    return true;
}

void ProfilesDBusAdaptor::EnableAutoSwitching()
{
    m_controller->enableAutoSwitching();
}

void ProfilesDBusAdaptor::TriggerAutoDetection()
{
    m_controller->triggerAutoDetection();
}

bool ProfilesDBusAdaptor::ForgetDevice(const QString &deviceId)
{
    if (!m_controller->forgetDevice(deviceId)) {
        fail(QDBusError::InvalidArgs, QStringLiteral("Unknown device: %1").arg(deviceId));
        return false;
    }
    return true;
}

QString ProfilesDBusAdaptor::KnownDevices()
{
    const DeviceHistoryManager *history = m_controller->history();

    QJsonArray array;
    for (const AudioDevice &device : m_controller->knownDevices()) {
        QJsonObject obj = device.toJson();
        const auto entry = history->entry(device.id);
        obj[QStringLiteral("connected")] = entry ? entry->isCurrentlyActive : true;
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

QVariantMap ProfilesDBusAdaptor::AutoSwitchingStatus()
{
    const auto until = m_controller->autoSwitchingDisabledUntil();

    QVariantMap status;
    status[QStringLiteral("disabled")] = m_controller->isAutoSwitchingDisabled();
    status[QStringLiteral("until")] = until ? until->toString(Qt::ISODate) : QString();
    status[QStringLiteral("remaining")] = m_controller->remainingDisableTime();
    return status;
}

void ProfilesDBusAdaptor::fail(QDBusError::ErrorType type, const QString &message)
{
    qCWarning(audioprofilesDBus) << message;
    if (calledFromDBus()) {
        sendErrorReply(type, message);
    }
}
