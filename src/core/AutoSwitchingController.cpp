// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "AutoSwitchingController.h"
#include "Logging.h"

#include <QTimer>

#include <limits>

AutoSwitchingController::AutoSwitchingController(QObject *parent)
    : QObject(parent)
    , m_enableTimer(new QTimer(this))
    , m_countdownTimer(new QTimer(this))
{
    m_enableTimer->setSingleShot(true);
    connect(m_enableTimer, &QTimer::timeout, this, &AutoSwitchingController::onDeadlineReached);

    m_countdownTimer->setInterval(COUNTDOWN_INTERVAL_MS);
    connect(m_countdownTimer, &QTimer::timeout, this, &AutoSwitchingController::updateRemainingTime);
}

AutoSwitchingController::~AutoSwitchingController() = default;

void AutoSwitchingController::disable(const DisableDuration &duration)
{
    const QDateTime now = m_clock();

    std::optional<QDateTime> end;
    switch (duration.kind) {
    case DisableDuration::Kind::Hours:
        end = now.addSecs(qint64(qMax(0, duration.hours)) * 3600);
        break;
    case DisableDuration::Kind::EndOfDay:
        end = now.toLocalTime().date().addDays(1).startOfDay();
        break;
    case DisableDuration::Kind::Forever:
        break;
    }

    if (end && now.secsTo(*end) <= 0) {
        // Zero-length suspension ends right away
        qCInfo(audioprofilesTriggers) << "Auto-switching disable period already elapsed";
        enable();
        return;
    }

    stopTimers();

    const bool wasDisabled = m_disabled;
    m_disabled = true;
    m_disabledUntil = end;

    if (end) {
        armDeadline();
        m_countdownTimer->start();
        updateRemainingTime();
    } else {
        setRemainingTime(QString());
    }

    qCInfo(audioprofilesTriggers) << "Auto-switching disabled until:"
                                  << (end ? end->toString(Qt::ISODate) : QStringLiteral("forever"));

    if (!wasDisabled) {
        Q_EMIT stateChanged(true);
    }
}

void AutoSwitchingController::enable()
{
    stopTimers();

    const bool wasDisabled = m_disabled;
    m_disabled = false;
    m_disabledUntil.reset();
    setRemainingTime(QString());

    if (wasDisabled) {
        qCInfo(audioprofilesTriggers) << "Auto-switching re-enabled";
        Q_EMIT stateChanged(false);
    }
    Q_EMIT reEnabled();
}

void AutoSwitchingController::updateRemainingTime()
{
    if (!m_disabled || !m_disabledUntil) {
        setRemainingTime(QString());
        return;
    }

    const qint64 seconds = m_clock().secsTo(*m_disabledUntil);
    if (seconds <= 0) {
        enable();
        return;
    }

    setRemainingTime(formatRemaining(seconds));
}

bool AutoSwitchingController::hasPendingTimers() const
{
    return m_enableTimer->isActive() || m_countdownTimer->isActive();
}

QString AutoSwitchingController::formatRemaining(qint64 seconds)
{
    const qint64 hours = seconds / 3600;
    const qint64 minutes = (seconds % 3600) / 60;

    if (hours > 0) {
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    }
    return QStringLiteral("%1m").arg(minutes);
}

void AutoSwitchingController::onDeadlineReached()
{
    if (!m_disabled || !m_disabledUntil) {
        return;
    }

    // Long suspensions exceed QTimer's range and are re-armed in steps
    if (m_clock().secsTo(*m_disabledUntil) > 0) {
        armDeadline();
        return;
    }
    enable();
}

void AutoSwitchingController::stopTimers()
{
    m_enableTimer->stop();
    m_countdownTimer->stop();
}

void AutoSwitchingController::armDeadline()
{
    const qint64 ms = m_clock().msecsTo(*m_disabledUntil);
    const qint64 capped = qBound<qint64>(0, ms, std::numeric_limits<int>::max());
    m_enableTimer->start(static_cast<int>(capped));
}

void AutoSwitchingController::setRemainingTime(const QString &text)
{
    if (m_remainingTime == text) {
        return;
    }
    m_remainingTime = text;
    Q_EMIT remainingTimeChanged(text);
}
