// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Clock.h"

#include <QDateTime>
#include <QObject>
#include <QString>

#include <optional>

class QTimer;

/**
 * @brief How long automatic switching stays suspended
 */
struct DisableDuration {
    enum class Kind {
        Hours,
        EndOfDay,
        Forever
    };

    Kind kind = Kind::Forever;
    int hours = 0;

    static DisableDuration forHours(int count) { return {Kind::Hours, count}; }
    static DisableDuration untilEndOfDay() { return {Kind::EndOfDay, 0}; }
    static DisableDuration forever() { return {Kind::Forever, 0}; }
};

/**
 * @brief Timed suspension of automatic profile switching
 *
 * States are Enabled, DisabledForever and DisabledUntil(end). A one-shot
 * timer re-enables at the end time and a 60 second timer refreshes the
 * remaining-time text. Both timers are replaced on every disable() and
 * stopped by enable().
 */
class AutoSwitchingController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool disabled READ isDisabled NOTIFY stateChanged)
    Q_PROPERTY(QString remainingTime READ remainingTime NOTIFY remainingTimeChanged)

public:
    static constexpr int COUNTDOWN_INTERVAL_MS = 60 * 1000;

    explicit AutoSwitchingController(QObject *parent = nullptr);
    ~AutoSwitchingController() override;

    bool isDisabled() const { return m_disabled; }

    /**
     * @return End of the suspension, std::nullopt when enabled or disabled forever
     */
    std::optional<QDateTime> disabledUntil() const { return m_disabledUntil; }

    /**
     * @return "Xh Ym" or "Ym", empty when enabled or disabled forever
     */
    QString remainingTime() const { return m_remainingTime; }

    /**
     * @brief Suspend automatic switching
     *
     * Replaces any previous suspension and its timers.
     */
    void disable(const DisableDuration &duration);

    /**
     * @brief End the suspension and request a forced re-evaluation
     *
     * Emits reEnabled() even when automatic switching was not disabled.
     */
    void enable();

    /**
     * @brief Recompute the remaining-time text, re-enabling if the end has passed
     */
    void updateRemainingTime();

    /**
     * @brief Whether a re-enable or countdown timer is pending
     */
    bool hasPendingTimers() const;

    void setClock(Clock clock) { m_clock = std::move(clock); }

    /**
     * @brief Format a duration in seconds the way remainingTime() does
     */
    static QString formatRemaining(qint64 seconds);

Q_SIGNALS:
    void stateChanged(bool disabled);
    void remainingTimeChanged(const QString &remaining);

    /**
     * @brief Emitted by enable(); device state may have changed meanwhile
     */
    void reEnabled();

private Q_SLOTS:
    void onDeadlineReached();

private:
    void stopTimers();
    void armDeadline();
    void setRemainingTime(const QString &text);

    Clock m_clock = systemClock();
    bool m_disabled = false;
    std::optional<QDateTime> m_disabledUntil;
    QString m_remainingTime;

    QTimer *m_enableTimer = nullptr;
    QTimer *m_countdownTimer = nullptr;
};
