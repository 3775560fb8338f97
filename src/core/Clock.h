// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QDateTime>

#include <functional>

/**
 * Time source used by every component that compares timestamps.
 * Tests replace it to drive retention windows and override checks.
 */
using Clock = std::function<QDateTime()>;

inline Clock systemClock()
{
    return [] { return QDateTime::currentDateTime(); };
}
