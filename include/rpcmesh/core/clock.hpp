// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace rpcmesh
{
namespace core
{

/// \brief Time source and delay primitive used by every component that
/// measures latency, schedules backoff or keeps day-bounded counters.
///
/// Monotonic time drives latency, blacklist expiry and connection age. Wall
/// time is only used to find the UTC day for budget accounting.
class Clock
{
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using WallTime = std::chrono::system_clock::time_point;

  virtual ~Clock() = default;

  virtual TimePoint now() const = 0;
  virtual WallTime wallNow() const = 0;

  /// \brief Block the calling thread for d (used by retry backoff).
  virtual void sleepFor(std::chrono::milliseconds d) = 0;
};

class SystemClock : public Clock
{
public:
  TimePoint now() const override { return std::chrono::steady_clock::now(); }

  WallTime wallNow() const override { return std::chrono::system_clock::now(); }

  void sleepFor(std::chrono::milliseconds d) override
  {
    if (d.count() > 0)
    {
      std::this_thread::sleep_for(d);
    }
  }

  /// \brief Shared process-wide instance used when no clock is injected.
  static std::shared_ptr<Clock> instance()
  {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
  }
};

/// \brief Days since the Unix epoch in UTC; changes exactly at UTC midnight.
inline std::int64_t utcDayIndex(Clock::WallTime t)
{
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  constexpr std::int64_t msPerDay = 24LL * 60 * 60 * 1000;
  return ms >= 0 ? ms / msPerDay : (ms - msPerDay + 1) / msPerDay;
}

/// \brief UTC midnight at or before t.
inline Clock::WallTime utcDayStart(Clock::WallTime t)
{
  return Clock::WallTime(std::chrono::duration_cast<Clock::WallTime::duration>(
      std::chrono::hours(24) * utcDayIndex(t)));
}

inline std::int64_t toMillis(Clock::TimePoint::duration d)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace core
} // namespace rpcmesh
