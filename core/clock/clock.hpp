/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace auditsync::clock {

  /**
   * An interface for a clock
   * @tparam ClockType is an underlying clock type, such as
   * std::chrono::system_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    virtual TimePoint now() const = 0;
  };

  /**
   * Wall clock. Watermarks and record timestamps are compared against it, so
   * it is the only clock the sync protocol needs.
   */
  using SystemClock = Clock<std::chrono::system_clock>;

}  // namespace auditsync::clock
