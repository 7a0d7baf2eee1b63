/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace auditsync::primitives {

  /// Wall-clock instant with the precision carried on the wire
  using Timestamp = std::chrono::
      time_point<std::chrono::system_clock, std::chrono::milliseconds>;

  inline Timestamp toTimestamp(std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
  }

  inline int64_t toUnixMillis(Timestamp ts) {
    return ts.time_since_epoch().count();
  }

  inline Timestamp fromUnixMillis(int64_t millis) {
    return Timestamp{std::chrono::milliseconds{millis}};
  }

}  // namespace auditsync::primitives
