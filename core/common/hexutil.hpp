/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace auditsync::common {

  /**
   * @brief Converts bytes to lowercase hex representation without prefix
   * @param bytes to convert
   * @return hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

}  // namespace auditsync::common
