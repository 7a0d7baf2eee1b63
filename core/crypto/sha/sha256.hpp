/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace auditsync::crypto {

  using Sha256Hash = std::array<uint8_t, 32>;

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Sha256Hash sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Sha256Hash sha256(std::span<const uint8_t> input);

}  // namespace auditsync::crypto
