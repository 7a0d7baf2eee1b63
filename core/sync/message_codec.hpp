/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "sync/sync_message.hpp"

namespace auditsync::sync {

  enum class MessageCodecError : uint8_t {
    /// bytes do not form a sync message
    MALFORMED_MESSAGE = 1,
    /// message is followed by unread bytes
    TRAILING_BYTES,
    /// message could not be serialized
    ENCODE_FAILED,
  };

  /**
   * SCALE framing of sync messages: variant index byte followed by the
   * fields of the held message
   */
  class MessageCodec {
   public:
    MessageCodec();

    outcome::result<std::vector<uint8_t>> encode(
        const SyncMessage &message) const;

    /// Decodes exactly one message, the whole buffer must be consumed
    outcome::result<SyncMessage> decode(std::span<const uint8_t> bytes) const;

   private:
    log::Logger log_;
  };

}  // namespace auditsync::sync

OUTCOME_HPP_DECLARE_ERROR(auditsync::sync, MessageCodecError);
