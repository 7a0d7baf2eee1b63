/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/message_codec.hpp"

#include <scale/scale.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::sync, MessageCodecError, e) {
  using E = auditsync::sync::MessageCodecError;
  switch (e) {
    case E::MALFORMED_MESSAGE:
      return "Malformed sync message";
    case E::TRAILING_BYTES:
      return "Unexpected bytes after sync message";
    case E::ENCODE_FAILED:
      return "Sync message could not be encoded";
  }
  return "Unknown MessageCodecError";
}

namespace auditsync::sync {

  MessageCodec::MessageCodec()
      : log_{log::createLogger("MessageCodec", "message_codec")} {}

  outcome::result<std::vector<uint8_t>> MessageCodec::encode(
      const SyncMessage &message) const {
    auto res = scale::encode(message);
    if (res.has_error()) {
      SL_ERROR(log_,
               "Can't encode {}: {}",
               messageName(message),
               res.error().message());
      return MessageCodecError::ENCODE_FAILED;
    }
    SL_TRACE(log_,
             "Encoded {} into {} bytes",
             messageName(message),
             res.value().size());
    return std::move(res.value());
  }

  outcome::result<SyncMessage> MessageCodec::decode(
      std::span<const uint8_t> bytes) const {
    SyncMessage message;
    scale::ScaleDecoderStream s(bytes);
    try {
      s >> message;
    } catch (std::system_error &e) {
      SL_DEBUG(log_,
               "Can't decode sync message of {} bytes: {}",
               bytes.size(),
               e.code().message());
      return MessageCodecError::MALFORMED_MESSAGE;
    }
    // Check whether the whole byte buffer was consumed
    if (s.hasMore(1)) {
      SL_DEBUG(log_,
               "Sync message {} is followed by unread bytes",
               messageName(message));
      return MessageCodecError::TRAILING_BYTES;
    }
    return message;
  }

}  // namespace auditsync::sync
