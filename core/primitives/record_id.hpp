/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <boost/functional/hash.hpp>
#include <boost/uuid/uuid.hpp>
#include <fmt/format.h>

#include "outcome/outcome.hpp"

namespace auditsync::primitives {

  enum class RecordIdError : uint8_t { INVALID_FORMAT = 1 };

  /**
   * UUID of an audit record, unique across all replicas
   */
  class RecordId {
   public:
    RecordId() = default;

    explicit RecordId(const boost::uuids::uuid &uuid) : uuid_{uuid} {}

    /// Fresh random (v4) identifier
    static RecordId generate();

    /// Parses canonical `8-4-4-4-12` hex form
    static outcome::result<RecordId> fromString(std::string_view str);

    std::string toString() const;

    bool isNil() const {
      return uuid_.is_nil();
    }

    const boost::uuids::uuid &uuid() const {
      return uuid_;
    }

    bool operator==(const RecordId &other) const {
      return uuid_ == other.uuid_;
    }

    bool operator<(const RecordId &other) const {
      return uuid_ < other.uuid_;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const RecordId &v) {
      std::array<uint8_t, boost::uuids::uuid::static_size()> bytes{};
      std::copy(v.uuid_.begin(), v.uuid_.end(), bytes.begin());
      return s << bytes;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, RecordId &v) {
      std::array<uint8_t, boost::uuids::uuid::static_size()> bytes{};
      s >> bytes;
      std::copy(bytes.begin(), bytes.end(), v.uuid_.begin());
      return s;
    }

   private:
    boost::uuids::uuid uuid_{};
  };

}  // namespace auditsync::primitives

OUTCOME_HPP_DECLARE_ERROR(auditsync::primitives, RecordIdError);

template <>
struct std::hash<auditsync::primitives::RecordId> {
  size_t operator()(const auditsync::primitives::RecordId &id) const {
    return boost::hash<boost::uuids::uuid>()(id.uuid());
  }
};

template <>
struct fmt::formatter<auditsync::primitives::RecordId>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const auditsync::primitives::RecordId &id,
              FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(id.toString(), ctx);
  }
};
