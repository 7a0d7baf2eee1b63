/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace auditsync::primitives {

  /**
   * Identity of a replica participating in audit log synchronization.
   * Compared by value; one identity per running participant.
   */
  class NodeId {
   public:
    NodeId() = default;

    explicit NodeId(std::string id) : id_{std::move(id)} {}

    const std::string &toString() const {
      return id_;
    }

    /// An empty identity never names a valid participant
    bool empty() const {
      return id_.empty();
    }

    bool operator==(const NodeId &other) const = default;
    auto operator<=>(const NodeId &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const NodeId &v) {
      return s << v.id_;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, NodeId &v) {
      return s >> v.id_;
    }

   private:
    std::string id_;
  };

}  // namespace auditsync::primitives

template <>
struct std::hash<auditsync::primitives::NodeId> {
  size_t operator()(const auditsync::primitives::NodeId &node_id) const {
    return std::hash<std::string>()(node_id.toString());
  }
};

template <>
struct fmt::formatter<auditsync::primitives::NodeId>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const auditsync::primitives::NodeId &node_id,
              FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(node_id.toString(), ctx);
  }
};
