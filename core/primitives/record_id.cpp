/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/record_id.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::primitives, RecordIdError, e) {
  using E = auditsync::primitives::RecordIdError;
  switch (e) {
    case E::INVALID_FORMAT:
      return "Record id is not a valid UUID string";
  }
  return "Unknown RecordIdError";
}

namespace auditsync::primitives {

  RecordId RecordId::generate() {
    thread_local boost::uuids::random_generator generator;
    return RecordId{generator()};
  }

  outcome::result<RecordId> RecordId::fromString(std::string_view str) {
    if (str.size() != 36) {
      return RecordIdError::INVALID_FORMAT;
    }
    try {
      return RecordId{boost::uuids::string_generator()(str.begin(), str.end())};
    } catch (const std::runtime_error &) {
      return RecordIdError::INVALID_FORMAT;
    }
  }

  std::string RecordId::toString() const {
    return boost::uuids::to_string(uuid_);
  }

}  // namespace auditsync::primitives
