/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(auditsync::application, ConfigReaderError, e) {
  using E = auditsync::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "Config file is not valid JSON";
    case E::INVALID_VALUE:
      return "A config entry holds a value out of its range";
  }
  return "Unknown error";
}
