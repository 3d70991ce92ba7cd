/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {
  /// Errors of test doubles which are unrelated to any module error
  enum class DummyError : uint8_t { ERROR = 1, ERROR_2, ERROR_3 };
}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, DummyError);

inline OUTCOME_CPP_DEFINE_CATEGORY(testutil, DummyError, e) {
  using testutil::DummyError;
  switch (e) {
    case DummyError::ERROR:
      return "dummy error";
    case DummyError::ERROR_2:
      return "second dummy error";
    case DummyError::ERROR_3:
      return "third dummy error";
  }
  return "unknown testutil::DummyError";
}
