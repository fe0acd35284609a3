/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "tokcheck/util/error.h"
#include "tokcheck/util/string_util.h"
#include <string>
#include <unordered_map>

namespace std {
template <> struct hash<tokcheck::ErrorCode> {
  size_t operator()(const tokcheck::ErrorCode &t) const { return size_t(t); }
};
} // namespace std

namespace tokcheck {

#define ERROR_CODE_CUSTOM "Custom"
#define ERROR_CODE_ASSERT_FAILED "Assert failed"
#define ERROR_CODE_INVALID_TYPE "Invalid type"
#define ERROR_CODE_INVALID_VALUE "Invalid value"
#define ERROR_CODE_INVALID_LENGTH "Invalid length"
#define ERROR_CODE_UNKNOWN_VARIANT "Unknown variant"
#define ERROR_CODE_UNKNOWN_FIELD "Unknown field"
#define ERROR_CODE_MISSING_FIELD "Missing field"
#define ERROR_CODE_DUPLICATE_FIELD "Duplicate field"

Error Error::unknown_variant(std::string_view variant,
                             const std::vector<std::string_view> &expected) {
  std::string msg = "unknown variant `" + std::string(variant) + "`, ";
  if (expected.empty()) {
    msg += "there are no variants";
  } else {
    msg += "expected " + one_of(expected);
  }
  return Error(ErrorCode::UnknownVariant, std::move(msg));
}

Error Error::unknown_field(std::string_view field,
                           const std::vector<std::string_view> &expected) {
  std::string msg = "unknown field `" + std::string(field) + "`, ";
  if (expected.empty()) {
    msg += "there are no fields";
  } else {
    msg += "expected " + one_of(expected);
  }
  return Error(ErrorCode::UnknownField, std::move(msg));
}

std::string Error::to_string() const {
  std::string result = code_as_string();
  if (!state_->msg_.empty()) {
    result += ": ";
    result += state_->msg_;
  }
  return result;
}

std::string Error::code_as_string() const {
  static std::unordered_map<ErrorCode, std::string> code_to_str = {
      {ErrorCode::Custom, ERROR_CODE_CUSTOM},
      {ErrorCode::AssertFailed, ERROR_CODE_ASSERT_FAILED},
      {ErrorCode::InvalidType, ERROR_CODE_INVALID_TYPE},
      {ErrorCode::InvalidValue, ERROR_CODE_INVALID_VALUE},
      {ErrorCode::InvalidLength, ERROR_CODE_INVALID_LENGTH},
      {ErrorCode::UnknownVariant, ERROR_CODE_UNKNOWN_VARIANT},
      {ErrorCode::UnknownField, ERROR_CODE_UNKNOWN_FIELD},
      {ErrorCode::MissingField, ERROR_CODE_MISSING_FIELD},
      {ErrorCode::DuplicateField, ERROR_CODE_DUPLICATE_FIELD},
  };

  auto it = code_to_str.find(state_->code_);
  if (it == code_to_str.end()) {
    return ERROR_CODE_CUSTOM;
  }
  return it->second;
}

} // namespace tokcheck
