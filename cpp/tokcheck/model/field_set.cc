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

#include "tokcheck/model/field_set.h"
#include <string>

namespace tokcheck {
namespace model {

FieldSet::FieldSet(Kind kind, NameList names)
    : kind_(kind), names_(std::move(names)) {
  index_.reserve(names_.size());
  for (size_t i = 0; i < names_.size(); ++i) {
    index_.emplace(names_[i], i);
  }
}

std::optional<size_t> FieldSet::find(std::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<size_t, Error> FieldSet::index_of(std::string_view name) const {
  auto index = find(name);
  if (index) {
    return *index;
  }
  if (kind_ == Kind::Fields) {
    return Unexpected(Error::unknown_field(name, names_));
  }
  return Unexpected(Error::unknown_variant(name, names_));
}

Result<size_t, Error> FieldSet::index_at(uint64_t index) const {
  if (index < names_.size()) {
    return static_cast<size_t>(index);
  }
  std::string what = kind_ == Kind::Fields ? "field" : "variant";
  return Unexpected(Error::invalid_value(
      "integer `" + std::to_string(index) + "`",
      what + " index 0 <= i < " + std::to_string(names_.size())));
}

namespace {

class IdentifierVisitor : public Visitor {
public:
  explicit IdentifierVisitor(Identifier &place) : place_(place) {}

  std::string expecting() const override {
    return place_.set().kind() == FieldSet::Kind::Fields
               ? "field identifier"
               : "variant identifier";
  }

  Result<void, Error> visit_u64(uint64_t v) override {
    auto index = place_.set().index_at(v);
    if (index.ok()) {
      place_.set_index(index.value());
      return Result<void, Error>();
    }
    if (accepts_unknown()) {
      place_.set_index(std::nullopt);
      return Result<void, Error>();
    }
    return Unexpected(std::move(index).error());
  }

  Result<void, Error> visit_str(std::string_view v) override {
    auto index = place_.set().index_of(v);
    if (index.ok()) {
      place_.set_index(index.value());
      return Result<void, Error>();
    }
    if (accepts_unknown()) {
      place_.set_index(std::nullopt);
      return Result<void, Error>();
    }
    return Unexpected(std::move(index).error());
  }

  Result<void, Error> visit_bytes(ByteView v) override {
    return visit_str(
        std::string_view(reinterpret_cast<const char *>(v.data()), v.size()));
  }

private:
  bool accepts_unknown() const {
    return place_.ignore_unknown() &&
           place_.set().kind() == FieldSet::Kind::Fields;
  }

  Identifier &place_;
};

} // namespace

Result<void, Error> Codec<Identifier>::decode_in_place(Decoder &decoder,
                                                       Identifier &place) {
  IdentifierVisitor visitor(place);
  return decoder.decode_identifier(visitor);
}

} // namespace model
} // namespace tokcheck
