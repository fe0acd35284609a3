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

#pragma once

#include "tokcheck/model/decoder.h"
#include "absl/container/flat_hash_map.h"
#include <cstddef>
#include <optional>
#include <string_view>

namespace tokcheck {
namespace model {

/// The declared field names of a record, or variant names of an enum, in
/// declaration order, with a hash index for lookups by name.
///
/// The names are borrowed; string literals are the usual source.
class FieldSet {
public:
  enum class Kind { Fields, Variants };

  static FieldSet fields(NameList names) {
    return FieldSet(Kind::Fields, std::move(names));
  }

  static FieldSet variants(NameList names) {
    return FieldSet(Kind::Variants, std::move(names));
  }

  Kind kind() const { return kind_; }
  const NameList &names() const { return names_; }
  size_t size() const { return names_.size(); }
  std::string_view name(size_t index) const { return names_[index]; }

  std::optional<size_t> find(std::string_view name) const;

  /// Position of `name`, or an unknown_field / unknown_variant error listing
  /// the declared names.
  Result<size_t, Error> index_of(std::string_view name) const;

  /// Position for a numeric tag, or an invalid_value error when it is out of
  /// range.
  Result<size_t, Error> index_at(uint64_t index) const;

private:
  FieldSet(Kind kind, NameList names);

  Kind kind_;
  NameList names_;
  absl::flat_hash_map<std::string_view, size_t> index_;
};

/// Decoding target for a record key or enum tag.
///
/// A tag is accepted as a name (any string or bytes flavor) or as a numeric
/// index. Unknown names fail unless `ignore_unknown` is set, in which case
/// index() stays empty and the caller skips the value. Unknown variants always
/// fail.
///
/// Decode it in place, since the set is part of the target:
///
/// ```cpp
/// Identifier key(kFields);
/// TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
/// ```
class Identifier {
public:
  explicit Identifier(const FieldSet &set, bool ignore_unknown = false)
      : set_(&set), ignore_unknown_(ignore_unknown) {}

  const FieldSet &set() const { return *set_; }
  bool ignore_unknown() const { return ignore_unknown_; }

  const std::optional<size_t> &index() const { return index_; }
  void set_index(std::optional<size_t> index) { index_ = index; }

private:
  const FieldSet *set_;
  bool ignore_unknown_;
  std::optional<size_t> index_;
};

template <> struct Codec<Identifier> {
  static Result<void, Error> decode_in_place(Decoder &decoder,
                                             Identifier &place);
};

} // namespace model
} // namespace tokcheck
