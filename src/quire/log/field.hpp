/* Quire
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "quire/log/log_fwd.hpp"
#include <variant>
#include <vector>
#include <utility>
#include <initializer_list>
#include <algorithm>
#include <cstdint>

namespace quire::log
{

// Types.

/**
 * Value of one structured field: null, boolean, integer, floating point or string.  These are exactly the
 * scalar types the structured (JSON) output carries, so whatever goes in comes back out of a JSON parser with the
 * same type.
 *
 * Implicitly constructible from the usual C++ scalars, so that call sites can write `{{"code", 1}, {"ok", true}}`.
 * Integers are stored as `int64_t` whenever they fit; only unsigned values above `INT64_MAX` are stored as `uint64_t`
 * (Type::S_UINT), so a given number always has one representation.
 */
class Field_value
{
public:
  // Types.

  /// Discriminator of the stored alternative; see type().
  enum class Type
  {
    /// No value (JSON `null`).
    S_NULL,
    /// `bool`.
    S_BOOL,
    /// `int64_t`.
    S_INT,
    /// `uint64_t` above `INT64_MAX`.
    S_UINT,
    /// `double`.
    S_DOUBLE,
    /// `std::string`.
    S_STRING
  };

  // Constructors/destructor.

  /// Constructs null value.
  Field_value();

  /// Constructs null value.
  Field_value(std::nullptr_t);

  /**
   * Constructs boolean value.
   * @param val
   *        Value.
   */
  Field_value(bool val);

  /**
   * Constructs integer value.
   * @param val
   *        Value.
   */
  Field_value(int val);

  /**
   * Constructs integer value.
   * @param val
   *        Value.
   */
  Field_value(long val);

  /**
   * Constructs integer value.
   * @param val
   *        Value.
   */
  Field_value(long long val);

  /**
   * Constructs integer value.
   * @param val
   *        Value.
   */
  Field_value(unsigned int val);

  /**
   * Constructs integer value: Type::S_INT if it fits, else Type::S_UINT.
   * @param val
   *        Value.
   */
  Field_value(unsigned long val);

  /**
   * Constructs integer value: Type::S_INT if it fits, else Type::S_UINT.
   * @param val
   *        Value.
   */
  Field_value(unsigned long long val);

  /**
   * Constructs floating-point value.
   * @param val
   *        Value.
   */
  Field_value(double val);

  /**
   * Constructs string value.
   * @param val
   *        Value; must not be null.
   */
  Field_value(const char* val);

  /**
   * Constructs string value.
   * @param val
   *        Value.
   */
  Field_value(std::string val);

  /**
   * Constructs string value.
   * @param val
   *        Value.
   */
  Field_value(util::String_view val);

  // Methods.

  /**
   * Returns which alternative is stored.
   * @return See above.
   */
  Type type() const;

  /// Returns `true` if and only if type() is Type::S_NULL.
  bool is_null() const;

  /**
   * Returns stored `bool`.  Behavior undefined unless type() is Type::S_BOOL.
   * @return See above.
   */
  bool as_bool() const;

  /**
   * Returns stored integer.  Behavior undefined unless type() is Type::S_INT.
   * @return See above.
   */
  int64_t as_int() const;

  /**
   * Returns stored unsigned integer.  Behavior undefined unless type() is Type::S_UINT.
   * @return See above.
   */
  uint64_t as_uint() const;

  /**
   * Returns stored floating-point value.  Behavior undefined unless type() is Type::S_DOUBLE.
   * @return See above.
   */
  double as_double() const;

  /**
   * Returns stored string.  Behavior undefined unless type() is Type::S_STRING.
   * @return See above.
   */
  const std::string& as_string() const;

  /**
   * Returns `true` if and only if `other` holds the same alternative with an equal value.
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool operator==(const Field_value& other) const;

  /**
   * Negation of operator==().
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool operator!=(const Field_value& other) const;

private:
  // Types.

  /// The storage; alternative order matches #Type.
  using Storage = std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string>;

  // Data.

  /// See #Storage.
  Storage m_val;
}; // class Field_value

/// One named field.
using Field = std::pair<std::string, Field_value>;

/**
 * Ordered collection of uniquely named Field objects: insertion order is preserved (and is the order in which
 * formatters print them); setting an existing key replaces its value in place.
 *
 * Field sets are small (a handful of entries), so lookup is a linear scan over a vector; that beats a hash-indexed
 * structure at this size and keeps iteration trivial.
 */
class Fields
{
public:
  // Types.

  /// Short-hand for the underlying sequence.
  using Sequence = std::vector<Field>;
  /// Iterator type.
  using const_iterator = Sequence::const_iterator;
  /// Iterator type.
  using iterator = Sequence::iterator;

  // Constructors/destructor.

  /// Constructs empty set.
  Fields();

  /**
   * Constructs from a list of fields, as if by set() of each in order (so a repeated key keeps its first position
   * and its last value).
   *
   * @param init
   *        Fields.
   */
  Fields(std::initializer_list<Field> init);

  // Methods.

  /**
   * Sets the field `key` to `val`: replaces the value in place if `key` exists; else appends.
   *
   * @param key
   *        Field name.
   * @param val
   *        Value.
   */
  void set(util::String_view key, Field_value val);

  /**
   * Calls set() for each field of `other` in its order, so that `other` wins on collision.
   *
   * @param other
   *        Fields to overlay.
   */
  void merge(const Fields& other);

  /**
   * Finds the field with the given key.
   *
   * @param key
   *        Field name.
   * @return Pointer to value, or null if absent.  Invalidated by any mutating call.
   */
  const Field_value* find(util::String_view key) const;

  /**
   * Mutable counterpart of the other find().
   *
   * @param key
   *        Field name.
   * @return See other find().
   */
  Field_value* find(util::String_view key);

  /**
   * Returns `true` if and only if `key` is present.
   *
   * @param key
   *        Field name.
   * @return See above.
   */
  bool contains(util::String_view key) const;

  /**
   * Removes the field with the given key, if present.
   *
   * @param key
   *        Field name.
   * @return `true` if and only if something was removed.
   */
  bool erase(util::String_view key);

  /**
   * Removes every field for which `pred(name)` is `true`.
   *
   * @tparam Pred
   *         Callable `bool (const std::string&)`.
   * @param pred
   *        Predicate.
   * @return Number of fields removed.
   */
  template<typename Pred>
  size_t erase_if(Pred&& pred);

  /// Number of fields.
  size_t size() const;

  /// `size() == 0`.
  bool empty() const;

  /// Removes all fields.
  void clear();

  /// Start of iteration, in insertion order.
  const_iterator begin() const;
  /// End of iteration.
  const_iterator end() const;
  /// Start of mutable iteration (keys must not be changed through it).
  iterator begin();
  /// End of mutable iteration.
  iterator end();

  /**
   * Returns `true` if and only if both hold the same fields in the same order.
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool operator==(const Fields& other) const;

private:
  // Data.

  /// The fields, in insertion order; no two share a name.
  Sequence m_fields;
}; // class Fields

// Free functions.

/**
 * Prints value the way the console formatter shows it: strings unquoted, `true`/`false`, `null`,
 * numbers in shortest round-trip form.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Field_value& val);

// Template implementations.

template<typename Pred>
size_t Fields::erase_if(Pred&& pred)
{
  const auto old_size = m_fields.size();
  m_fields.erase(std::remove_if(m_fields.begin(), m_fields.end(),
                                [&](const Field& field) -> bool { return pred(field.first); }),
                 m_fields.end());
  return old_size - m_fields.size();
}

} // namespace quire::log
