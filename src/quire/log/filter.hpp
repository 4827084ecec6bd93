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

#include "quire/log/record.hpp"

namespace quire::log
{

// Types.

/**
 * Interface for one stage of a Logger's filter pipeline.  Stages run in the order configured
 * (Logger_config::m_filters); each either vetoes the Record (apply() returns `false`, and no later stage or
 * handler sees it) or passes it on, possibly after rewriting its field values (redaction, say).
 *
 * Implementations must be safe to call concurrently from many threads: apply() is `const`, and the same object
 * may be shared by several Logger instances.  apply() should not throw; if it does anyway, Logger treats that as
 * a veto and reports the problem to `std::cerr`.
 */
class Filter
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Filter();

  // Methods.

  /**
   * Decides whether `*record` proceeds, optionally modifying it.
   *
   * @param record
   *        The Record.  Not null.
   * @return `false` to veto.
   */
  virtual bool apply(Record* record) const = 0;

  /**
   * A hash of this filter's configuration, used in Logger_config::fingerprint().  Two filters with equal
   * fingerprints are taken to behave identically.  The default implementation returns a value that
   * distinguishes each object (so that only the same object matches itself).
   *
   * @return See above.
   */
  virtual size_t fingerprint() const;
}; // class Filter

/// Filter that vetoes records strictly less severe than a configured minimum.
class Level_filter :
  public Filter
{
public:
  // Constructors/destructor.

  /**
   * Constructs filter.
   *
   * @param min_sev
   *        Least severe Sev let through.  Sev::S_NONE lets everything through.
   */
  explicit Level_filter(Sev min_sev);

  // Methods.

  /**
   * Returns `record->m_sev >= min_sev`.
   *
   * @param record
   *        See Filter::apply().
   * @return See above.
   */
  bool apply(Record* record) const override;

  /**
   * See Filter::fingerprint().
   * @return See above.
   */
  size_t fingerprint() const override;

  /**
   * The minimum from ctor.
   * @return See above.
   */
  Sev min_sev() const;

private:
  // Data.

  /// See ctor.
  const Sev m_min_sev;
}; // class Level_filter

/**
 * Filter that never vetoes, but replaces the value of every sensitive field in Record::m_context and
 * Record::m_extra with a sentinel string (the key stays, so readers can see the field was there).
 *
 * A field is sensitive if and only if its key contains, case-insensitively, any blocklist entry as a substring:
 * with the default blocklist `"user_password_hint"` and `"X-Auth-Token"` are sensitive, `"user"` is not.
 * Values are never inspected.
 *
 * The default blocklist is default_blocklist(); the constructor can extend it with site-specific entries.
 * Configure further instances (with different blocklists) as additional pipeline stages if needed.
 */
class Sensitive_data_filter :
  public Filter
{
public:
  // Constants.

  /// The default replacement value.
  static const std::string S_REDACTED;

  // Constructors/destructor.

  /**
   * Constructs filter with the default blocklist plus the given extra entries.
   *
   * @param additional_keys
   *        Entries to add to default_blocklist().  Empty entries are ignored.
   * @param sentinel
   *        Replacement value.
   */
  explicit Sensitive_data_filter(const std::vector<std::string>& additional_keys = {},
                                 util::String_view sentinel = S_REDACTED);

  // Methods.

  /**
   * Redacts sensitive fields; always returns `true`.
   *
   * @param record
   *        See Filter::apply().
   * @return `true`.
   */
  bool apply(Record* record) const override;

  /**
   * See Filter::fingerprint().
   * @return See above.
   */
  size_t fingerprint() const override;

  /**
   * Whether a field named `key` would be redacted.
   *
   * @param key
   *        Field name.
   * @return See above.
   */
  bool is_sensitive(util::String_view key) const;

  /**
   * Replaces sensitive values in `*fields`.
   *
   * @param fields
   *        Fields to sanitize.
   * @return Number of values replaced.
   */
  size_t redact(Fields* fields) const;

  /**
   * The blocklist in effect (defaults first, then additions in order).
   * @return See above.
   */
  const std::vector<std::string>& blocklist() const;

  /**
   * The replacement value.
   * @return See above.
   */
  const std::string& sentinel() const;

  /**
   * The built-in blocklist: password, token, secret, api_key, authorization, credential, private_key, ssn,
   * credit_card, cvv, pin, session_id, cookie, csrf_token.
   *
   * @return See above.
   */
  static const std::vector<std::string>& default_blocklist();

private:
  // Data.

  /// See blocklist().
  std::vector<std::string> m_blocklist;

  /// See sentinel().
  const std::string m_sentinel;
}; // class Sensitive_data_filter

} // namespace quire::log
