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

#include "quire/log/logger.hpp"
#include <boost/unordered_map.hpp>

namespace quire::log
{

// Types.

/**
 * Name-to-Logger cache, so that every component asking for `"svc.db"` gets the same Logger (and the same open
 * files) instead of building its own.
 *
 * The rules of get():
 *   - Without an explicit configuration: return the cached Logger for the name if any; else build one from the
 *     preset chosen by the process environment (Env_settings::from_process_env()), cache it and return it.
 *   - With an explicit configuration (a Logger_config, or an Environment and log directory, which select a preset):
 *     return the cached Logger if its configuration fingerprint equals that of the requested one; else build a new
 *     Logger, cache it in place of the old one, and return it.  Holders of the old one may keep using it.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  Lookup, building and insertion happen under one mutex, so two threads
 * asking for the same new name get the same Logger, and clear() is atomic with respect to get(): a get() sees the
 * registry either fully before or fully after a clear().  (Building a Logger can open files, so holding the mutex
 * meanwhile is not free; it happens once per name.)
 *
 * Most code uses the process-wide instance, process_registry(), via get_logger() and clear_loggers().  Tests can
 * make their own instances for isolation.
 */
class Logger_registry
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty registry.
   *
   * @param context_store
   *        Context store given to each Logger built; must outlive them.
   * @param fallback_os
   *        Fallback stream given to each Logger built; must outlive them.
   */
  explicit Logger_registry(Context_store* context_store = Context_store::default_store(),
                           std::ostream* fallback_os = &std::cerr);

  /// Forbid copying.
  Logger_registry(const Logger_registry&) = delete;

  // Methods.

  /// Forbid copying.
  Logger_registry& operator=(const Logger_registry&) = delete;

  /**
   * Returns the cached Logger for `name`, or builds one from the process environment's preset.
   *
   * @param name
   *        Logger name.
   * @return See above.  Not null.
   * @throws error::Runtime_error on configuration error; see Logger and Env_settings::from_process_env().
   */
  Logger_ptr get(util::String_view name);

  /**
   * Returns a Logger for `name` built from `config` (with its `m_name` replaced by `name`); reusing the cached one if
   * its configuration has the same fingerprint.
   *
   * @param name
   *        Logger name.
   * @param config
   *        Requested configuration.
   * @return See above.  Not null.
   * @throws error::Runtime_error on configuration error; see Logger.
   */
  Logger_ptr get(util::String_view name, const Logger_config& config);

  /**
   * Same as get() with `Logger_config::for_environment(name, env, log_dir)`.
   *
   * @param name
   *        Logger name.
   * @param env
   *        Environment.
   * @param log_dir
   *        Log directory.
   * @return See above.  Not null.
   * @throws error::Runtime_error on configuration error; see Logger.
   */
  Logger_ptr get(util::String_view name, Environment env, const fs::path& log_dir);

  /// Removes all entries.  Loggers already handed out stay valid for their holders.
  void clear();

  /**
   * Number of entries.
   * @return See above.
   */
  size_t size() const;

  /**
   * Whether `name` is cached.
   *
   * @param name
   *        Logger name.
   * @return See above.
   */
  bool contains(util::String_view name) const;

  /**
   * The process-wide registry used by get_logger() and clear_loggers().
   * @return See above.  Never null.
   */
  static Logger_registry* process_registry();

private:
  // Types.

  /// Short-hand for the cache.
  using Logger_map = boost::unordered_map<std::string, Logger_ptr>;

  // Methods.

  /**
   * Builds a Logger from `config`.  Call with #m_mutex locked.
   *
   * @param config
   *        Configuration.
   * @return See above.
   */
  Logger_ptr build(const Logger_config& config) const;

  // Data.

  /// See ctor.
  Context_store* const m_context_store;

  /// See ctor.
  std::ostream* const m_fallback_os;

  /// Protects #m_loggers.
  mutable util::Mutex_non_recursive m_mutex;

  /// The cache.
  Logger_map m_loggers;
}; // class Logger_registry

} // namespace quire::log
