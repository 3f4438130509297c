/* Flow-Shuffle: Core
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

#include "shuffle/transport/transport_fwd.hpp"
#include <flow/log/log.hpp>
#include <map>
#include <optional>
#include <string>

namespace shuffle::transport
{

// Types.

/**
 * Source of raw string configuration values, keyed by dotted names such as `shuffle.io.maxRetries`.
 * Transport_conf reads through this interface, so that the application may back it with whatever it uses
 * for configuration (a map, a parsed file, command-line options...).
 */
class Config_provider
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Config_provider();

  // Methods.

  /**
   * Returns the value stored under `key`, or none if there is no such key.
   *
   * @param key
   *        Full key name.
   * @return See above.
   */
  virtual std::optional<std::string> get(util::String_view key) const = 0;
}; // class Config_provider

/// Config_provider that serves values from an in-memory map; empty unless populated via ctor or set().
class Map_config_provider :
  public Config_provider
{
public:
  // Types.

  /// The map type.
  using Map = std::map<std::string, std::string>;

  // Constructors/destructor.

  /**
   * Constructs the provider with an initial set of values.
   *
   * @param values
   *        Initial key/value pairs.
   */
  explicit Map_config_provider(Map values = Map());

  // Methods.

  /**
   * Adds or replaces the value for `key`.
   *
   * @param key
   *        Full key name.
   * @param value
   *        Value, in the string form Transport_conf expects for that key.
   */
  void set(const std::string& key, const std::string& value);

  /**
   * Implements Config_provider API.
   *
   * @param key
   *        See Config_provider.
   * @return See Config_provider.
   */
  std::optional<std::string> get(util::String_view key) const override;

private:
  // Data.

  /// The values.
  Map m_values;
}; // class Map_config_provider

/**
 * The transport and retry configuration of one module (e.g., `"shuffle"`): immutable, value-semantic, and
 * cheap to copy.  It is read once, at construction, from a Config_provider.  The keys are:
 *
 *   Key                             | Meaning                                            | Default
 *   ------------------------------- | -------------------------------------------------- | -------
 *   `<module>.io.connectionTimeout` | Connect timeout; also the idle timeout per channel | `120s`
 *   `<module>.io.maxRetries`        | Max times a block fetch is retried on I/O error    | `3`
 *   `<module>.io.retryWait`         | Delay before each such retry                       | `5s`
 *
 * Durations are parsed by parse_duration(); the retry count is a non-negative decimal integer.
 */
class Transport_conf
{
public:
  // Constants.

  /// Default for connection_timeout().
  static const util::Fine_duration S_DEFAULT_CONNECTION_TIMEOUT;

  /// Default for max_io_retries().
  static constexpr unsigned int S_DEFAULT_MAX_IO_RETRIES = 3;

  /// Default for io_retry_wait().
  static const util::Fine_duration S_DEFAULT_IO_RETRY_WAIT;

  /// Module name used by the default ctor.
  static const std::string S_DEFAULT_MODULE;

  // Constructors/destructor.

  /// Constructs a configuration with all defaults, for module #S_DEFAULT_MODULE.
  Transport_conf();

  /**
   * Constructs a configuration for the given module by reading the keys in class doc header from `provider`;
   * any absent key gets its default.
   *
   * @param logger_ptr
   *        Logger to use for logging (bad values are logged).  Null allowed.
   * @param module
   *        Module name: the prefix of every key.
   * @param provider
   *        Source of values.  Not saved.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONFIG_INVALID_VALUE (some present value could not be parsed).
   *        On error `*this` holds the defaults.
   */
  explicit Transport_conf(flow::log::Logger* logger_ptr, util::String_view module, const Config_provider& provider,
                          Error_code* err_code = 0);

  // Methods.

  /**
   * Module name: the prefix of every key.
   * @return See above.
   */
  const std::string& module() const;

  /**
   * Timeout for establishing a connection; also the period of no reads and no writes after which a channel
   * is considered idle.
   *
   * @return See above.
   */
  util::Fine_duration connection_timeout() const;

  /**
   * Maximum number of times a fetch of the remaining blocks is retried after an I/O-class error.  0 disables
   * retrying altogether.
   *
   * @return See above.
   */
  unsigned int max_io_retries() const;

  /**
   * Delay before each retry.
   * @return See above.
   */
  util::Fine_duration io_retry_wait() const;

  /**
   * Parses a duration string: a non-negative decimal integer followed by an optional unit suffix, one of
   * `us`, `ms`, `s`, `m` or `min`, `h`, `d` (case-insensitive; whitespace around either part is ignored).
   * A bare number means seconds.  Examples: `"120s"`, `"5"`, `"250ms"`, `"2min"`.
   *
   * @param str
   *        String to parse.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONFIG_INVALID_VALUE.
   * @return The duration; zero on error.
   */
  static util::Fine_duration parse_duration(util::String_view str, Error_code* err_code = 0);

private:
  // Methods.

  /**
   * Composes the full key name from module() and the given suffix.
   *
   * @param suffix
   *        E.g., `"io.maxRetries"`.
   * @return See above.
   */
  std::string key(util::String_view suffix) const;

  // Data.

  /// See module().
  std::string m_module;

  /// See connection_timeout().
  util::Fine_duration m_connection_timeout;

  /// See max_io_retries().
  unsigned int m_max_io_retries;

  /// See io_retry_wait().
  util::Fine_duration m_io_retry_wait;
}; // class Transport_conf

// Free functions.

/**
 * Prints string representation of the given `Transport_conf` to the given `ostream`.
 *
 * @relatesalso Transport_conf
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transport_conf& val);

} // namespace shuffle::transport
