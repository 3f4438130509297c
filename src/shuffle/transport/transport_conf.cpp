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
#include "shuffle/transport/transport_conf.hpp"
#include "shuffle/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/chrono.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>
#include <algorithm>
#include <cctype>

namespace shuffle::transport
{

// Static initializations.

const util::Fine_duration Transport_conf::S_DEFAULT_CONNECTION_TIMEOUT = boost::chrono::seconds(120);
const util::Fine_duration Transport_conf::S_DEFAULT_IO_RETRY_WAIT = boost::chrono::seconds(5);
const std::string Transport_conf::S_DEFAULT_MODULE = "shuffle";

// Config_provider/Map_config_provider implementations.

Config_provider::~Config_provider() = default;

Map_config_provider::Map_config_provider(Map values) :
  m_values(std::move(values))
{
  // That's it.
}

void Map_config_provider::set(const std::string& key, const std::string& value)
{
  m_values[key] = value;
}

std::optional<std::string> Map_config_provider::get(util::String_view key) const
{
  const auto it = m_values.find(std::string(key));
  if (it == m_values.end())
  {
    return std::nullopt;
  }
  // else
  return it->second;
}

// Transport_conf implementations.

Transport_conf::Transport_conf() :
  m_module(S_DEFAULT_MODULE),
  m_connection_timeout(S_DEFAULT_CONNECTION_TIMEOUT),
  m_max_io_retries(S_DEFAULT_MAX_IO_RETRIES),
  m_io_retry_wait(S_DEFAULT_IO_RETRY_WAIT)
{
  // That's it.
}

Transport_conf::Transport_conf(flow::log::Logger* logger_ptr, util::String_view module,
                               const Config_provider& provider, Error_code* err_code) :
  Transport_conf()
{
  using flow::error::Runtime_error;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::trim_copy;
  using std::string;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  m_module.assign(module.data(), module.size());

  Error_code our_err_code;
  const auto load_duration = [&](util::String_view suffix, util::Fine_duration* target)
  {
    const auto full_key = key(suffix);
    const auto value = provider.get(full_key);
    if ((!value) || our_err_code)
    {
      return;
    }
    // else
    const auto duration = parse_duration(*value, &our_err_code);
    if (our_err_code)
    {
      FLOW_LOG_WARNING("Transport_conf [" << m_module << "]: Value [" << *value << "] for key [" << full_key << "] "
                       "is not a valid duration.");
      return;
    }
    // else
    *target = duration;
  }; // const auto load_duration =

  load_duration("io.connectionTimeout", &m_connection_timeout);
  load_duration("io.retryWait", &m_io_retry_wait);

  if (!our_err_code)
  {
    const auto full_key = key("io.maxRetries");
    const auto value = provider.get(full_key);
    if (value)
    {
      const auto trimmed = trim_copy(*value);
      // lexical_cast<unsigned> accepts a leading '-' and wraps around; so disallow anything but digits ourselves.
      const bool all_digits = (!trimmed.empty())
                              && std::all_of(trimmed.begin(), trimmed.end(),
                                             [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); });
      try
      {
        if (!all_digits)
        {
          throw bad_lexical_cast();
        }
        m_max_io_retries = lexical_cast<unsigned int>(trimmed);
      }
      catch (const bad_lexical_cast&)
      {
        FLOW_LOG_WARNING("Transport_conf [" << m_module << "]: Value [" << *value << "] for key [" << full_key << "] "
                         "is not a non-negative integer.");
        our_err_code = error::Code::S_CONFIG_INVALID_VALUE;
      }
    }
  } // if (!our_err_code)

  if (our_err_code)
  {
    // Leave no partially-loaded state behind.
    const string module_name = m_module;
    *this = Transport_conf();
    m_module = module_name;

    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }

  FLOW_LOG_INFO("Transport_conf loaded: [" << *this << "].");
} // Transport_conf::Transport_conf()

const std::string& Transport_conf::module() const
{
  return m_module;
}

util::Fine_duration Transport_conf::connection_timeout() const
{
  return m_connection_timeout;
}

unsigned int Transport_conf::max_io_retries() const
{
  return m_max_io_retries;
}

util::Fine_duration Transport_conf::io_retry_wait() const
{
  return m_io_retry_wait;
}

std::string Transport_conf::key(util::String_view suffix) const
{
  return flow::util::ostream_op_string(m_module, '.', suffix);
}

util::Fine_duration Transport_conf::parse_duration(util::String_view str, Error_code* err_code) // Static.
{
  using flow::error::Runtime_error;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::trim_copy;
  using boost::algorithm::to_lower_copy;
  using boost::chrono::microseconds;
  using boost::chrono::milliseconds;
  using boost::chrono::seconds;
  using boost::chrono::minutes;
  using boost::chrono::hours;
  using std::string;

  const string trimmed = trim_copy(string(str));

  size_t n_digits = 0;
  while ((n_digits != trimmed.size()) && std::isdigit(static_cast<unsigned char>(trimmed[n_digits])))
  {
    ++n_digits;
  }
  const auto unit = to_lower_copy(trim_copy(trimmed.substr(n_digits)));

  util::Fine_duration result = util::Fine_duration::zero();
  bool ok = n_digits != 0;
  if (ok)
  {
    try
    {
      const auto count = lexical_cast<uint64_t>(trimmed.substr(0, n_digits));

      // Converts `count` units to the result; a count not representable as Fine_duration is rejected.
      const auto scale = [&](util::Fine_duration unit)
      {
        if (count > static_cast<uint64_t>(util::Fine_duration::max() / unit))
        {
          ok = false;
          return;
        }
        // else
        result = unit * static_cast<util::Fine_duration::rep>(count);
      };

      if (unit == "us")
      {
        scale(microseconds(1));
      }
      else if (unit == "ms")
      {
        scale(milliseconds(1));
      }
      else if (unit.empty() || (unit == "s"))
      {
        scale(seconds(1));
      }
      else if ((unit == "m") || (unit == "min"))
      {
        scale(minutes(1));
      }
      else if (unit == "h")
      {
        scale(hours(1));
      }
      else if (unit == "d")
      {
        scale(hours(24));
      }
      else
      {
        ok = false;
      }
    }
    catch (const bad_lexical_cast&) // Too many digits for uint64_t.
    {
      ok = false;
    }
  } // if (ok)

  if (!ok)
  {
    const Error_code our_err_code = error::Code::S_CONFIG_INVALID_VALUE;
    if (err_code)
    {
      *err_code = our_err_code;
      return util::Fine_duration::zero();
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return result;
} // Transport_conf::parse_duration()

std::ostream& operator<<(std::ostream& os, const Transport_conf& val)
{
  using boost::chrono::milliseconds;
  using boost::chrono::round;

  return os << "module[" << val.module() << "] "
               "connection_timeout[" << round<milliseconds>(val.connection_timeout()) << "] "
               "max_io_retries[" << val.max_io_retries() << "] "
               "io_retry_wait[" << round<milliseconds>(val.io_retry_wait()) << ']';
}

} // namespace shuffle::transport
