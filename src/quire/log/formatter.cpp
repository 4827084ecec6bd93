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
#include "quire/log/formatter.hpp"
#include "quire/util/fmt.hpp"
#include <cmath>
#include <iterator>

namespace quire::log
{

namespace
{

/// ANSI SGR sequence that restores default rendition.
constexpr util::String_view S_COLOR_RESET = "\x1b[0m";

/**
 * Returns the ANSI color escape for a level.
 *
 * @param sev
 *        Level.
 * @return See above.
 */
util::String_view sev_color(Sev sev)
{
  switch (sev)
  {
  case Sev::S_DEBUG:
    return "\x1b[36m"; // Cyan.
  case Sev::S_INFO:
    return "\x1b[32m"; // Green.
  case Sev::S_WARNING:
    return "\x1b[33m"; // Yellow.
  case Sev::S_ERROR:
    return "\x1b[31m"; // Red.
  case Sev::S_CRITICAL:
    return "\x1b[1;35m"; // Bold magenta.
  case Sev::S_NONE:
  case Sev::S_END_SENTINEL:
    break;
  }
  return "";
}

/// What an ill-formed UTF-8 sequence becomes in JSON output: U+FFFD REPLACEMENT CHARACTER, UTF-8-encoded.
constexpr util::String_view S_UTF8_REPLACEMENT = "\xef\xbf\xbd";

/**
 * Returns the length of the well-formed UTF-8 sequence (RFC 3629: no overlongs, no surrogates, nothing above
 * U+10FFFF) of 2 to 4 bytes starting at `str[pos]`, or 0 if there isn't one.
 *
 * @param str
 *        String.
 * @param pos
 *        Index of the lead byte; `str[pos]` must be non-ASCII.
 * @return See above.
 */
size_t utf8_sequence_length(util::String_view str, size_t pos)
{
  const auto byte_at = [&](size_t idx) -> unsigned int { return static_cast<unsigned char>(str[idx]); };

  const auto lead = byte_at(pos);
  size_t len;
  unsigned int second_min = 0x80;
  unsigned int second_max = 0xbf;
  if ((lead >= 0xc2) && (lead <= 0xdf))
  {
    len = 2;
  }
  else if ((lead >= 0xe0) && (lead <= 0xef))
  {
    len = 3;
    if (lead == 0xe0)
    {
      second_min = 0xa0; // Overlong.
    }
    else if (lead == 0xed)
    {
      second_max = 0x9f; // Surrogates.
    }
  }
  else if ((lead >= 0xf0) && (lead <= 0xf4))
  {
    len = 4;
    if (lead == 0xf0)
    {
      second_min = 0x90; // Overlong.
    }
    else if (lead == 0xf4)
    {
      second_max = 0x8f; // Above U+10FFFF.
    }
  }
  else
  {
    return 0; // Stray continuation byte, C0/C1, or F5..FF.
  }

  if ((str.size() - pos) < len)
  {
    return 0;
  }
  // else
  if ((byte_at(pos + 1) < second_min) || (byte_at(pos + 1) > second_max))
  {
    return 0;
  }
  // else
  for (size_t idx = pos + 2; idx != pos + len; ++idx)
  {
    if ((byte_at(idx) & 0xc0) != 0x80)
    {
      return 0;
    }
  }
  return len;
} // utf8_sequence_length()

/**
 * Appends `str` as a quoted JSON string.  Ill-formed UTF-8 is replaced, one byte at a time, by U+FFFD, so the
 * result is always valid JSON.
 *
 * @param out
 *        Target.
 * @param str
 *        Raw string.
 */
void append_json_string(std::string* out, util::String_view str)
{
  out->push_back('"');
  for (size_t pos = 0; pos != str.size(); ++pos)
  {
    const char ch = str[pos];
    if (static_cast<unsigned char>(ch) >= 0x80)
    {
      const auto len = utf8_sequence_length(str, pos);
      if (len == 0)
      {
        out->append(S_UTF8_REPLACEMENT);
      }
      else
      {
        out->append(str.substr(pos, len));
        pos += len - 1;
      }
      continue;
    }
    // else

    switch (ch)
    {
    case '"':
      out->append("\\\"");
      break;
    case '\\':
      out->append("\\\\");
      break;
    case '\b':
      out->append("\\b");
      break;
    case '\f':
      out->append("\\f");
      break;
    case '\n':
      out->append("\\n");
      break;
    case '\r':
      out->append("\\r");
      break;
    case '\t':
      out->append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20)
      {
        fmt::format_to(std::back_inserter(*out), "\\u{:04x}", static_cast<unsigned int>(ch));
      }
      else
      {
        out->push_back(ch);
      }
    }
  }
  out->push_back('"');
} // append_json_string()

/**
 * Appends a field value as a JSON value.
 *
 * @param out
 *        Target.
 * @param val
 *        Value.
 */
void append_json_value(std::string* out, const Field_value& val)
{
  using Type = Field_value::Type;

  switch (val.type())
  {
  case Type::S_NULL:
    out->append("null");
    return;
  case Type::S_BOOL:
    out->append(val.as_bool() ? "true" : "false");
    return;
  case Type::S_INT:
    fmt::format_to(std::back_inserter(*out), "{}", val.as_int());
    return;
  case Type::S_UINT:
    fmt::format_to(std::back_inserter(*out), "{}", val.as_uint());
    return;
  case Type::S_DOUBLE:
  {
    const auto dbl = val.as_double();
    if (!std::isfinite(dbl))
    {
      out->append("null"); // JSON has no NaN or infinity.
      return;
    }
    const auto start = out->size();
    fmt::format_to(std::back_inserter(*out), "{}", dbl);
    if (out->find_first_of(".eE", start) == std::string::npos)
    {
      out->append(".0");
    }
    return;
  }
  case Type::S_STRING:
    append_json_string(out, val.as_string());
    return;
  }
} // append_json_value()

/**
 * Appends `"name":{...}` for a field set.
 *
 * @param out
 *        Target.
 * @param name
 *        Member name.
 * @param fields
 *        Fields.
 */
void append_json_object(std::string* out, util::String_view name, const Fields& fields)
{
  append_json_string(out, name);
  out->append(":{");
  bool first = true;
  for (const auto& field : fields)
  {
    if (!first)
    {
      out->push_back(',');
    }
    first = false;
    append_json_string(out, field.first);
    out->push_back(':');
    append_json_value(out, field.second);
  }
  out->push_back('}');
}

/**
 * Appends `key=value` pairs separated by spaces, each preceded by a space.
 *
 * @param out
 *        Target.
 * @param fields
 *        Fields.
 */
void append_key_values(std::string* out, const Fields& fields)
{
  for (const auto& field : fields)
  {
    fmt::format_to(std::back_inserter(*out), " {}=", field.first);
    if (field.second.type() == Field_value::Type::S_STRING)
    {
      out->append(field.second.as_string());
    }
    else
    {
      // Non-strings print like their JSON rendering (true, null, 1.5, ...).
      append_json_value(out, field.second);
    }
  }
}

} // namespace (anon)

// Formatter implementations.

Formatter::~Formatter() = default;

// Json_formatter implementations.

Json_formatter::Json_formatter() = default;

std::string Json_formatter::render(const Record& record) const // Virtual.
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::back_inserter;

  std::string out;
  out.reserve(256);

  const auto time_t_val = Record::Clock::to_time_t(record.m_time_stamp);
  const auto usec = duration_cast<microseconds>(record.m_time_stamp.time_since_epoch()).count() % 1000000;

  out.append("{\"timestamp\":");
  fmt::format_to(back_inserter(out), "\"{:%Y-%m-%dT%H:%M:%S}.{:06}Z\"", fmt::gmtime(time_t_val), usec);
  out.append(",\"level\":");
  append_json_string(&out, sev_to_string(record.m_sev));
  out.append(",\"logger\":");
  append_json_string(&out, record.m_logger_name);
  out.append(",\"message\":");
  append_json_string(&out, record.m_message);
  out.append(",\"module\":");
  append_json_string(&out, record.m_origin.m_module);
  out.append(",\"function\":");
  append_json_string(&out, record.m_origin.m_function);
  fmt::format_to(back_inserter(out), ",\"line\":{},", record.m_origin.m_line);
  append_json_object(&out, "context", record.m_context);
  out.push_back(',');
  append_json_object(&out, "extra", record.m_extra);

  if (record.m_error)
  {
    const auto& error = *record.m_error;
    out.append(",\"error\":{\"type\":");
    append_json_string(&out, error.m_type);
    out.append(",\"message\":");
    append_json_string(&out, error.m_message);
    out.append(",\"frames\":[");
    for (size_t idx = 0; idx != error.m_frames.size(); ++idx)
    {
      if (idx != 0)
      {
        out.push_back(',');
      }
      append_json_string(&out, error.m_frames[idx]);
    }
    out.append("]}");
  }

  out.push_back('}');
  return out;
} // Json_formatter::render()

// Console_formatter implementations.

Console_formatter::Console_formatter(bool use_colors) :
  m_use_colors(use_colors)
{
  // Nothing.
}

std::string Console_formatter::render(const Record& record) const // Virtual.
{
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::back_inserter;

  std::string out;
  out.reserve(128);

  // Local time zone, unlike JSON: this is for a human at a terminal.
  const auto time_t_val = Record::Clock::to_time_t(record.m_time_stamp);
  const auto msec = duration_cast<milliseconds>(record.m_time_stamp.time_since_epoch()).count() % 1000;
  fmt::format_to(back_inserter(out), "[{:%Y-%m-%d %H:%M:%S}.{:03}] ", fmt::localtime(time_t_val), msec);

  if (m_use_colors)
  {
    fmt::format_to(back_inserter(out), "{}{}{}", sev_color(record.m_sev), sev_to_string(record.m_sev),
                   S_COLOR_RESET);
  }
  else
  {
    out.append(sev_to_string(record.m_sev));
  }
  fmt::format_to(back_inserter(out), " {}: {}", record.m_logger_name, record.m_message);

  if (!(record.m_context.empty() && record.m_extra.empty()))
  {
    out.append(" |");
    append_key_values(&out, record.m_context);
    append_key_values(&out, record.m_extra);
  }

  if (record.m_error)
  {
    const auto& error = *record.m_error;
    out.append("\nTraceback (most recent call first):");
    for (const auto& frame : error.m_frames)
    {
      fmt::format_to(back_inserter(out), "\n  {}", frame);
    }
    fmt::format_to(back_inserter(out), "\n{}: {}", error.m_type, error.m_message);
  }

  return out;
} // Console_formatter::render()

bool Console_formatter::use_colors() const
{
  return m_use_colors;
}

} // namespace quire::log
