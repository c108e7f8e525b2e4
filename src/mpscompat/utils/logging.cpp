////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "mpscompat/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#if __has_include(<unistd.h>)
#include <unistd.h>
#define MPSCOMPAT_HAVE_UNISTD_H
#endif

namespace
{

std::string lowercase_env(char const* name)
{
  char const* const var = std::getenv(name);
  std::string out {var ? var : ""};
  std::transform(begin(out), end(out), begin(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

spdlog::level::level_enum get_env_log_level()
{
  auto const level_str = lowercase_env("MPSCOMPAT_LOG_LEVEL");
  if (level_str.empty())
    return ::spdlog::level::info;

  // spdlog spells these "trace", "debug", "info", "warning"/"warn",
  // "error"/"err", "critical", "off". Unknown strings map to "off",
  // which would silently disable logging, so keep "info" instead.
  auto const level = ::spdlog::level::from_str(level_str);
  if (level == ::spdlog::level::off && level_str != "off")
    return ::spdlog::level::info;
  return level;
}

std::string get_hostname()
{
#ifdef MPSCOMPAT_HAVE_UNISTD_H
  char buf[256];
  if (gethostname(buf, sizeof(buf)) == 0)
    return std::string {buf, std::find(buf, buf + sizeof(buf), '\0')};
#endif
  return "<unknownhost>";
}

class HostFlag final : public spdlog::custom_flag_formatter
{
public:
  std::unique_ptr<custom_flag_formatter> clone() const final
  {
    return spdlog::details::make_unique<HostFlag>();
  }
  void format(::spdlog::details::log_msg const&,
              ::std::tm const&,
              ::spdlog::memory_buf_t& dest) final
  {
    static std::string const hostname = get_hostname();
    dest.append(hostname.data(), hostname.data() + hostname.size());
  }
};  // class HostFlag

std::unique_ptr<::spdlog::pattern_formatter> make_default_formatter()
{
  auto formatter = std::make_unique<::spdlog::pattern_formatter>();
  formatter->add_flag<HostFlag>('h');
  formatter->set_pattern("[%h:%P:%t] [%n:%^%l%$] %v");
  return formatter;
}

::spdlog::sink_ptr make_default_sink()
{
  char const* const sink_name = std::getenv("MPSCOMPAT_LOG_FILE");
  std::string const sink_name_str(sink_name ? sink_name : "stdout");
  if (sink_name_str == "stdout")
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  if (sink_name_str == "stderr")
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return std::make_shared<spdlog::sinks::basic_file_sink_mt>(sink_name_str);
}

std::shared_ptr<::spdlog::logger> make_default_logger()
{
  auto logger =
    std::make_shared<::spdlog::logger>("mpscompat", make_default_sink());
  logger->set_formatter(make_default_formatter());
  logger->set_level(get_env_log_level());
  return logger;
}

}  // namespace

std::shared_ptr<::spdlog::logger>& mpscompat::default_logger()
{
  static std::shared_ptr<::spdlog::logger> logger_ = make_default_logger();
  return logger_;
}
