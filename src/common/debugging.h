/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used in all programs, helper functions
*/

#pragma once

#include "common/common_pch.h"

#include <mutex>
#include <unordered_map>

class debugging_c {
protected:
  static bool ms_send_to_logger;
  static std::unordered_map<std::string, std::string> ms_debugging_options;

public:
  static void send_to_logger(bool enable);
  static void output(std::string const &msg);

  static bool requested(const char *option, std::string *arg = nullptr);
  static bool requested(const std::string &option, std::string *arg = nullptr) {
    return requested(option.c_str(), arg);
  }
  static void request(const std::string &options, bool enable = true);
  static void init();
};

class debugging_option_c {
  struct option_c {
    std::optional<bool> m_requested;
    std::string m_option;

    option_c(std::string const &option)
      : m_option{option}
    {
    }

    bool get() {
      if (!m_requested.has_value())
        m_requested = debugging_c::requested(m_option);

      return m_requested.value();
    }
  };

protected:
  mutable size_t m_registered_idx;
  std::string m_option;

private:
  // Guards the registry and the cached values. Options are evaluated
  // from worker threads as well as from the GUI thread.
  static std::mutex ms_mutex;
  static std::vector<option_c> ms_registered_options;

public:
  debugging_option_c(std::string const &option)
    : m_registered_idx{std::numeric_limits<size_t>::max()}
    , m_option{option}
  {
  }

  operator bool() const;

protected:
  std::size_t get_idx() const;

public:
  static size_t register_option(std::string const &option);
  static void invalidate_cache();

private:
  static size_t register_option_locked(std::string const &option);
};

#define mxdebug(msg) debugging_c::output(fmt::format("Debug> {0}:{1:04}: {2}", __FILE__, __LINE__, msg))

#define mxdebug_if(condition, msg) \
  if (condition) {                 \
    mxdebug(msg);                  \
  }
