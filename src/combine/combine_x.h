/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   exceptions thrown while combining files
*/

#pragma once

#include "common/common_pch.h"

namespace vmx::combine {

class exception: public vmx::exception {
protected:
  std::string m_message;

public:
  explicit exception(std::string const &message)
    : m_message{message}
  {
  }

  virtual const char *what() const noexcept override {
    return m_message.c_str();
  }
};

class invalid_arguments_x: public exception {
public:
  explicit invalid_arguments_x(std::string const &message) : exception{message} {}
};

class tool_not_found_x: public exception {
protected:
  std::string m_tool;

public:
  tool_not_found_x(std::string const &tool, std::string const &message)
    : exception{message}
    , m_tool{tool}
  {
  }

  std::string const &tool() const {
    return m_tool;
  }
};

class processing_failed_x: public exception {
protected:
  int m_exit_code;
  bool m_crashed;
  std::vector<std::string> m_output;

public:
  processing_failed_x(std::string const &message, int exit_code = -1, bool crashed = false, std::vector<std::string> output = {})
    : exception{message}
    , m_exit_code{exit_code}
    , m_crashed{crashed}
    , m_output{std::move(output)}
  {
  }

  int exit_code() const {
    return m_exit_code;
  }

  bool crashed() const {
    return m_crashed;
  }

  std::vector<std::string> const &output() const {
    return m_output;
  }

  virtual std::string error() const noexcept override {
    if (m_output.empty())
      return m_message;

    return fmt::format("{0}\n{1}", m_message, fmt::join(m_output, "\n"));
  }
};

}
