/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line parsing
*/

#pragma once

#include "common/common_pch.h"

#include "common/translation.h"

namespace vmx::cli {

constexpr auto INDENT_DEFAULT = -1;

using parser_cb_t = std::function<void(void)>;

class parser_c {
protected:
  struct option_t {
    enum option_type_e {
      ot_option,
      ot_section_header,
      ot_information,
    };

    option_type_e m_type;
    std::string m_spec, m_name;
    translatable_string_c m_description;
    parser_cb_t m_callback;
    bool m_needs_arg;
    int m_indent;

    option_t();
    option_t(option_type_e type, translatable_string_c description, int indent = INDENT_DEFAULT);
    option_t(std::string spec, translatable_string_c description, parser_cb_t callback, bool needs_arg);

    std::string format_text();
  };

  std::map<std::string, option_t> m_option_map;
  std::vector<option_t> m_options;
  std::vector<std::string> m_args;

  std::string m_current_arg, m_next_arg;

protected:
  parser_c(std::vector<std::string> args);
  virtual ~parser_c() = default;

  void add_option(std::string const &spec, parser_cb_t const &callback, translatable_string_c description);
  void add_section_header(translatable_string_c const &title, int indent = INDENT_DEFAULT);
  void add_information(translatable_string_c const &information, int indent = INDENT_DEFAULT);
  void add_separator();
  void add_common_options();

  void parse_args();
  void set_usage();

  void dummy_callback();
};

}
