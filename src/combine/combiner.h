/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   validates a selection, runs the external tool and puts the result in place
*/

#pragma once

#include "common/common_pch.h"

#include "combine/config.h"
#include "combine/process_runner.h"

namespace vmx::combine {

class selection_c;

class combiner_c {
public:
  using confirm_overwrite_cb_t = std::function<bool(boost::filesystem::path const &)>;

protected:
  config_c m_config;
  confirm_overwrite_cb_t m_confirm_overwrite;
  process_runner_c::line_handler_t m_line_handler;

  debugging_option_c m_debug{"combiner"};

public:
  explicit combiner_c(config_c config);

  combiner_c &set_confirm_overwrite(confirm_overwrite_cb_t const &callback);
  combiner_c &set_line_handler(process_runner_c::line_handler_t const &handler);

  config_c const &get_config() const;

  // Throws invalid_arguments_x, tool_not_found_x or processing_failed_x.
  // Nothing is written to the output path unless the tool succeeds.
  void run(selection_c const &selection);

  // The full command line (program first) that run() would execute with
  // the final output name in place of the temporary one.
  std::vector<std::string> dry_run(selection_c const &selection) const;

protected:
  void check_overwrite(boost::filesystem::path const &output) const;
};

}
