/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   the files and volume chosen for one invocation
*/

#include "common/common_pch.h"

#include <cmath>

#include "common/fs_sys_helpers.h"
#include "common/path.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "combine/combine_x.h"
#include "combine/selection.h"

namespace vmx::combine {

double
selection_c::effective_volume(config_c const &config)
  const {
  return m_volume ? *m_volume : config.m_default_volume;
}

void
selection_c::validate()
  const {
  if (m_inputs.empty())
    throw invalid_arguments_x{Y("No input files have been given.")};

  if (m_output.empty())
    throw invalid_arguments_x{Y("No output file name has been given.")};

  if (m_volume)
    validate_volume(*m_volume);

  for (auto const &input : m_inputs) {
    boost::system::error_code ec;

    if (!boost::filesystem::exists(input, ec))
      throw invalid_arguments_x{fmt::format(FY("The input file '{0}' does not exist."), input.string())};

    if (!boost::filesystem::is_regular_file(input, ec))
      throw invalid_arguments_x{fmt::format(FY("The input file '{0}' is not a regular file."), input.string())};

    if (!vmx::sys::is_readable_file(input))
      throw invalid_arguments_x{fmt::format(FY("The input file '{0}' is not readable."), input.string())};

    if (vmx::fs::is_same_file(input, m_output))
      throw invalid_arguments_x{fmt::format(FY("The output file '{0}' is also used as an input file."), m_output.string())};
  }

  boost::system::error_code ec;
  if (boost::filesystem::is_directory(m_output, ec))
    throw invalid_arguments_x{fmt::format(FY("The output file name '{0}' refers to a directory."), m_output.string())};

  auto output_dir = boost::filesystem::absolute(m_output).parent_path();
  if (!boost::filesystem::is_directory(output_dir, ec))
    throw invalid_arguments_x{fmt::format(FY("The directory '{0}' for the output file does not exist."), output_dir.string())};
}

void
selection_c::dump()
  const {
  mxinfo(fmt::format("selection dump:\n"
                     "  mode:   {0}\n"
                     "  output: {1}\n"
                     "  volume: {2}\n",
                     m_mode == invocation_mode_e::cli ? "cli" : "interactive",
                     m_output.string(),
                     m_volume ? vmx::string::format_shortest_double(*m_volume) : "<default>"s));

  for (auto const &input : m_inputs)
    mxinfo(fmt::format("  input:  {0}\n", input.string()));
}

double
selection_c::parse_volume(std::string const &value) {
  double volume{};

  if (!vmx::string::parse_floating_point_number(vmx::string::strip_copy(value), volume))
    throw invalid_arguments_x{fmt::format(FY("The volume factor '{0}' is not a valid number."), value)};

  validate_volume(volume);

  return volume;
}

void
selection_c::validate_volume(double volume) {
  if (!std::isfinite(volume) || (volume < 0))
    throw invalid_arguments_x{fmt::format(FY("The volume factor '{0}' must be a finite number greater than or equal to 0."), volume)};
}

}
