/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html
*/

#pragma once

#include "common/common_pch.h"

#include "common/cli_parser.h"
#include "vidmix/options.h"

class vidmix_cli_parser_c: public vmx::cli::parser_c {
protected:
  options_c m_options;
  bool m_cli_mode{};

  std::optional<std::string> m_tool_executable, m_video_codec, m_audio_codec;
  std::optional<unsigned int> m_audio_tracks_per_input;
  std::optional<vmx::combine::mix_filter_e> m_mix_filter;
  std::optional<vmx::combine::overwrite_policy_e> m_overwrite_policy;

  debugging_option_c m_debug;

public:
  vidmix_cli_parser_c(std::vector<std::string> const &args);

  // Throws vmx::combine::invalid_arguments_x for unusable values.
  options_c run();

protected:
  void init_parser();

  void add_input();
  void set_output();
  void set_volume();
  void set_cli_mode();
  void set_audio_tracks_per_input();
  void set_mix_filter();
  void set_video_codec();
  void set_audio_codec();
  void set_overwrite_policy();
  void set_tool();
  void set_config_file();
  void set_dry_run();

  void load_config();
  void apply_overrides();
  void check_required_arguments();
};
