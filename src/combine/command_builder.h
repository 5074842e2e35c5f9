/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   builds the external tool's argument list
*/

#pragma once

#include "common/common_pch.h"

#include "combine/config.h"

namespace vmx::combine {

class selection_c;

class command_builder_c {
protected:
  std::vector<boost::filesystem::path> m_inputs;
  boost::filesystem::path m_output;
  double m_volume{1.0};
  unsigned int m_audio_tracks_per_input{2};
  mix_filter_e m_mix_filter{mix_filter_e::amix};
  std::string m_video_codec, m_audio_codec;

  debugging_option_c m_debug{"command_builder"};

public:
  command_builder_c() = default;
  command_builder_c(selection_c const &selection, config_c const &config);

  command_builder_c &set_inputs(std::vector<boost::filesystem::path> const &inputs);
  command_builder_c &add_input(boost::filesystem::path const &input);
  command_builder_c &set_output(boost::filesystem::path const &output);
  command_builder_c &set_volume(double volume);
  command_builder_c &set_audio_tracks_per_input(unsigned int num_tracks);
  command_builder_c &set_mix_filter(mix_filter_e filter);
  command_builder_c &set_video_codec(std::string const &codec);
  command_builder_c &set_audio_codec(std::string const &codec);

  std::string build_filter_graph() const;

  // The arguments without the program name. Throws
  // vmx::invalid_parameter_x if no input or no output has been set.
  std::vector<std::string> build() const;

  static std::string format_volume(double volume);
};

}
