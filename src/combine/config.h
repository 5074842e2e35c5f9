/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   configuration values shared by the front ends
*/

#pragma once

#include "common/common_pch.h"

class QSettings;

namespace vmx::combine {

enum class mix_filter_e {
  amix,
  amerge,
};

enum class overwrite_policy_e {
  overwrite,
  refuse,
  ask,
};

constexpr auto MAX_AUDIO_TRACKS_PER_INPUT = 64u;

struct config_c {
  std::string m_tool_executable{"ffmpeg"};
  double m_default_volume{1.0};
  unsigned int m_audio_tracks_per_input{2};
  mix_filter_e m_mix_filter{mix_filter_e::amix};
  std::string m_video_codec, m_audio_codec;
  overwrite_policy_e m_overwrite_policy{overwrite_policy_e::overwrite};

  void load(QSettings &settings);
  void save(QSettings &settings) const;

  void dump() const;

  static config_c load_from(boost::filesystem::path const &file_name);
  static boost::filesystem::path default_file_name();
};

std::optional<mix_filter_e> mix_filter_from_string(std::string const &name);
std::optional<overwrite_policy_e> overwrite_policy_from_string(std::string const &name);
std::string to_string(mix_filter_e filter);
std::string to_string(overwrite_policy_e policy);

}
