/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   configuration values shared by the front ends
*/

#include "common/common_pch.h"

#include <cmath>

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include "common/fs_sys_helpers.h"
#include "common/path.h"
#include "common/qt.h"
#include "common/strings/formatting.h"
#include "combine/config.h"

namespace vmx::combine {

namespace {

void
warn_invalid(std::string const &key,
             QVariant const &value) {
  mxwarn(fmt::format(FY("The configuration value '{0}' for '{1}' is invalid and has been ignored.\n"), to_utf8(value.toString()), key));
}

}

void
config_c::load(QSettings &settings) {
  settings.beginGroup("settings");

  auto value = settings.value("toolExecutable");
  if (value.isValid()) {
    auto tool = to_utf8(value.toString().trimmed());
    if (!tool.empty())
      m_tool_executable = tool;
    else
      warn_invalid("toolExecutable", value);
  }

  value = settings.value("defaultVolume");
  if (value.isValid()) {
    auto ok     = false;
    auto volume = value.toDouble(&ok);
    if (ok && std::isfinite(volume) && (volume >= 0))
      m_default_volume = volume;
    else
      warn_invalid("defaultVolume", value);
  }

  value = settings.value("audioTracksPerInput");
  if (value.isValid()) {
    auto ok         = false;
    auto num_tracks = value.toUInt(&ok);
    if (ok && (num_tracks >= 1) && (num_tracks <= MAX_AUDIO_TRACKS_PER_INPUT))
      m_audio_tracks_per_input = num_tracks;
    else
      warn_invalid("audioTracksPerInput", value);
  }

  value = settings.value("mixFilter");
  if (value.isValid()) {
    auto filter = mix_filter_from_string(to_utf8(value.toString()));
    if (filter)
      m_mix_filter = *filter;
    else
      warn_invalid("mixFilter", value);
  }

  m_video_codec = to_utf8(settings.value("videoCodec", Q(m_video_codec)).toString().trimmed());
  m_audio_codec = to_utf8(settings.value("audioCodec", Q(m_audio_codec)).toString().trimmed());

  value = settings.value("overwritePolicy");
  if (value.isValid()) {
    auto policy = overwrite_policy_from_string(to_utf8(value.toString()));
    if (policy)
      m_overwrite_policy = *policy;
    else
      warn_invalid("overwritePolicy", value);
  }

  settings.endGroup();
}

void
config_c::save(QSettings &settings)
  const {
  settings.beginGroup("settings");
  settings.setValue("toolExecutable",      Q(m_tool_executable));
  settings.setValue("defaultVolume",       m_default_volume);
  settings.setValue("audioTracksPerInput", m_audio_tracks_per_input);
  settings.setValue("mixFilter",           Q(to_string(m_mix_filter)));
  settings.setValue("videoCodec",          Q(m_video_codec));
  settings.setValue("audioCodec",          Q(m_audio_codec));
  settings.setValue("overwritePolicy",     Q(to_string(m_overwrite_policy)));
  settings.endGroup();
}

void
config_c::dump()
  const {
  mxinfo(fmt::format("config dump:\n"
                     "  tool_executable:        {0}\n"
                     "  default_volume:         {1}\n"
                     "  audio_tracks_per_input: {2}\n"
                     "  mix_filter:             {3}\n"
                     "  video_codec:            {4}\n"
                     "  audio_codec:            {5}\n"
                     "  overwrite_policy:       {6}\n",
                     m_tool_executable, vmx::string::format_shortest_double(m_default_volume), m_audio_tracks_per_input, to_string(m_mix_filter),
                     m_video_codec.empty() ? "<auto>"s : m_video_codec, m_audio_codec.empty() ? "<auto>"s : m_audio_codec, to_string(m_overwrite_policy)));
}

config_c
config_c::load_from(boost::filesystem::path const &file_name) {
  config_c config;
  QSettings settings{to_qs(file_name), QSettings::IniFormat};

  config.load(settings);

  return config;
}

boost::filesystem::path
config_c::default_file_name() {
  auto var = vmx::sys::get_environment_variable("VIDMIX_CONFIG_FILE");
  if (!var.empty())
    return vmx::fs::to_path(var);

  auto dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
  return vmx::fs::to_path(QDir{dir}.filePath(Q("vidmix.ini")));
}

std::optional<mix_filter_e>
mix_filter_from_string(std::string const &name) {
  auto lower = vmx::string::to_lower_ascii(name);

  if (lower == "amix")
    return mix_filter_e::amix;
  if (lower == "amerge")
    return mix_filter_e::amerge;

  return {};
}

std::optional<overwrite_policy_e>
overwrite_policy_from_string(std::string const &name) {
  auto lower = vmx::string::to_lower_ascii(name);

  if (lower == "overwrite")
    return overwrite_policy_e::overwrite;
  if (lower == "refuse")
    return overwrite_policy_e::refuse;
  if (lower == "ask")
    return overwrite_policy_e::ask;

  return {};
}

std::string
to_string(mix_filter_e filter) {
  return filter == mix_filter_e::amerge ? "amerge" : "amix";
}

std::string
to_string(overwrite_policy_e policy) {
  return policy == overwrite_policy_e::refuse ? "refuse"
       : policy == overwrite_policy_e::ask    ? "ask"
       :                                        "overwrite";
}

}
