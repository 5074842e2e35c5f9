/** \brief command line parsing

   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   \file
*/

#include "common/common_pch.h"

#include "common/path.h"
#include "common/strings/parsing.h"
#include "common/translation.h"
#include "combine/combine_x.h"
#include "vidmix/vidmix_cli_parser.h"

using namespace vmx::combine;

vidmix_cli_parser_c::vidmix_cli_parser_c(std::vector<std::string> const &args)
  : vmx::cli::parser_c{args}
  , m_debug{"cli_parser"}
{
}

#define OPT(spec, func, description) add_option(spec, std::bind(&vidmix_cli_parser_c::func, this), description)

void
vidmix_cli_parser_c::init_parser() {
  add_information(YT("vidmix [options] -c -i <file1> [-i <file2> ...] -o <out>"));
  add_information(YT("vidmix [options] [-i <file1> ...] [-o <out>] [-v <factor>]"));

  add_separator();

  add_information(YT("Concatenates the input files in the order given and mixes the audio tracks of each input. "
                     "The volume of the first audio track of every input is scaled by the volume factor. "
                     "All processing is done by the external tool (FFmpeg). Without '--cli-mode' the graphical user interface is opened with the given files."));

  add_section_header(YT("Selection"));
  OPT("i|input=<file>",   add_input,   YT("Add an input file. Can be given more than once; the files are concatenated in this order."));
  OPT("o|output=<file>",  set_output,  YT("Write the result to this file."));
  OPT("v|volume=<factor>", set_volume, YT("Multiply the volume of the first audio track of every input by this non-negative factor (default: 1)."));
  OPT("c|cli-mode",       set_cli_mode, YT("Run without opening the graphical user interface."));

  add_section_header(YT("Processing"));
  OPT("audio-tracks=<n>",                     set_audio_tracks_per_input, YT("Number of audio tracks of every input that are mixed (default: 2)."));
  OPT("mix-filter=<amix|amerge>",             set_mix_filter,             YT("How the audio tracks of an input are combined (default: amix)."));
  OPT("video-codec=<name>",                   set_video_codec,            YT("Encode the video with this codec instead of the one chosen by the external tool."));
  OPT("audio-codec=<name>",                   set_audio_codec,            YT("Encode the audio with this codec instead of the one chosen by the external tool."));
  OPT("overwrite=<overwrite|refuse|ask>",     set_overwrite_policy,       YT("What to do if the output file exists already (default: overwrite)."));
  OPT("tool=<file>",                          set_tool,                   YT("Use this executable instead of 'ffmpeg' from the search path."));
  OPT("config=<file>",                        set_config_file,            YT("Read the settings from this file instead of the default settings file."));
  OPT("dry-run",                              set_dry_run,                YT("Only output the command that would be executed."));

  add_section_header(YT("Other options"));
  add_common_options();
}

#undef OPT

void
vidmix_cli_parser_c::add_input() {
  m_options.m_selection.m_inputs.emplace_back(vmx::fs::to_path(m_next_arg));
}

void
vidmix_cli_parser_c::set_output() {
  if (!m_options.m_selection.m_output.empty())
    mxerror(fmt::format(FY("'{0}' may only be given once.\n"), m_current_arg));

  m_options.m_selection.m_output = vmx::fs::to_path(m_next_arg);
}

void
vidmix_cli_parser_c::set_volume() {
  m_options.m_selection.m_volume = selection_c::parse_volume(m_next_arg);
}

void
vidmix_cli_parser_c::set_cli_mode() {
  m_cli_mode = true;
}

void
vidmix_cli_parser_c::set_audio_tracks_per_input() {
  unsigned int num_tracks{};

  if (!vmx::string::parse_number(m_next_arg, num_tracks) || (num_tracks < 1) || (num_tracks > MAX_AUDIO_TRACKS_PER_INPUT))
    throw invalid_arguments_x{fmt::format(FY("Invalid number of audio tracks '{0}'. It must be between 1 and {1}."), m_next_arg, MAX_AUDIO_TRACKS_PER_INPUT)};

  m_audio_tracks_per_input = num_tracks;
}

void
vidmix_cli_parser_c::set_mix_filter() {
  m_mix_filter = mix_filter_from_string(m_next_arg);
  if (!m_mix_filter)
    throw invalid_arguments_x{fmt::format(FY("Invalid mix filter '{0}'. Valid values are 'amix' and 'amerge'."), m_next_arg)};
}

void
vidmix_cli_parser_c::set_video_codec() {
  m_video_codec = m_next_arg;
}

void
vidmix_cli_parser_c::set_audio_codec() {
  m_audio_codec = m_next_arg;
}

void
vidmix_cli_parser_c::set_overwrite_policy() {
  m_overwrite_policy = overwrite_policy_from_string(m_next_arg);
  if (!m_overwrite_policy)
    throw invalid_arguments_x{fmt::format(FY("Invalid overwrite policy '{0}'. Valid values are 'overwrite', 'refuse' and 'ask'."), m_next_arg)};
}

void
vidmix_cli_parser_c::set_tool() {
  if (m_next_arg.empty())
    throw invalid_arguments_x{fmt::format(FY("'{0}' requires a non-empty file name."), m_current_arg)};

  m_tool_executable = m_next_arg;
}

void
vidmix_cli_parser_c::set_config_file() {
  auto file_name = vmx::fs::to_path(m_next_arg);

  if (!boost::filesystem::is_regular_file(file_name))
    throw invalid_arguments_x{fmt::format(FY("The configuration file '{0}' does not exist."), m_next_arg)};

  m_options.m_config_file_name = file_name;
}

void
vidmix_cli_parser_c::set_dry_run() {
  m_options.m_dry_run = true;
}

void
vidmix_cli_parser_c::load_config() {
  if (m_options.m_config_file_name.empty())
    m_options.m_config_file_name = config_c::default_file_name();

  mxdebug_if(m_debug, fmt::format("load_config: {0}\n", m_options.m_config_file_name.string()));

  if (boost::filesystem::is_regular_file(m_options.m_config_file_name))
    m_options.m_config = config_c::load_from(m_options.m_config_file_name);
}

void
vidmix_cli_parser_c::apply_overrides() {
  auto &config = m_options.m_config;

  if (m_tool_executable)
    config.m_tool_executable = *m_tool_executable;
  if (m_video_codec)
    config.m_video_codec = *m_video_codec;
  if (m_audio_codec)
    config.m_audio_codec = *m_audio_codec;
  if (m_audio_tracks_per_input)
    config.m_audio_tracks_per_input = *m_audio_tracks_per_input;
  if (m_mix_filter)
    config.m_mix_filter = *m_mix_filter;
  if (m_overwrite_policy)
    config.m_overwrite_policy = *m_overwrite_policy;
}

void
vidmix_cli_parser_c::check_required_arguments() {
  if (!m_cli_mode)
    return;

  if (m_options.m_selection.m_inputs.empty())
    throw invalid_arguments_x{Y("No input files have been given.")};

  if (m_options.m_selection.m_output.empty())
    throw invalid_arguments_x{Y("No output file name has been given.")};
}

options_c
vidmix_cli_parser_c::run() {
  init_parser();

  parse_args();

  m_options.m_selection.m_mode = m_cli_mode ? invocation_mode_e::cli : invocation_mode_e::interactive;

  load_config();
  apply_overrides();
  check_required_arguments();

  if (m_debug)
    m_options.dump();

  return m_options;
}
