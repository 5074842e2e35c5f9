/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   builds the external tool's argument list
*/

#include "common/common_pch.h"

#include "common/strings/formatting.h"
#include "combine/command_builder.h"
#include "combine/selection.h"

namespace vmx::combine {

command_builder_c::command_builder_c(selection_c const &selection,
                                     config_c const &config)
  : m_inputs{selection.m_inputs}
  , m_output{selection.m_output}
  , m_volume{selection.effective_volume(config)}
  , m_audio_tracks_per_input{config.m_audio_tracks_per_input}
  , m_mix_filter{config.m_mix_filter}
  , m_video_codec{config.m_video_codec}
  , m_audio_codec{config.m_audio_codec}
{
}

command_builder_c &
command_builder_c::set_inputs(std::vector<boost::filesystem::path> const &inputs) {
  m_inputs = inputs;
  return *this;
}

command_builder_c &
command_builder_c::add_input(boost::filesystem::path const &input) {
  m_inputs.emplace_back(input);
  return *this;
}

command_builder_c &
command_builder_c::set_output(boost::filesystem::path const &output) {
  m_output = output;
  return *this;
}

command_builder_c &
command_builder_c::set_volume(double volume) {
  m_volume = volume;
  return *this;
}

command_builder_c &
command_builder_c::set_audio_tracks_per_input(unsigned int num_tracks) {
  m_audio_tracks_per_input = num_tracks;
  return *this;
}

command_builder_c &
command_builder_c::set_mix_filter(mix_filter_e filter) {
  m_mix_filter = filter;
  return *this;
}

command_builder_c &
command_builder_c::set_video_codec(std::string const &codec) {
  m_video_codec = codec;
  return *this;
}

command_builder_c &
command_builder_c::set_audio_codec(std::string const &codec) {
  m_audio_codec = codec;
  return *this;
}

std::string
command_builder_c::format_volume(double volume) {
  return vmx::string::format_shortest_double(volume);
}

/*
  For every input i:
    [i:a:0]volume=F[ai_0]
    [ai_0][i:a:1]...[i:a:K-1]amix=inputs=K:duration=longest:dropout_transition=0:normalize=0[ai]
  followed by
    [0:v:0][a0][1:v:0][a1]...concat=n=N:v=1:a=1[vout][aout]
 */
std::string
command_builder_c::build_filter_graph()
  const {
  if (m_inputs.empty())
    throw vmx::invalid_parameter_x{"command_builder_c: no inputs"};

  if (0 == m_audio_tracks_per_input)
    throw vmx::invalid_parameter_x{"command_builder_c: number of audio tracks per input must be at least 1"};

  auto const num_inputs = m_inputs.size();
  auto const volume     = format_volume(m_volume);
  std::vector<std::string> chains;
  std::string concat_inputs;

  for (auto idx = 0u; idx < num_inputs; ++idx) {
    chains.emplace_back(fmt::format("[{0}:a:0]volume={1}[a{0}_0]", idx, volume));

    auto mix = fmt::format("[a{0}_0]", idx);

    if (1 == m_audio_tracks_per_input)
      mix += "anull";

    else {
      for (auto track = 1u; track < m_audio_tracks_per_input; ++track)
        mix += fmt::format("[{0}:a:{1}]", idx, track);

      mix += m_mix_filter == mix_filter_e::amerge ? fmt::format("amerge=inputs={0},aformat=channel_layouts=stereo", m_audio_tracks_per_input)
           :                                        fmt::format("amix=inputs={0}:duration=longest:dropout_transition=0:normalize=0", m_audio_tracks_per_input);
    }

    chains.emplace_back(fmt::format("{0}[a{1}]", mix, idx));
    concat_inputs += fmt::format("[{0}:v:0][a{0}]", idx);
  }

  chains.emplace_back(fmt::format("{0}concat=n={1}:v=1:a=1[vout][aout]", concat_inputs, num_inputs));

  auto graph = vmx::string::join(chains, ";");

  mxdebug_if(m_debug, fmt::format("filter graph: {0}\n", graph));

  return graph;
}

std::vector<std::string>
command_builder_c::build()
  const {
  if (m_output.empty())
    throw vmx::invalid_parameter_x{"command_builder_c: no output"};

  std::vector<std::string> args{ "-hide_banner", "-nostdin", "-y" };

  for (auto const &input : m_inputs) {
    args.emplace_back("-i");
    args.emplace_back(input.string());
  }

  args.emplace_back("-filter_complex");
  args.emplace_back(build_filter_graph());
  args.insert(args.end(), { "-map", "[vout]", "-map", "[aout]" });

  if (!m_video_codec.empty())
    args.insert(args.end(), { "-c:v", m_video_codec });

  if (!m_audio_codec.empty())
    args.insert(args.end(), { "-c:a", m_audio_codec });

  args.emplace_back(m_output.string());

  mxdebug_if(m_debug, fmt::format("arguments: {0}\n", vmx::string::format_command_line(args)));

  return args;
}

}
