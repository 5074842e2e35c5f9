#include "common/common_pch.h"

#include "combine/command_builder.h"
#include "combine/selection.h"

#include "tests/unit/init.h"

namespace {

using namespace vmx::combine;

std::vector<std::string>
build_for(std::vector<std::string> const &inputs,
          std::optional<double> volume = {},
          config_c const &config       = {}) {
  selection_c selection;

  for (auto const &input : inputs)
    selection.m_inputs.emplace_back(input);

  selection.m_output = "out.mkv";
  selection.m_volume = volume;

  return command_builder_c{selection, config}.build();
}

std::string
filter_graph_of(std::vector<std::string> const &args) {
  auto itr = std::find(args.begin(), args.end(), "-filter_complex");
  return (itr != args.end()) && ((itr + 1) != args.end()) ? *(itr + 1) : std::string{};
}

TEST(CommandBuilder, TwoInputsWithVolume) {
  auto args = build_for({ "a.mp4", "b.mp4" }, 1.5);

  std::vector<std::string> expected{
    "-hide_banner", "-nostdin", "-y",
    "-i", "a.mp4",
    "-i", "b.mp4",
    "-filter_complex",
    "[0:a:0]volume=1.5[a0_0];"
    "[a0_0][0:a:1]amix=inputs=2:duration=longest:dropout_transition=0:normalize=0[a0];"
    "[1:a:0]volume=1.5[a1_0];"
    "[a1_0][1:a:1]amix=inputs=2:duration=longest:dropout_transition=0:normalize=0[a1];"
    "[0:v:0][a0][1:v:0][a1]concat=n=2:v=1:a=1[vout][aout]",
    "-map", "[vout]", "-map", "[aout]",
    "out.mkv",
  };

  EXPECT_EQ(expected, args);
}

TEST(CommandBuilder, SingleInputStillConcatenates) {
  auto graph = filter_graph_of(build_for({ "x.mkv" }));

  EXPECT_EQ("[0:a:0]volume=1[a0_0];"
            "[a0_0][0:a:1]amix=inputs=2:duration=longest:dropout_transition=0:normalize=0[a0];"
            "[0:v:0][a0]concat=n=1:v=1:a=1[vout][aout]",
            graph);
}

TEST(CommandBuilder, OmittedVolumeEqualsUnity) {
  EXPECT_EQ(build_for({ "a.mp4", "b.mp4" }), build_for({ "a.mp4", "b.mp4" }, 1.0));
  EXPECT_NE(build_for({ "a.mp4", "b.mp4" }), build_for({ "a.mp4", "b.mp4" }, 0.7));
}

TEST(CommandBuilder, OmittedVolumeUsesConfigDefault) {
  config_c config;
  config.m_default_volume = 0.5;

  auto graph = filter_graph_of(build_for({ "a.mp4" }, std::nullopt, config));

  EXPECT_NE(std::string::npos, graph.find("[0:a:0]volume=0.5[a0_0]"));
}

TEST(CommandBuilder, VolumeIsAlwaysEmittedPerInput) {
  auto graph = filter_graph_of(build_for({ "1.mkv", "2.mkv", "3.mkv" }, 0.7));

  EXPECT_NE(std::string::npos, graph.find("[0:a:0]volume=0.7[a0_0]"));
  EXPECT_NE(std::string::npos, graph.find("[1:a:0]volume=0.7[a1_0]"));
  EXPECT_NE(std::string::npos, graph.find("[2:a:0]volume=0.7[a2_0]"));
  EXPECT_NE(std::string::npos, graph.find("[0:v:0][a0][1:v:0][a1][2:v:0][a2]concat=n=3:v=1:a=1[vout][aout]"));
}

TEST(CommandBuilder, InputsInOrderAndOutputLast) {
  std::vector<std::string> inputs{ "c.mkv", "a.mkv", "b.mkv", "a.mkv" };
  auto args = build_for(inputs);

  std::vector<std::string> found;
  for (auto idx = 0u; (idx + 1) < args.size(); ++idx)
    if (args[idx] == "-i")
      found.emplace_back(args[idx + 1]);

  EXPECT_EQ(inputs, found);
  EXPECT_EQ("out.mkv", args.back());
  EXPECT_EQ(1, std::count(args.begin(), args.end(), "out.mkv"));
}

TEST(CommandBuilder, SingleAudioTrackPassesThrough) {
  config_c config;
  config.m_audio_tracks_per_input = 1;

  EXPECT_EQ("[0:a:0]volume=2[a0_0];"
            "[a0_0]anull[a0];"
            "[1:a:0]volume=2[a1_0];"
            "[a1_0]anull[a1];"
            "[0:v:0][a0][1:v:0][a1]concat=n=2:v=1:a=1[vout][aout]",
            filter_graph_of(build_for({ "a", "b" }, 2.0, config)));
}

TEST(CommandBuilder, AmixKeepsTrackLevels) {
  config_c config;
  config.m_audio_tracks_per_input = 3;

  auto graph = filter_graph_of(build_for({ "a.mkv" }, 1.5, config));

  EXPECT_NE(std::string::npos, graph.find("[a0_0][0:a:1][0:a:2]amix=inputs=3:duration=longest:dropout_transition=0:normalize=0[a0]"));
}

TEST(CommandBuilder, ThreeAudioTracksWithAmerge) {
  auto graph = command_builder_c{}
    .add_input("a.mkv")
    .set_output("o.mkv")
    .set_volume(0.25)
    .set_audio_tracks_per_input(3)
    .set_mix_filter(mix_filter_e::amerge)
    .build_filter_graph();

  EXPECT_EQ("[0:a:0]volume=0.25[a0_0];"
            "[a0_0][0:a:1][0:a:2]amerge=inputs=3,aformat=channel_layouts=stereo[a0];"
            "[0:v:0][a0]concat=n=1:v=1:a=1[vout][aout]",
            graph);
}

TEST(CommandBuilder, Codecs) {
  config_c config;
  config.m_video_codec = "libx264";
  config.m_audio_codec = "aac";

  auto args = build_for({ "a.mp4" }, {}, config);

  ASSERT_GE(args.size(), 6u);
  std::vector<std::string> tail(args.end() - 6, args.end());
  EXPECT_EQ((std::vector<std::string>{ "[aout]", "-c:v", "libx264", "-c:a", "aac", "out.mkv" }), tail);

  config.m_video_codec.clear();
  args = build_for({ "a.mp4" }, {}, config);
  EXPECT_EQ(args.end(), std::find(args.begin(), args.end(), "-c:v"));
  EXPECT_NE(args.end(), std::find(args.begin(), args.end(), "-c:a"));
}

TEST(CommandBuilder, FormatVolume) {
  EXPECT_EQ("1",    command_builder_c::format_volume(1.0));
  EXPECT_EQ("1.5",  command_builder_c::format_volume(1.5));
  EXPECT_EQ("0.7",  command_builder_c::format_volume(0.7));
  EXPECT_EQ("0",    command_builder_c::format_volume(0.0));
}

TEST(CommandBuilder, ProgrammingErrors) {
  EXPECT_THROW(command_builder_c{}.set_output("o.mkv").build(),                                       vmx::invalid_parameter_x);
  EXPECT_THROW(command_builder_c{}.add_input("a.mkv").build(),                                        vmx::invalid_parameter_x);
  EXPECT_THROW(command_builder_c{}.add_input("a.mkv").set_audio_tracks_per_input(0).build_filter_graph(), vmx::invalid_parameter_x);
}

}
