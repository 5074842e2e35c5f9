#include "common/common_pch.h"

#include "common/at_scope_exit.h"
#include "combine/combine_x.h"
#include "combine/combiner.h"
#include "combine/selection.h"

#include "tests/unit/init.h"

namespace {

using namespace vmx::combine;

// Writes "combined" to the last argument, the way the real tool writes
// its output file.
std::string const s_writing_tool =
  "for last; do :; done\n"
  "echo 'frame=  100 fps=0.0 q=-1.0 size=1kB'\n"
  "echo combined > \"$last\"\n";

std::string const s_failing_tool =
  "for last; do :; done\n"
  "echo partial > \"$last\"\n"
  "echo 'Stream specifier :a:1 in filtergraph description matches no streams.' >&2\n"
  "echo 'Conversion failed!' >&2\n"
  "exit 1\n";

// Rejects an output name that looks like an option, the way the real
// tool does.
std::string const s_option_parsing_tool =
  "for last; do :; done\n"
  "case \"$last\" in -*) echo \"Unrecognized option '$last'.\" >&2; exit 1;; esac\n"
  "echo combined > \"$last\"\n";

class CombinerTest: public ::testing::Test {
protected:
  vmxut::temporary_directory_c m_dir, m_tool_dir;
  config_c m_config;
  selection_c m_selection;

  virtual void SetUp() override {
    vmxut::write_file(m_dir.file("a.mp4"), "a");
    vmxut::write_file(m_dir.file("b.mp4"), "b");

    m_selection.m_inputs = { m_dir.file("a.mp4"), m_dir.file("b.mp4") };
    m_selection.m_output = m_dir.file("out.mp4");
    m_selection.m_volume = 1.5;
  }

  void use_tool(std::string const &body) {
    m_config.m_tool_executable = vmxut::write_script(m_tool_dir.file("ffmpeg"), body).string();
  }

  std::vector<std::string> entries() const {
    return vmxut::directory_entries(m_dir.path());
  }

  std::vector<std::string> entries_with(std::vector<std::string> names) const {
    std::sort(names.begin(), names.end());
    return names;
  }
};

TEST_F(CombinerTest, Success) {
  use_tool(s_writing_tool);

  std::vector<std::string> lines;
  combiner_c combiner{m_config};
  combiner.set_line_handler([&lines](std::string const &line) { lines.emplace_back(line); });

  ASSERT_NO_THROW(combiner.run(m_selection));

  EXPECT_EQ("combined\n", vmxut::read_file(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4", "out.mp4" }), entries());
  EXPECT_EQ((std::vector<std::string>{ "frame=  100 fps=0.0 q=-1.0 size=1kB" }), lines);
}

TEST_F(CombinerTest, SingleInput) {
  use_tool(s_writing_tool);

  m_selection.m_inputs.resize(1);
  m_selection.m_volume.reset();

  ASSERT_NO_THROW(combiner_c{m_config}.run(m_selection));
  EXPECT_TRUE(boost::filesystem::is_regular_file(m_selection.m_output));
}

TEST_F(CombinerTest, ToolFailsLeavesNothingBehind) {
  use_tool(s_failing_tool);

  try {
    combiner_c{m_config}.run(m_selection);
    FAIL() << "no exception thrown";

  } catch (processing_failed_x const &ex) {
    EXPECT_EQ(1, ex.exit_code());
    EXPECT_NE(std::string::npos, ex.error().find("Conversion failed!"));
    EXPECT_NE(std::string::npos, ex.error().find("matches no streams"));
  }

  EXPECT_FALSE(boost::filesystem::exists(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4" }), entries());
}

TEST_F(CombinerTest, ToolFailsKeepsExistingOutput) {
  use_tool(s_failing_tool);
  vmxut::write_file(m_selection.m_output, "old");

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), processing_failed_x);

  EXPECT_EQ("old", vmxut::read_file(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4", "out.mp4" }), entries());
}

TEST_F(CombinerTest, ToolDoesNotCreateOutput) {
  use_tool("exit 0\n");

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), processing_failed_x);
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4" }), entries());
}

TEST_F(CombinerTest, ToolNotFoundLeavesNothingBehind) {
  m_config.m_tool_executable = m_tool_dir.file("no-such-ffmpeg").string();

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), tool_not_found_x);

  EXPECT_FALSE(boost::filesystem::exists(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4" }), entries());
}

TEST_F(CombinerTest, ValidationHappensBeforeLocatingTheTool) {
  m_config.m_tool_executable = "vidmix-this-tool-does-not-exist";
  m_selection.m_inputs.emplace_back(m_dir.file("missing.mp4"));

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), invalid_arguments_x);
}

TEST_F(CombinerTest, OutputEqualsInput) {
  use_tool(s_writing_tool);
  m_selection.m_output = m_dir.file("a.mp4");

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), invalid_arguments_x);
  EXPECT_EQ("a", vmxut::read_file(m_dir.file("a.mp4")));
}

TEST_F(CombinerTest, ExistingOutputIsOverwritten) {
  use_tool(s_writing_tool);
  vmxut::write_file(m_selection.m_output, "old");

  ASSERT_NO_THROW(combiner_c{m_config}.run(m_selection));

  EXPECT_EQ("combined\n", vmxut::read_file(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4", "out.mp4" }), entries());
}

TEST_F(CombinerTest, ExistingOutputIsRefused) {
  use_tool(s_writing_tool);
  vmxut::write_file(m_selection.m_output, "old");
  m_config.m_overwrite_policy = overwrite_policy_e::refuse;

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), invalid_arguments_x);

  EXPECT_EQ("old", vmxut::read_file(m_selection.m_output));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4", "out.mp4" }), entries());
}

TEST_F(CombinerTest, ExistingOutputAsk) {
  use_tool(s_writing_tool);
  vmxut::write_file(m_selection.m_output, "old");
  m_config.m_overwrite_policy = overwrite_policy_e::ask;

  boost::filesystem::path asked_for;
  auto answer = false;

  combiner_c combiner{m_config};
  combiner.set_confirm_overwrite([&asked_for, &answer](boost::filesystem::path const &output) {
    asked_for = output;
    return answer;
  });

  EXPECT_THROW(combiner.run(m_selection), invalid_arguments_x);
  EXPECT_EQ(m_selection.m_output.string(), asked_for.string());
  EXPECT_EQ("old", vmxut::read_file(m_selection.m_output));

  answer = true;
  ASSERT_NO_THROW(combiner.run(m_selection));
  EXPECT_EQ("combined\n", vmxut::read_file(m_selection.m_output));
}

TEST_F(CombinerTest, AskWithoutCallbackRefuses) {
  use_tool(s_writing_tool);
  vmxut::write_file(m_selection.m_output, "old");
  m_config.m_overwrite_policy = overwrite_policy_e::ask;

  EXPECT_THROW(combiner_c{m_config}.run(m_selection), invalid_arguments_x);
  EXPECT_EQ("old", vmxut::read_file(m_selection.m_output));
}

TEST_F(CombinerTest, NoQuestionWithoutExistingOutput) {
  use_tool(s_writing_tool);
  m_config.m_overwrite_policy = overwrite_policy_e::ask;

  auto asked = false;
  combiner_c combiner{m_config};
  combiner.set_confirm_overwrite([&asked](boost::filesystem::path const &) {
    asked = true;
    return false;
  });

  ASSERT_NO_THROW(combiner.run(m_selection));
  EXPECT_FALSE(asked);
}

TEST_F(CombinerTest, DryRun) {
  m_config.m_tool_executable = "ffmpeg";

  auto args = combiner_c{m_config}.dry_run(m_selection);

  ASSERT_GE(args.size(), 2u);
  EXPECT_EQ("ffmpeg",                       args.front());
  EXPECT_EQ(m_selection.m_output.string(), args.back());
  EXPECT_NE(args.end(), std::find(args.begin(), args.end(), m_dir.file("a.mp4").string()));
  EXPECT_EQ(entries_with({ "a.mp4", "b.mp4" }), entries());
}

TEST_F(CombinerTest, DryRunValidates) {
  m_selection.m_inputs.clear();

  EXPECT_THROW(combiner_c{m_config}.dry_run(m_selection), invalid_arguments_x);
}

TEST_F(CombinerTest, RelativeOutputStartingWithDash) {
  use_tool(s_option_parsing_tool);

  auto previous_dir = boost::filesystem::current_path();
  boost::filesystem::current_path(m_dir.path());
  vmx::at_scope_exit_c restore_dir{[&previous_dir]() { boost::filesystem::current_path(previous_dir); }};

  m_selection.m_inputs = { "a.mp4", "b.mp4" };
  m_selection.m_output = "-x.mp4";

  ASSERT_NO_THROW(combiner_c{m_config}.run(m_selection));

  EXPECT_EQ("combined\n", vmxut::read_file(m_dir.file("-x.mp4")));
  EXPECT_EQ(entries_with({ "-x.mp4", "a.mp4", "b.mp4" }), entries());
}

TEST_F(CombinerTest, DryRunUsesAbsolutePaths) {
  auto previous_dir = boost::filesystem::current_path();
  boost::filesystem::current_path(m_dir.path());
  vmx::at_scope_exit_c restore_dir{[&previous_dir]() { boost::filesystem::current_path(previous_dir); }};

  m_selection.m_inputs = { "a.mp4" };
  m_selection.m_output = "-x.mp4";

  auto args = combiner_c{m_config}.dry_run(m_selection);

  ASSERT_GE(args.size(), 2u);
  EXPECT_EQ(boost::filesystem::absolute("-x.mp4").string(), args.back());
  EXPECT_NE(args.end(), std::find(args.begin(), args.end(), boost::filesystem::absolute("a.mp4").string()));
  EXPECT_EQ(args.end(),  std::find(args.begin(), args.end(), "a.mp4"));
}

}
