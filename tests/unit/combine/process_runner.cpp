#include "common/common_pch.h"

#include "combine/combine_x.h"
#include "combine/process_runner.h"

#include "tests/unit/init.h"

namespace {

using namespace vmx::combine;

class ProcessRunnerTest: public ::testing::Test {
protected:
  vmxut::temporary_directory_c m_dir;

  std::string script(std::string const &body) {
    return vmxut::write_script(m_dir.file("tool.sh"), body).string();
  }
};

TEST_F(ProcessRunnerTest, Success) {
  process_runner_c runner{script("echo 'line one'\n"
                                 "echo 'line two' >&2\n"
                                 "exit 0\n")};

  EXPECT_EQ(process_runner_c::state_e::idle, runner.get_state());
  EXPECT_FALSE(runner.get_exit_code().has_value());

  ASSERT_NO_THROW(runner.run({}));

  EXPECT_EQ(process_runner_c::state_e::succeeded, runner.get_state());
  ASSERT_TRUE(runner.get_exit_code().has_value());
  EXPECT_EQ(0, *runner.get_exit_code());
  EXPECT_EQ((std::vector<std::string>{ "line one", "line two" }), runner.get_output());
}

TEST_F(ProcessRunnerTest, ArgumentsArePassedVerbatim) {
  process_runner_c runner{script("for arg; do echo \"arg:$arg\"; done\n")};

  runner.run({ "-i", "my video.mkv", "[0:v:0][a0]concat=n=1:v=1:a=1[vout][aout]", "it's.mkv" });

  EXPECT_EQ((std::vector<std::string>{ "arg:-i", "arg:my video.mkv", "arg:[0:v:0][a0]concat=n=1:v=1:a=1[vout][aout]", "arg:it's.mkv" }), runner.get_output());
}

TEST_F(ProcessRunnerTest, NonZeroExitCode) {
  process_runner_c runner{script("echo 'Invalid data found when processing input' >&2\n"
                                 "exit 3\n")};

  try {
    runner.run({ "-i", "broken.mkv" });
    FAIL() << "no exception thrown";

  } catch (processing_failed_x const &ex) {
    EXPECT_EQ(3, ex.exit_code());
    EXPECT_FALSE(ex.crashed());
    EXPECT_EQ((std::vector<std::string>{ "Invalid data found when processing input" }), ex.output());
    EXPECT_NE(std::string::npos, ex.error().find("Invalid data found when processing input"));
  }

  EXPECT_EQ(process_runner_c::state_e::failed, runner.get_state());
  EXPECT_EQ(3, runner.get_exit_code().value_or(0));
}

TEST_F(ProcessRunnerTest, Crash) {
  process_runner_c runner{script("kill -9 $$\n")};

  try {
    runner.run({});
    FAIL() << "no exception thrown";

  } catch (processing_failed_x const &ex) {
    EXPECT_TRUE(ex.crashed());
  }

  EXPECT_EQ(process_runner_c::state_e::failed, runner.get_state());
}

TEST_F(ProcessRunnerTest, OnlyTheLastLinesAreKept) {
  process_runner_c runner{script("i=1\n"
                                 "while [ $i -le 60 ]; do echo \"line $i\"; i=$((i + 1)); done\n"
                                 "exit 1\n")};

  EXPECT_THROW(runner.run({}), processing_failed_x);

  auto output = runner.get_output();
  ASSERT_EQ(MAX_KEPT_OUTPUT_LINES, output.size());
  EXPECT_EQ("line 11", output.front());
  EXPECT_EQ("line 60", output.back());
}

TEST_F(ProcessRunnerTest, CarriageReturnsSeparateLines) {
  std::vector<std::string> handled;

  process_runner_c runner{script("printf 'frame=1\\rframe=2\\r\\nlast line without newline'\n")};
  runner.set_line_handler([&handled](std::string const &line) { handled.emplace_back(line); });

  runner.run({});

  std::vector<std::string> expected{ "frame=1", "frame=2", "last line without newline" };
  EXPECT_EQ(expected, runner.get_output());
  EXPECT_EQ(expected, handled);
}

TEST_F(ProcessRunnerTest, ToolNotFoundInPath) {
  process_runner_c runner{"vidmix-this-tool-does-not-exist"};

  EXPECT_THROW(runner.locate_tool(), tool_not_found_x);
  EXPECT_THROW(runner.run({}),       tool_not_found_x);
  EXPECT_EQ(process_runner_c::state_e::failed, runner.get_state());
}

TEST_F(ProcessRunnerTest, ExplicitPathMustBeExecutable) {
  auto file_name = m_dir.file("not-executable");
  vmxut::write_file(file_name, "#!/bin/sh\nexit 0\n");

  EXPECT_THROW(process_runner_c{file_name.string()}.locate_tool(),              tool_not_found_x);
  EXPECT_THROW(process_runner_c{m_dir.file("missing").string()}.locate_tool(), tool_not_found_x);
  EXPECT_THROW(process_runner_c{""}.locate_tool(),                              tool_not_found_x);

  try {
    process_runner_c{m_dir.file("missing").string()}.run({});
    FAIL() << "no exception thrown";

  } catch (tool_not_found_x const &ex) {
    EXPECT_EQ(m_dir.file("missing").string(), ex.tool());
  }
}

TEST_F(ProcessRunnerTest, LocateInSearchPath) {
  EXPECT_EQ("sh", process_runner_c{"sh"}.locate_tool().filename().string());
}

TEST_F(ProcessRunnerTest, QueryVersion) {
  process_runner_c runner{script("\n"
                                 "echo 'ffmpeg version 6.1.1-3ubuntu5 Copyright (c) 2000-2023 the FFmpeg developers'\n"
                                 "echo 'built with gcc 13 (Ubuntu 13.2.0-23ubuntu3)'\n")};

  auto version = runner.query_version();

  ASSERT_TRUE(version.valid);
  EXPECT_EQ("6.1.1-3ubuntu5", version.to_string());
  EXPECT_TRUE(version >= version_number_t{"4.0"});
}

TEST_F(ProcessRunnerTest, QueryVersionUnrecognized) {
  process_runner_c runner{script("echo 'Welcome to something else'\n")};

  EXPECT_FALSE(runner.query_version().valid);
}

TEST(ProcessRunner, StateNames) {
  EXPECT_EQ("idle",      to_string(process_runner_c::state_e::idle));
  EXPECT_EQ("running",   to_string(process_runner_c::state_e::running));
  EXPECT_EQ("succeeded", to_string(process_runner_c::state_e::succeeded));
  EXPECT_EQ("failed",    to_string(process_runner_c::state_e::failed));
}

}
