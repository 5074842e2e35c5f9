#include "common/common_pch.h"

#include "combine/combine_x.h"
#include "combine/selection.h"

#include "tests/unit/init.h"

namespace {

using namespace vmx::combine;

class SelectionTest: public ::testing::Test {
protected:
  vmxut::temporary_directory_c m_dir;
  selection_c m_selection;

  virtual void SetUp() override {
    vmxut::write_file(m_dir.file("a.mp4"), "a");
    vmxut::write_file(m_dir.file("b.mp4"), "b");

    m_selection.m_inputs = { m_dir.file("a.mp4"), m_dir.file("b.mp4") };
    m_selection.m_output = m_dir.file("out.mp4");
  }
};

TEST_F(SelectionTest, Valid) {
  EXPECT_NO_THROW(m_selection.validate());

  m_selection.m_volume = 0.0;
  EXPECT_NO_THROW(m_selection.validate());
}

TEST_F(SelectionTest, NoInputs) {
  m_selection.m_inputs.clear();
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, NoOutput) {
  m_selection.m_output.clear();
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, MissingInput) {
  m_selection.m_inputs.emplace_back(m_dir.file("missing.mp4"));
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, InputIsADirectory) {
  m_selection.m_inputs.emplace_back(m_dir.path());
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, OutputEqualsInput) {
  m_selection.m_output = m_dir.file("b.mp4");
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);

  m_selection.m_output = m_dir.path() / "." / "a.mp4";
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, OutputIsADirectory) {
  m_selection.m_output = m_dir.path();
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, OutputDirectoryMissing) {
  m_selection.m_output = m_dir.path() / "no" / "such" / "dir" / "out.mp4";
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST_F(SelectionTest, InvalidVolume) {
  m_selection.m_volume = -1.0;
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);

  m_selection.m_volume = std::numeric_limits<double>::infinity();
  EXPECT_THROW(m_selection.validate(), invalid_arguments_x);
}

TEST(Selection, EffectiveVolume) {
  config_c config;
  selection_c selection;

  EXPECT_DOUBLE_EQ(1.0, selection.effective_volume(config));

  config.m_default_volume = 0.8;
  EXPECT_DOUBLE_EQ(0.8, selection.effective_volume(config));

  selection.m_volume = 1.5;
  EXPECT_DOUBLE_EQ(1.5, selection.effective_volume(config));
}

TEST(Selection, ParseVolume) {
  EXPECT_DOUBLE_EQ(1.5, selection_c::parse_volume("1.5"));
  EXPECT_DOUBLE_EQ(0.0, selection_c::parse_volume("0"));
  EXPECT_DOUBLE_EQ(2.0, selection_c::parse_volume(" 2 "));

  EXPECT_THROW(selection_c::parse_volume("abc"),  invalid_arguments_x);
  EXPECT_THROW(selection_c::parse_volume("-1"),   invalid_arguments_x);
  EXPECT_THROW(selection_c::parse_volume(""),     invalid_arguments_x);
  EXPECT_THROW(selection_c::parse_volume("nan"),  invalid_arguments_x);
  EXPECT_THROW(selection_c::parse_volume("1e999"), invalid_arguments_x);
}

}
