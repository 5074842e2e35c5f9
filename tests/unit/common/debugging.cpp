#include "common/common_pch.h"

#include <thread>

#include "tests/unit/init.h"

namespace {

class DebuggingOption: public ::testing::Test {
protected:
  virtual void TearDown() override {
    debugging_c::request("!");
  }
};

TEST_F(DebuggingOption, FollowsRequests) {
  debugging_option_c option{"unit_test_topic"};

  EXPECT_FALSE(option);

  debugging_c::request("unit_test_topic,other");
  EXPECT_TRUE(option);
  EXPECT_TRUE(debugging_option_c{"other"});

  debugging_c::request("unit_test_topic", false);
  EXPECT_FALSE(option);
  EXPECT_TRUE(debugging_option_c{"other"});
}

TEST_F(DebuggingOption, SameTopicSharesOneEntry) {
  EXPECT_EQ(debugging_option_c::register_option("shared_topic"), debugging_option_c::register_option("shared_topic"));
  EXPECT_NE(debugging_option_c::register_option("shared_topic"), debugging_option_c::register_option("another_topic"));
}

TEST_F(DebuggingOption, EvaluatedFromSeveralThreads) {
  debugging_c::request("threaded_topic");

  auto const num_threads = 4;
  std::vector<std::thread> threads;
  std::vector<int> hits(num_threads, 0);

  for (auto thread_idx = 0; thread_idx < num_threads; ++thread_idx)
    threads.emplace_back([thread_idx, &hits]() {
      for (auto idx = 0; idx < 250; ++idx) {
        if (debugging_option_c{"threaded_topic"})
          ++hits[thread_idx];
        if (debugging_option_c{fmt::format("thread_{0}_topic_{1}", thread_idx, idx)})
          --hits[thread_idx];
      }
    });

  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(std::vector<int>(num_threads, 250), hits);
}

}
