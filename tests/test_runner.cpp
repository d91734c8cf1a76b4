#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "playbook/runner.hpp"
#include "test_helpers.hpp"

using namespace playbook;
using playbook::test::ExitingStep;
using playbook::test::RecordingStep;

namespace {

std::vector<std::string> repeat(std::vector<std::string> unit, int n){
  std::vector<std::string> out;
  for(int i=0;i<n;++i) out.insert(out.end(), unit.begin(), unit.end());
  return out;
}

size_t count(const std::string& haystack, const std::string& needle){
  size_t n=0;
  for(size_t p=haystack.find(needle); p!=std::string::npos; p=haystack.find(needle, p+1)) ++n;
  return n;
}

struct ThrowingPrepare : Step {
  bool executed{false};
  ThrowingPrepare(): Step("ThrowingPrepare", "") {}
  void prepare() override { throw std::runtime_error("prepare failed"); }
  Transition execute() override { executed = true; return Transition::Continue; }
};

} // namespace

TEST(Runner, ContinueRunsEachHookOnceInOrder){
  std::vector<std::string> log;
  std::ostringstream out;
  Runner runner(out);
  RecordingStep step("Once", {Transition::Continue}, log);

  runner.run(step);

  EXPECT_EQ(log, (std::vector<std::string>{"prepare:Once", "execute:Once", "cleanup:Once"}));
  EXPECT_EQ(out.str().find("re-trying"), std::string::npos);
}

TEST(Runner, ShowsDescriptionBeforeExecuting){
  std::vector<std::string> log;
  std::ostringstream out;
  Runner runner(out);
  RecordingStep step("Shown", {Transition::Continue}, log);

  runner.run(step);

  EXPECT_EQ(out.str(), "\nRecording step Shown.\n\n");
}

TEST(Runner, RetryRestartsFromPrepareUntilContinue){
  std::vector<std::string> log;
  std::ostringstream out;
  Runner runner(out);
  const int retries = 3;
  std::vector<Transition> script(retries, Transition::Retry);
  script.push_back(Transition::Continue);
  RecordingStep step("Flaky", script, log);

  runner.run(step);

  auto expected = repeat({"prepare:Flaky", "execute:Flaky"}, retries + 1);
  expected.push_back("cleanup:Flaky");
  EXPECT_EQ(log, expected);
  EXPECT_EQ(count(out.str(), "re-trying Flaky...\n"), (size_t)retries);
  EXPECT_EQ(count(out.str(), "Recording step Flaky."), (size_t)retries + 1);
}

TEST(Runner, LongRetrySequencesDoNotGrowTheStack){
  std::vector<std::string> log;
  std::ostringstream out;
  Runner runner(out);
  std::vector<Transition> script(100000, Transition::Retry);
  script.push_back(Transition::Continue);
  RecordingStep step("Stubborn", script, log);

  runner.run(step);

  EXPECT_EQ(log.back(), "cleanup:Stubborn");
}

TEST(Runner, PrepareFailurePropagatesBeforeExecute){
  std::ostringstream out;
  Runner runner(out);
  ThrowingPrepare step;

  EXPECT_THROW(runner.run(step), std::runtime_error);
  EXPECT_FALSE(step.executed);
}

TEST(RunnerDeathTest, HaltExitsWithStatusOneAndSkipsCleanup){
  Runner runner(std::cerr);
  ExitingStep step("Stop", ExitingStep::Cleanup, 3, Transition::Halt);

  EXPECT_EXIT(runner.run(step), ::testing::ExitedWithCode(1), "cannot continue after Stop; exiting");
}

TEST(RunnerDeathTest, UnknownTransitionIsTreatedAsHalt){
  Runner runner(std::cerr);
  ExitingStep step("Odd", ExitingStep::Cleanup, 3, static_cast<Transition>(42));

  EXPECT_EXIT(runner.run(step), ::testing::ExitedWithCode(1), "cannot continue after Odd; exiting");
}

TEST(Transition, Names){
  EXPECT_EQ(to_string(Transition::Continue), "continue");
  EXPECT_EQ(to_string(Transition::Retry), "retry");
  EXPECT_EQ(to_string(Transition::Halt), "halt");
  EXPECT_EQ(to_string(static_cast<Transition>(7)), "unknown(7)");
}
