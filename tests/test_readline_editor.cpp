#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

extern "C" {
#include <readline/history.h>
#include <readline/readline.h>
}

#include "playbook/line_editor.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

using namespace playbook;
using playbook::test::TempDir;

namespace {

// Points readline at a file instead of the terminal; prompts go to /dev/null.
struct ReadlineInput {
  FILE* in;
  FILE* out;
  FILE* old_in;
  FILE* old_out;

  explicit ReadlineInput(const fs::path& path)
    : in(std::fopen(path.c_str(), "r")), out(std::fopen("/dev/null", "w")),
      old_in(rl_instream), old_out(rl_outstream) {
    rl_instream = in;
    rl_outstream = out;
  }
  ~ReadlineInput(){
    rl_instream = old_in;
    rl_outstream = old_out;
    if(in) std::fclose(in);
    if(out) std::fclose(out);
  }
};

void write_lines(const fs::path& p, const std::vector<std::string>& lines){
  std::ofstream f(p);
  for(const auto& l : lines) f << l << "\n";
}

std::vector<std::string> read_lines(const fs::path& p){
  std::vector<std::string> out;
  std::ifstream f(p);
  for(std::string l; std::getline(f, l); ) out.push_back(l);
  return out;
}

std::vector<std::string> drain(ReadlineEditor& editor){
  std::vector<std::string> seen;
  while(auto line = editor.read_line("> ")) seen.push_back(*line);
  return seen;
}

class ReadlineEditorTest : public ::testing::Test {
protected:
  void SetUp() override { clear_history(); }
  void TearDown() override { clear_history(); }
  TempDir dir;
};

using ReadlineEditorDeathTest = ReadlineEditorTest;

} // namespace

TEST_F(ReadlineEditorTest, KeepsTheMostRecentEntriesAndSkipsRepeats){
  std::vector<std::string> input;
  for(int i=0; i<300; ++i) input.push_back("line" + std::to_string(i));
  input.push_back("line299");
  write_lines(dir.path / "input", input);
  auto hist = dir.path / "history";

  {
    ReadlineInput rl(dir.path / "input");
    ReadlineEditor editor(hist.string(), 256);
    EXPECT_EQ(drain(editor).size(), 301u);
  }

  auto saved = read_lines(hist);
  ASSERT_EQ(saved.size(), 256u);
  EXPECT_EQ(saved.front(), "line44");
  EXPECT_EQ(saved.back(), "line299");
}

TEST_F(ReadlineEditorTest, OnlyConsecutiveRepeatsAndEmptyLinesAreSkipped){
  write_lines(dir.path / "input", {"a", "a", "", "b", "a"});
  auto hist = dir.path / "history";

  {
    ReadlineInput rl(dir.path / "input");
    ReadlineEditor editor(hist.string(), 256);
    EXPECT_EQ(drain(editor), (std::vector<std::string>{"a", "a", "", "b", "a"}));
  }

  EXPECT_EQ(read_lines(hist), (std::vector<std::string>{"a", "b", "a"}));
}

TEST_F(ReadlineEditorTest, LoadsAnExistingHistoryFile){
  auto hist = dir.path / "history";
  write_lines(hist, {"alpha", "beta"});
  write_lines(dir.path / "input", {"gamma"});

  {
    ReadlineInput rl(dir.path / "input");
    ReadlineEditor editor(hist.string(), 256);
    ASSERT_EQ(history_length, 2);
    EXPECT_STREQ(history_get(history_base)->line, "alpha");
    EXPECT_STREQ(history_get(history_base + 1)->line, "beta");
    EXPECT_EQ(drain(editor), (std::vector<std::string>{"gamma"}));
  }

  EXPECT_EQ(read_lines(hist), (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST_F(ReadlineEditorTest, EmptyPathDisablesTheHistoryFile){
  ReadlineEditor editor("", 256);
  EXPECT_TRUE(editor.save_history());
  EXPECT_TRUE(fs::is_empty(dir.path));
}

TEST_F(ReadlineEditorTest, EndOfInputReturnsNothing){
  write_lines(dir.path / "input", {});
  ReadlineInput rl(dir.path / "input");
  ReadlineEditor editor("", 256);

  EXPECT_EQ(editor.read_line("> "), std::nullopt);
}

TEST_F(ReadlineEditorTest, CompletionGoesThroughTheInstalledHook){
  ReadlineEditor editor("", 256);
  editor.set_completion([](const std::string& prefix, int index) -> std::optional<std::string> {
    if(index > 0) return std::nullopt;
    return prefix + "!";
  });

  EXPECT_EQ(editor.candidates("go"), (std::vector<std::string>{"go!"}));
}

TEST_F(ReadlineEditorDeathTest, HistoryIsSavedWhenTheProcessExits){
  write_lines(dir.path / "input", {"before exit"});
  auto hist = dir.path / "history";

  EXPECT_EXIT({
    ReadlineInput rl(dir.path / "input");
    ReadlineEditor editor(hist.string(), 256);
    (void)editor.read_line("> ");
    std::exit(1);
  }, ::testing::ExitedWithCode(1), "");

  EXPECT_EQ(read_lines(hist), (std::vector<std::string>{"before exit"}));
}
