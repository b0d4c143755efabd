#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "ytp_forge/process_runner.hpp"

using namespace ytp_forge;
using ytp_forge::tests::TempDir;

namespace {

class ProcessRunnerTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string source;

  void SetUp() override {
    ASSERT_FALSE(dir.path().empty());
    source = dir.touch("clip.mp4");
  }

  CommandLine shell(const std::string &script) const {
    CommandLine cmd;
    cmd.executable = "/bin/sh";
    cmd.args = {"-c", script};
    cmd.primary_input = source;
    cmd.output_path = dir.file("out.mp4");
    return cmd;
  }
};

} // namespace

TEST(ExitCodeTest, NormalizesUnsignedWraparound) {
  EXPECT_EQ(normalize_exit_code(4294967294LL), -2);
  EXPECT_EQ(normalize_exit_code(2147483648LL), -2147483648LL);
  EXPECT_EQ(normalize_exit_code(2147483647LL), 2147483647LL);
  EXPECT_EQ(normalize_exit_code(3), 3);
  EXPECT_EQ(normalize_exit_code(0), 0);
  EXPECT_EQ(normalize_exit_code(-9), -9);
}

TEST(ExitCodeTest, KindNames) {
  EXPECT_STREQ(error_kind_name(RunErrorKind::MissingInput), "missing-input");
  EXPECT_STREQ(error_kind_name(RunErrorKind::ProcessExitedNonzero),
               "process-exited-nonzero");
}

TEST_F(ProcessRunnerTest, ForwardsEveryLineInOrder) {
  std::vector<std::string> lines;
  RunStatus st = run_process(
      shell("printf 'a\\nb\\n'; echo err 1>&2; printf 'c'"),
      [&lines](const std::string &l) { lines.push_back(l); });

  EXPECT_TRUE(st.ok()) << st.message;
  EXPECT_EQ(st.exit_code, 0);
  EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "err", "c"}));
}

TEST_F(ProcessRunnerTest, LinesArriveWhileChildIsRunning) {
  using Clock = std::chrono::steady_clock;
  auto start = Clock::now();
  std::vector<std::string> lines;
  std::vector<Clock::duration> arrivals;

  RunStatus st = run_process(shell("echo first; sleep 2; echo second"),
                             [&](const std::string &l) {
                               lines.push_back(l);
                               arrivals.push_back(Clock::now() - start);
                             });
  auto finished = Clock::now() - start;

  ASSERT_TRUE(st.ok()) << st.message;
  ASSERT_EQ(lines, (std::vector<std::string>{"first", "second"}));
  EXPECT_LT(arrivals[0], std::chrono::milliseconds(1500));
  EXPECT_GE(arrivals[1] - arrivals[0], std::chrono::milliseconds(1500));
  EXPECT_GE(finished - arrivals[0], std::chrono::milliseconds(1500));
}

TEST_F(ProcessRunnerTest, SmallChannelKeepsAllLines) {
  std::vector<std::string> lines;
  RunStatus st = run_process(
      shell("i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done"),
      [&lines](const std::string &l) { lines.push_back(l); }, 4);

  ASSERT_TRUE(st.ok()) << st.message;
  ASSERT_EQ(lines.size(), 2000u);
  EXPECT_EQ(lines.front(), "line0");
  EXPECT_EQ(lines[1234], "line1234");
  EXPECT_EQ(lines.back(), "line1999");
}

TEST_F(ProcessRunnerTest, NonzeroExitIsReported) {
  RunStatus st = run_process(shell("echo failing; exit 3"),
                             [](const std::string &) {});

  EXPECT_EQ(st.kind, RunErrorKind::ProcessExitedNonzero);
  EXPECT_EQ(st.raw_exit_code, 3);
  EXPECT_EQ(st.exit_code, 3);
  EXPECT_NE(st.message.find("3"), std::string::npos);
}

TEST_F(ProcessRunnerTest, SignalDeathIsNegative) {
  RunStatus st = run_process(shell("kill -9 $$"), [](const std::string &) {});

  EXPECT_EQ(st.kind, RunErrorKind::ProcessExitedNonzero);
  EXPECT_EQ(st.raw_exit_code, -9);
}

TEST_F(ProcessRunnerTest, MissingPrimaryIsNotSpawned) {
  std::string marker = dir.file("spawned");
  CommandLine cmd = shell("touch '" + marker + "'");
  cmd.primary_input = dir.file("absent.mp4");
  cmd.extra_inputs = {dir.touch("present.png"), dir.file("absent.png")};

  int sink_calls = 0;
  RunStatus st =
      run_process(cmd, [&sink_calls](const std::string &) { ++sink_calls; });

  EXPECT_EQ(st.kind, RunErrorKind::MissingInput);
  ASSERT_EQ(st.missing.size(), 2u);
  EXPECT_EQ(st.missing[0].role, "source");
  EXPECT_EQ(st.missing[0].path, dir.file("absent.mp4"));
  EXPECT_EQ(st.missing[1].role, "extra");
  EXPECT_EQ(st.missing[1].path, dir.file("absent.png"));
  EXPECT_NE(st.message.find("absent.mp4"), std::string::npos);

  EXPECT_EQ(sink_calls, 0);
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(ProcessRunnerTest, UnknownExecutable) {
  CommandLine cmd = shell("true");
  cmd.executable = "ytp_forge_no_such_encoder";

  RunStatus st = run_process(cmd, [](const std::string &) {});
  EXPECT_EQ(st.kind, RunErrorKind::ExecutableNotFound);
  EXPECT_NE(st.message.find("ytp_forge_no_such_encoder"), std::string::npos);
}

TEST_F(ProcessRunnerTest, ExecFailureWithEnoentIsNotFound) {
  // Executable file whose interpreter does not exist: execv fails with ENOENT
  std::string script = dir.touch("fake_ffmpeg", "#!/nonexistent/interpreter\n");
  std::filesystem::permissions(script, std::filesystem::perms::owner_all);

  CommandLine cmd = shell("true");
  cmd.executable = script;
  cmd.args.clear();

  RunStatus st = run_process(cmd, [](const std::string &) {});
  EXPECT_EQ(st.kind, RunErrorKind::ExecutableNotFound);
}

TEST_F(ProcessRunnerTest, ThrowingSinkKillsChild) {
  auto start = std::chrono::steady_clock::now();
  RunStatus st = run_process(shell("echo first; exec sleep 30"),
                             [](const std::string &) {
                               throw std::runtime_error("sink closed");
                             });
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(st.kind, RunErrorKind::StreamInterrupted);
  EXPECT_NE(st.message.find("sink closed"), std::string::npos);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(InputValidationTest, ValidateInputsAcceptsExistingFiles) {
  TempDir dir;
  CommandLine cmd;
  cmd.primary_input = dir.touch("clip.mp4");
  cmd.extra_inputs = {dir.touch("a.png"), dir.touch("b.wav")};

  RunStatus st = validate_inputs(cmd);
  EXPECT_TRUE(st.ok());
  EXPECT_TRUE(st.missing.empty());
}
