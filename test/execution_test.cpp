#include <set>
#include <thread>
#include <scriptbox/runner.h>
#include <scriptbox/execution.h>

#include "utils.h"

class ExecutionTest : public WorkingDirTest {
 protected:
  void SetUp() override {
    WorkingDirTest::SetUp();
    config.interpreters.shell = "sh";
  }

  ScriptSpec Shell(const std::string& script, int timeout = kDefaultTimeout) {
    ScriptSpec spec;
    spec.script = script;
    spec.kind = ScriptKind::SHELL;
    spec.timeout = timeout;
    return spec;
  }
};

TEST_F(ExecutionTest, ReportsCreatedArtifacts) {
  auto report = ExecuteScript(config, Shell("echo hi > out.txt; mkdir plots; echo done"));
  ASSERT_TRUE(report.success) << report.error;
  EXPECT_EQ(report.exit_code, 0);
  EXPECT_EQ(report.out, "done\n");
  EXPECT_EQ(report.err, "");
  EXPECT_FALSE(report.timed_out);
  EXPECT_EQ(report.message, "Script executed successfully");
  EXPECT_EQ(report.created_files, std::vector<std::string>{"out.txt"});
  EXPECT_EQ(report.created_dirs, std::vector<std::string>{"plots"});

  EXPECT_EQ(report.script_dir.rfind("tmp/", 0), 0u);
  EXPECT_EQ(report.script_path, report.script_dir + "/script.sh");
  EXPECT_TRUE(fs::is_regular_file(workdir / report.script_dir / "out.txt"));
  EXPECT_TRUE(fs::is_directory(workdir / report.script_dir / "plots"));
}

TEST_F(ExecutionTest, NonZeroExit) {
  auto report = ExecuteScript(config, Shell("echo oops >&2; exit 2"));
  ASSERT_TRUE(report.success);
  EXPECT_EQ(report.exit_code, 2);
  EXPECT_EQ(report.err, "oops\n");
  EXPECT_EQ(report.message, "Script exited with code 2");
}

TEST_F(ExecutionTest, Timeout) {
  auto report = ExecuteScript(config, Shell("echo started; sleep 30", 1));
  ASSERT_TRUE(report.success);
  EXPECT_TRUE(report.timed_out);
  EXPECT_EQ(report.exit_code, kExitSentinel);
  EXPECT_EQ(report.out, "");
  EXPECT_EQ(report.err, kTimedOutMessage);
  EXPECT_EQ(report.message, "Script execution timed out after 1 seconds");
}

TEST_F(ExecutionTest, RejectedBeforeAllocation) {
  for (int timeout : {0, 61}) {
    auto report = ExecuteScript(config, Shell("echo hi", timeout));
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.error, "Timeout must be between 1 and 60 seconds");
  }
  auto report = ExecuteScript(config, Shell(""));
  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.error, "Script content is required");
  EXPECT_FALSE(fs::exists(workdir / "tmp"));
}

TEST_F(ExecutionTest, MissingInterpreter) {
  config.interpreters.shell = "/nonexistent/shell";
  auto report = ExecuteScript(config, Shell("echo hi"));
  ASSERT_TRUE(report.success);
  EXPECT_EQ(report.exit_code, kExitSentinel);
  EXPECT_EQ(report.out, "");
  EXPECT_EQ(report.err.rfind("Error executing script: ", 0), 0u) << report.err;
  EXPECT_TRUE(report.created_files.empty());
}

TEST_F(ExecutionTest, UnwritableWorkingDir) {
  WriteText(workdir / "tmp", "not a directory");
  auto report = ExecuteScript(config, Shell("echo hi"));
  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.error.rfind("Failed to execute script: ", 0), 0u) << report.error;
}

TEST_F(ExecutionTest, ConcurrentExecutionsGetSeparateSessions) {
  constexpr int kRuns = 4;
  std::vector<ExecutionReport> reports(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back([&, i] {
      reports[i] = ExecuteScript(config, Shell("echo " + std::to_string(i) + " > mine.txt; sleep 1"));
    });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> dirs;
  for (int i = 0; i < kRuns; i++) {
    ASSERT_TRUE(reports[i].success) << reports[i].error;
    EXPECT_EQ(reports[i].exit_code, 0);
    EXPECT_EQ(reports[i].created_files, std::vector<std::string>{"mine.txt"});
    EXPECT_EQ(ReadText(workdir / reports[i].script_dir / "mine.txt"), std::to_string(i) + "\n");
    dirs.insert(reports[i].script_dir);
  }
  EXPECT_EQ(dirs.size(), (size_t)kRuns);
}

TEST_F(ExecutionTest, PythonScript) {
  if (!HasCommand(config.interpreters.python)) GTEST_SKIP() << "python3 not installed";
  ScriptSpec spec;
  spec.script = "import os\nopen('result.json', 'w').write('{}')\nprint(os.path.basename(os.getcwd()))\n";
  auto report = ExecuteScript(config, spec);
  ASSERT_TRUE(report.success);
  EXPECT_EQ(report.exit_code, 0);
  EXPECT_EQ(report.script_path, report.script_dir + "/script.py");
  EXPECT_EQ(report.out, fs::path(report.script_dir).filename().string() + "\n");
  EXPECT_EQ(report.created_files, std::vector<std::string>{"result.json"});
}
