#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <filesystem>
#include <sys/types.h>

#include <gtest/gtest.h>
#include <scriptbox/config.h>

namespace fs = std::filesystem;

// Each test gets a fresh canonical working directory under /tmp
class WorkingDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  Config config;
  fs::path workdir;
};

void WriteText(const fs::path&, const std::string&);
std::string ReadText(const fs::path&);

// true while the process exists and is not a zombie
bool IsProcessRunning(pid_t);
// polls IsProcessRunning for up to 2 seconds
bool WaitProcessGone(pid_t);
bool HasCommand(const std::string& name);

#endif // TEST_UTILS_H_
