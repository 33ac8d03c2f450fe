#include "utils.h"

#include <thread>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

void WorkingDirTest::SetUp() {
  char path_tmp[256] = "/tmp/scriptbox_test_XXXXXX";
  if (!mkdtemp(path_tmp)) throw std::runtime_error("Failed to create");
  workdir = fs::canonical(path_tmp);
  config = Config();
  config.working_dir = workdir;
  config.passcode = "test-passcode";
}

void WorkingDirTest::TearDown() {
  fs::remove_all(workdir);
}

void WriteText(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout << content;
}

std::string ReadText(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

bool IsProcessRunning(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return false;
  std::string stat((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  char state = stat[pos + 2];
  return state != 'Z' && state != 'X';
}

bool WaitProcessGone(pid_t pid) {
  using namespace std::chrono_literals;
  for (int i = 0; i < 200; i++) {
    if (!IsProcessRunning(pid)) return true;
    std::this_thread::sleep_for(10ms);
  }
  return false;
}

bool HasCommand(const std::string& name) {
  const char* path = getenv("PATH");
  if (!path) return false;
  std::stringstream ss(path);
  for (std::string dir; std::getline(ss, dir, ':');) {
    if (!dir.empty() && access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}
