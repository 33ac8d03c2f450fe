#ifndef INCLUDE_SCRIPTBOX_RUNNER_H_
#define INCLUDE_SCRIPTBOX_RUNNER_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

#include <sys/types.h>

#include "config.h"
#include "script.h"

namespace fs = std::filesystem;

// exit code reported when the process did not exit by itself
constexpr int kExitSentinel = -1;
extern const char kTimedOutMessage[];

struct RunOptions {
  std::vector<std::string> command; // command[0] is looked up in PATH
  fs::path workdir;
  std::chrono::milliseconds timeout;
};

struct ProcessResult {
  pid_t pid = -1;
  int exit_code = kExitSentinel; // negative signal number if killed by a signal
  std::string out, err; // valid UTF-8
  bool timed_out = false;
};

std::vector<std::string> ScriptCommand(
    const Interpreters&, ScriptKind, const fs::path& script_path);

// Runs the command in its own process group with workdir as its working directory.
// When the timeout elapses, the whole group is killed and the child is reaped before
// returning; a spawn failure is reported in err with kExitSentinel.
// Blocks for at most timeout plus a short kill grace window.
ProcessResult RunBounded(const RunOptions&);

#endif  // INCLUDE_SCRIPTBOX_RUNNER_H_
