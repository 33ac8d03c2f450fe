#include <scriptbox/execution.h>

#include <ctime>

#include <spdlog/spdlog.h>
#include <scriptbox/paths.h>
#include <scriptbox/runner.h>
#include <scriptbox/session.h>
#include <scriptbox/dir_diff.h>

#include "utils.h"

namespace {

std::string StatusMessage(const ProcessResult& res, int timeout) {
  if (res.timed_out) return "Script execution timed out after " + std::to_string(timeout) + " seconds";
  if (res.exit_code == 0) return "Script executed successfully";
  return "Script exited with code " + std::to_string(res.exit_code);
}

ExecutionReport Failure(std::string error) {
  ExecutionReport ret;
  ret.success = false;
  ret.error = std::move(error);
  return ret;
}

} // namespace

ExecutionReport ExecuteScript(const Config& config, const ScriptSpec& spec) {
  if (auto error = ValidateScriptSpec(spec)) {
    spdlog::info("Reject {} script: {}", ScriptKindName(spec.kind), *error);
    return Failure(std::move(*error));
  }

  Session session;
  fs::path script_path;
  try {
    session = AllocateSession(config, std::time(nullptr));
    script_path = MaterializeScript(session.dir, spec);
  } catch (const fs::filesystem_error& e) {
    spdlog::warn("Cannot prepare session: {}", e.what());
    return Failure(std::string("Failed to execute script: ") + e.what());
  }

  DirectorySnapshot before = TakeSnapshot(session.dir);
  RunOptions opt;
  opt.command = ScriptCommand(config.interpreters, spec.kind, script_path);
  opt.workdir = session.dir;
  opt.timeout = std::chrono::seconds(spec.timeout);
  ProcessResult res = RunBounded(opt);
  DirectoryDiff diff = DiffSnapshots(before, TakeSnapshot(session.dir));

  ExecutionReport ret;
  ret.success = true;
  ret.script_dir = RelativeToWorkdir(config.working_dir, session.dir);
  ret.script_path = RelativeToWorkdir(config.working_dir, script_path);
  ret.exit_code = res.exit_code;
  ret.out = std::move(res.out);
  ret.err = std::move(res.err);
  ret.timed_out = res.timed_out;
  ret.message = StatusMessage(res, spec.timeout);
  ret.created_files = std::move(diff.created_files);
  ret.created_dirs = std::move(diff.created_dirs);
  spdlog::info("Session {}: {} ({} files, {} directories created)", session.name, ret.message,
               ret.created_files.size(), ret.created_dirs.size());
  return ret;
}
