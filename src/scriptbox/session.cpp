#include <scriptbox/session.h>

#include <cerrno>
#include <system_error>

#include <spdlog/spdlog.h>
#include <scriptbox/paths.h>

#include "utils.h"

namespace {

// bound on "_N" suffixes tried within one second
constexpr int kMaxSuffix = 10000;

[[noreturn]] void ThrowIoError(const std::string& what, const fs::path& path, int err) {
  throw fs::filesystem_error(what, path, std::error_code(err, std::generic_category()));
}

} // namespace

Session AllocateSession(const Config& config, std::time_t now) {
  fs::path root = SessionRoot(config.working_dir);
  // throws if the working directory is not writable
  fs::create_directories(root);

  std::string base_name = SessionName(now);
  for (int i = 0; i <= kMaxSuffix; i++) {
    std::string name = i ? base_name + '_' + std::to_string(i) : base_name;
    fs::path dir = SessionPath(config.working_dir, name);
    if (fs::create_directory(dir)) {
      spdlog::debug("Allocated session {}", dir.c_str());
      return {dir, name, false};
    }
    // create_directory returns false (without error) only if something already exists there
    if (!fs::is_directory(dir)) ThrowIoError("session path exists and is not a directory", dir, ENOTDIR);
    if (config.session_collision == SessionCollision::REUSE) {
      spdlog::info("Session {} already exists; reusing it", dir.c_str());
      return {dir, name, true};
    }
  }
  ThrowIoError("too many sessions in one second", root / base_name, EEXIST);
}

fs::path MaterializeScript(const fs::path& session_dir, const ScriptSpec& spec) {
  fs::path path = ScriptPath(session_dir, spec.kind);
  if (!WriteFile(path, spec.script, ScriptPerm(spec.kind))) {
    ThrowIoError("cannot write script", path, errno ? errno : EIO);
  }
  return path;
}
