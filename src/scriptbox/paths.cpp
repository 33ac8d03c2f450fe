#include <scriptbox/paths.h>

#include <fmt/chrono.h>

#include "utils.h"

const char kSessionRootRelative[] = "tmp";

namespace {

inline std::string ScriptExtension(ScriptKind kind) {
  switch (kind) {
    case ScriptKind::PYTHON: return ".py";
    case ScriptKind::SHELL: return ".sh";
  }
  __builtin_unreachable();
}

} // namespace

fs::path SessionRoot(const fs::path& working_dir) {
  return working_dir / kSessionRootRelative;
}

std::string SessionName(std::time_t time) {
  std::tm tm{};
  localtime_r(&time, &tm);
  return fmt::format("{:%Y%m%d_%H%M%S}", tm);
}

fs::path SessionPath(const fs::path& working_dir, const std::string& name) {
  return SessionRoot(working_dir) / name;
}

fs::path ScriptPath(const fs::path& session_dir, ScriptKind kind) {
  return session_dir / ("script" + ScriptExtension(kind));
}

fs::perms ScriptPerm(ScriptKind kind) {
  switch (kind) {
    // invoked directly by name as well, so it needs the execute bits
    case ScriptKind::SHELL: return kPerm755;
    case ScriptKind::PYTHON: return fs::perms::unknown;
  }
  __builtin_unreachable();
}

std::string RelativeToWorkdir(const fs::path& working_dir, const fs::path& path) {
  return path.lexically_relative(working_dir).generic_string();
}
