#ifndef INCLUDE_SCRIPTBOX_PATHS_H_
#define INCLUDE_SCRIPTBOX_PATHS_H_

#include <ctime>
#include <string>
#include <filesystem>

#include "script.h"

namespace fs = std::filesystem;

extern const char kSessionRootRelative[];

// <working_dir>/tmp
fs::path SessionRoot(const fs::path& working_dir);
// YYYYMMDD_HHMMSS in local time
std::string SessionName(std::time_t);
fs::path SessionPath(const fs::path& working_dir, const std::string& name);

fs::path ScriptPath(const fs::path& session_dir, ScriptKind);
fs::perms ScriptPerm(ScriptKind);

// Paths reported to clients are relative to the working directory, '/'-separated
std::string RelativeToWorkdir(const fs::path& working_dir, const fs::path& path);

#endif  // INCLUDE_SCRIPTBOX_PATHS_H_
