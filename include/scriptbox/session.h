#ifndef INCLUDE_SCRIPTBOX_SESSION_H_
#define INCLUDE_SCRIPTBOX_SESSION_H_

#include <ctime>
#include <filesystem>

#include "config.h"
#include "script.h"

namespace fs = std::filesystem;

struct Session {
  fs::path dir;
  std::string name;
  bool reused = false; // only possible with SessionCollision::REUSE
};

// Creates <working_dir>/tmp/<timestamp> (and missing ancestors).
// With SessionCollision::SUFFIX, "_1", "_2", ... are appended until an unused name is
// created; with REUSE an existing directory is handed out again.
// Throws fs::filesystem_error if the directory cannot be created.
Session AllocateSession(const Config&, std::time_t now);

// Writes script.py / script.sh (0755) into the session directory, replacing any
// existing file. Throws fs::filesystem_error on failure.
fs::path MaterializeScript(const fs::path& session_dir, const ScriptSpec&);

#endif  // INCLUDE_SCRIPTBOX_SESSION_H_
