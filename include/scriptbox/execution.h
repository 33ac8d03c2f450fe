#ifndef INCLUDE_SCRIPTBOX_EXECUTION_H_
#define INCLUDE_SCRIPTBOX_EXECUTION_H_

#include <string>
#include <vector>

#include "config.h"
#include "script.h"

struct ExecutionReport {
  // false only if the script could not be run at all; see error
  bool success = false;
  std::string script_dir, script_path; // relative to the working directory
  int exit_code = 0;
  std::string out, err;
  bool timed_out = false;
  std::string message;
  std::vector<std::string> created_files, created_dirs;
  std::string error;
};

// validate -> allocate session -> write script -> snapshot -> run -> snapshot -> diff
ExecutionReport ExecuteScript(const Config&, const ScriptSpec&);

#endif  // INCLUDE_SCRIPTBOX_EXECUTION_H_
