#ifndef INCLUDE_SCRIPTBOX_SCRIPT_H_
#define INCLUDE_SCRIPTBOX_SCRIPT_H_

#include <string>
#include <optional>

#define ENUM_SCRIPT_KIND_ \
  X(PYTHON, "python") \
  X(SHELL, "shell")
enum class ScriptKind {
#define X(name, kindname) name,
  ENUM_SCRIPT_KIND_
#undef X
};

// seconds
constexpr int kMinTimeout = 1;
constexpr int kMaxTimeout = 60;
constexpr int kDefaultTimeout = 10;

struct ScriptSpec {
  std::string script;
  ScriptKind kind = ScriptKind::PYTHON;
  int timeout = kDefaultTimeout;
};

// Returns the message to report if spec must be rejected before any work is done
std::optional<std::string> ValidateScriptSpec(const ScriptSpec&);

#endif  // INCLUDE_SCRIPTBOX_SCRIPT_H_
