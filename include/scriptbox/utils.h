#ifndef INCLUDE_SCRIPTBOX_UTILS_H_
#define INCLUDE_SCRIPTBOX_UTILS_H_

#include <string>
#include <optional>
#include <string_view>

#include "script.h"

const char* ScriptKindName(ScriptKind);
std::optional<ScriptKind> GetScriptKind(const std::string&);

// Invalid sequences are replaced by U+FFFD, one per maximal invalid subpart
std::string SanitizeUtf8(std::string_view);

std::string Trim(std::string_view);

#endif  // INCLUDE_SCRIPTBOX_UTILS_H_
