#include "utils.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>
#include <scriptbox/config.h>

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";

static const char* kScriptKindNameTable[] = {
#define X(name, kindname) kindname,
  ENUM_SCRIPT_KIND_
#undef X
};

static const char* kSessionCollisionNameTable[] = {
#define X(name, str) str,
  ENUM_SESSION_COLLISION_
#undef X
};

} // namespace

const char* ScriptKindName(ScriptKind kind) {
  return kScriptKindNameTable[(int)kind];
}

std::optional<ScriptKind> GetScriptKind(const std::string& str) {
  for (size_t i = 0; i < sizeof(kScriptKindNameTable) / sizeof(kScriptKindNameTable[0]); i++) {
    if (str == kScriptKindNameTable[i]) return (ScriptKind)i;
  }
  return std::nullopt;
}

const char* SessionCollisionName(SessionCollision collision) {
  return kSessionCollisionNameTable[(int)collision];
}

bool GetSessionCollision(const std::string& str, SessionCollision& collision) {
  for (size_t i = 0; i < sizeof(kSessionCollisionNameTable) / sizeof(kSessionCollisionNameTable[0]); i++) {
    if (str == kSessionCollisionNameTable[i]) {
      collision = (SessionCollision)i;
      return true;
    }
  }
  return false;
}

std::optional<std::string> ValidateScriptSpec(const ScriptSpec& spec) {
  if (spec.timeout < kMinTimeout || spec.timeout > kMaxTimeout) {
    return "Timeout must be between " + std::to_string(kMinTimeout) + " and " +
           std::to_string(kMaxTimeout) + " seconds";
  }
  if (Trim(spec.script).empty()) return "Script content is required";
  return std::nullopt;
}

std::string SanitizeUtf8(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  size_t pos = 0;
  while (pos < str.size()) {
    unsigned char lead = str[pos];
    if (lead < 0x80) {
      ret.push_back(lead);
      pos++;
      continue;
    }
    // allowed range of the second byte excludes overlongs, surrogates and > U+10FFFF
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      len = 3;
      if (lead == 0xE0) lo = 0xA0;
      if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      len = 4;
      if (lead == 0xF0) lo = 0x90;
      if (lead == 0xF4) hi = 0x8F;
    } else {
      ret += kReplacementChar;
      pos++;
      continue;
    }
    size_t valid = 1;
    for (; valid < len && pos + valid < str.size(); valid++) {
      unsigned char ch = str[pos + valid];
      if (valid == 1 ? (ch < lo || ch > hi) : (ch < 0x80 || ch > 0xBF)) break;
    }
    if (valid == len) {
      ret.append(str.data() + pos, len);
    } else {
      ret += kReplacementChar;
    }
    pos += valid;
  }
  return ret;
}

std::string Trim(std::string_view str) {
  const char* kSpaces = " \t\n\r\f\v";
  size_t first = str.find_first_not_of(kSpaces);
  if (first == std::string_view::npos) return "";
  size_t last = str.find_last_not_of(kSpaces);
  return std::string(str.substr(first, last - first + 1));
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      ec.assign(errno ? errno : EIO, std::generic_category());
      goto err;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed writing file {}: {}", path.c_str(), ec.message());
  return false;
}
