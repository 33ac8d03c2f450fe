#ifndef INCLUDE_SCRIPTBOX_CONFIG_H_
#define INCLUDE_SCRIPTBOX_CONFIG_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

#define ENUM_SESSION_COLLISION_ \
  X(REUSE, "reuse") \
  X(SUFFIX, "suffix")
enum class SessionCollision {
#define X(name, str) name,
  ENUM_SESSION_COLLISION_
#undef X
};

struct Interpreters {
  std::string python = "python3";
  std::string shell = "bash";
};

// Created once at startup and passed by const reference afterwards
struct Config {
  std::string host = "127.0.0.1";
  int port = 3339;
  fs::path working_dir; // absolute & canonical
  std::string passcode;
  Interpreters interpreters;
  SessionCollision session_collision = SessionCollision::SUFFIX;
  std::vector<std::string> allowed_origins = {
    "http://localhost:5173",
    "https://magland.github.io",
  };
};

const char* SessionCollisionName(SessionCollision);
bool GetSessionCollision(const std::string&, SessionCollision&);

#endif  // INCLUDE_SCRIPTBOX_CONFIG_H_
