#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <scriptbox/config.h>
#include <scriptbox/logger.h>
#include "server.h"

namespace {

bool ParseConfig(const fs::path& conf_path, Config& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  config.host = ini[""]["host"] | config.host;
  config.port = ini[""]["port"] | config.port;
  std::string working_dir = ini[""]["working_dir"] | "";
  if (working_dir.size()) config.working_dir = working_dir;
  config.passcode = ini[""]["passcode"] | config.passcode;
  config.interpreters.python = ini[""]["python"] | config.interpreters.python;
  config.interpreters.shell = ini[""]["shell"] | config.interpreters.shell;
  std::string collision = ini[""]["session_collision"] | "";
  if (collision.size() && !GetSessionCollision(collision, config.session_collision)) {
    spdlog::error("Unknown session_collision \"{}\" (expected reuse or suffix)", collision);
    return false;
  }
  return true;
}

Config ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "scriptbox-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--host")
    .help("Address to bind (default: 127.0.0.1)");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to bind (default: 3339)");
  parser.add_argument("--working-dir")
    .help("Working directory; scripts run under <working-dir>/tmp (default: current directory)");
  parser.add_argument("--passcode")
    .help("Shared secret every execution request must carry");
  parser.add_argument("--python")
    .help("Python interpreter (default: python3)");
  parser.add_argument("--shell")
    .help("Shell used for shell scripts (default: bash)");
  parser.add_argument("--reuse-sessions")
    .default_value(false)
    .implicit_value(true)
    .help("Reuse the session directory when two requests start in the same second");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  Config config;
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file, config)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(1);
    }
  }
  if (auto val = parser.present("--host")) config.host = *val;
  if (auto val = parser.present<int>("--port")) config.port = *val;
  if (auto val = parser.present("--working-dir")) config.working_dir = *val;
  if (auto val = parser.present("--passcode")) config.passcode = *val;
  if (auto val = parser.present("--python")) config.interpreters.python = *val;
  if (auto val = parser.present("--shell")) config.interpreters.shell = *val;
  if (parser["--reuse-sessions"] == true) config.session_collision = SessionCollision::REUSE;
  return config;
}

bool PrepareWorkingDir(Config& config) {
  std::error_code ec;
  fs::path dir = config.working_dir.empty() ? fs::current_path(ec) : fs::absolute(config.working_dir, ec);
  if (!ec) fs::create_directories(dir, ec);
  if (!ec) dir = fs::canonical(dir, ec);
  if (ec) {
    spdlog::error("Cannot prepare working directory {}: {}", config.working_dir.c_str(), ec.message());
    return false;
  }
  config.working_dir = dir;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  Config config = ParseArgs(argc, argv);
  if (config.passcode.empty()) {
    spdlog::error("A passcode is required (--passcode or passcode= in the configuration file)");
    return 1;
  }
  if (!PrepareWorkingDir(config)) return 1;
  spdlog::warn("Serving {} on {}:{}, session collision: {}", config.working_dir.c_str(),
               config.host, config.port, SessionCollisionName(config.session_collision));
  return RunServer(config) ? 0 : 1;
}
