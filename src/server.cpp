#include "server.h"

#include <mutex>
#include <thread>
#include <functional>
#include <optional>
#include <algorithm>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <scriptbox/utils.h>
#include <scriptbox/file_server.h>

#include "http_utils.h"

namespace {

const char kInvalidCredential[] = "Invalid API key";
constexpr size_t kFileChunkSize = 65536;

// One thread per connection. An execution holds its thread for up to the script
// timeout, so a fixed pool would let running scripts starve every other route.
class ThreadPerTaskQueue : public httplib::TaskQueue {
 public:
  bool enqueue(std::function<void()> fn) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return false;
    active_++;
    std::thread([this, fn = std::move(fn)] {
      fn();
      std::lock_guard<std::mutex> lock(mutex_);
      if (--active_ == 0) idle_.notify_all();
    }).detach();
    return true;
  }

  // waits for every connection in flight
  void shutdown() override {
    std::unique_lock<std::mutex> lock(mutex_);
    shutdown_ = true;
    idle_.wait(lock, [this] { return active_ == 0; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable idle_;
  size_t active_ = 0;
  bool shutdown_ = false;
};

bool CheckCredential(const Config& config, const nlohmann::json& body, const char* field) {
  auto it = body.find(field);
  return it != body.end() && it->is_string() && it->get_ref<const std::string&>() == config.passcode;
}

/// --- execution ---
// Returns false (with the response already filled) if the body cannot be turned into a ScriptSpec
bool ParseScriptSpec(const nlohmann::json& body, bool python_only, ScriptSpec& spec, httplib::Response& res) {
  using http_utils::SendDetail;
  auto script = body.find("script");
  if (script == body.end() || !script->is_string()) {
    SendDetail(res, 400, "script must be a string");
    return false;
  }
  spec.script = script->get<std::string>();

  if (auto timeout = body.find("timeout"); timeout != body.end() && !timeout->is_null()) {
    if (!timeout->is_number_integer()) {
      SendDetail(res, 400, "timeout must be an integer");
      return false;
    }
    // out-of-range values stay out of range so that validation rejects them
    spec.timeout = (int)std::clamp<long long>(timeout->get<long long>(), kMinTimeout - 1, kMaxTimeout + 1);
  }

  spec.kind = ScriptKind::PYTHON;
  if (auto type = body.find("scriptType"); !python_only && type != body.end() && !type->is_null()) {
    std::optional<ScriptKind> kind;
    if (type->is_string()) kind = GetScriptKind(type->get<std::string>());
    if (!kind) {
      ExecutionReport report;
      report.error = "scriptType must be 'python' or 'shell'";
      http_utils::SendJson(res, 200, ReportToJson(report));
      return false;
    }
    spec.kind = *kind;
  }
  return true;
}

void HandleRunScript(const Config& config, bool python_only,
                     const httplib::Request& req, httplib::Response& res) {
  auto body = http_utils::ParseJsonBody(req, res);
  if (!body) return;
  if (!CheckCredential(config, *body, python_only ? "apiKey" : "passcode")) {
    http_utils::SendDetail(res, 401, kInvalidCredential);
    return;
  }
  ScriptSpec spec;
  if (!ParseScriptSpec(*body, python_only, spec, res)) return;
  http_utils::SendJson(res, 200, ReportToJson(ExecuteScript(config, spec)));
}

/// --- files ---
void HandleFile(const Config& config, const httplib::Request& req, httplib::Response& res) {
  bool is_probe = req.method == "HEAD";
  // Range is interpreted by OpenFile; keep httplib from slicing the body a second time
  const_cast<httplib::Request&>(req).ranges.clear();
  FileSlice slice = OpenFile(config.working_dir, req.matches[1].str(),
                             is_probe ? AccessMode::PROBE : AccessMode::TRANSFER,
                             req.get_header_value("Range"));
  switch (slice.status) {
    case FileAccessStatus::OK: [[fallthrough]];
    case FileAccessStatus::PARTIAL: break;
    case FileAccessStatus::RANGE_NOT_SATISFIABLE:
      res.set_header("Content-Range", ContentRangeHeader(slice));
      [[fallthrough]];
    default:
      http_utils::SendDetail(res, FileAccessStatusCode(slice.status), FileAccessStatusDesc(slice.status));
      return;
  }

  res.status = FileAccessStatusCode(slice.status);
  res.set_header("Accept-Ranges", "bytes");
  if (slice.status == FileAccessStatus::PARTIAL) res.set_header("Content-Range", ContentRangeHeader(slice));
  uintmax_t base = slice.offset;
  fs::path path = slice.path;
  // not invoked for HEAD; Content-Length still reports the length
  res.set_content_provider(
      slice.length, GuessContentType(slice.path),
      [base, path](size_t offset, size_t length, httplib::DataSink& sink) {
        std::string buf;
        if (!ReadFileRange(path, base + offset, std::min(length, kFileChunkSize), buf)) return false;
        return sink.write(buf.data(), buf.size());
      });
}

/// --- CORS ---
void ApplyCors(const Config& config, const httplib::Request& req, httplib::Response& res) {
  std::string origin = req.get_header_value("Origin");
  if (origin.empty()) return;
  auto& allowed = config.allowed_origins;
  if (std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) return;
  res.set_header("Access-Control-Allow-Origin", origin);
  res.set_header("Access-Control-Allow-Credentials", "true");
  res.set_header("Access-Control-Expose-Headers", "Accept-Ranges, Content-Length, Content-Range");
  res.set_header("Vary", "Origin");
  if (req.method == "OPTIONS") {
    res.set_header("Access-Control-Allow-Methods", "GET, HEAD, POST, OPTIONS");
    std::string headers = req.get_header_value("Access-Control-Request-Headers");
    res.set_header("Access-Control-Allow-Headers", headers.empty() ? "Content-Type, Range" : headers);
  }
}

} // namespace

nlohmann::json ReportToJson(const ExecutionReport& report) {
  if (!report.success) {
    return {{"success", false}, {"timeout", false}, {"error", report.error}};
  }
  return {
    {"success", true},
    {"scriptDir", report.script_dir},
    {"scriptPath", report.script_path},
    {"exitCode", report.exit_code},
    {"stdout", report.out},
    {"stderr", report.err},
    {"timeout", report.timed_out},
    {"message", report.message},
    {"createdFiles", report.created_files},
    {"createdDirectories", report.created_dirs},
  };
}

void SetupServer(httplib::Server& svr, const Config& config) {
  svr.new_task_queue = [] { return new ThreadPerTaskQueue; };
  svr.Post("/api/run-script", [&config](const httplib::Request& req, httplib::Response& res) {
    HandleRunScript(config, false, req, res);
  });
  svr.Post("/api/run-python-script", [&config](const httplib::Request& req, httplib::Response& res) {
    HandleRunScript(config, true, req, res);
  });
  // HEAD requests are dispatched to GET handlers
  svr.Get(R"(/files/(.+))", [&config](const httplib::Request& req, httplib::Response& res) {
    HandleFile(config, req, res);
  });
  svr.Get("/health", [&config](const httplib::Request&, httplib::Response& res) {
    http_utils::SendJson(res, 200, {{"status", "ok"}, {"workingDir", config.working_dir.string()}});
  });
  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });
  svr.set_post_routing_handler([&config](const httplib::Request& req, httplib::Response& res) {
    ApplyCors(config, req, res);
  });
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, e.what());
      http_utils::SendDetail(res, 500, e.what());
    } catch (...) {
      spdlog::error("Unhandled non-standard exception on {} {}", req.method, req.path);
      http_utils::SendDetail(res, 500, "Internal server error");
    }
  });
  svr.set_logger(http_utils::LogRequest);
}

bool RunServer(const Config& config) {
  httplib::Server svr;
  SetupServer(svr, config);
  spdlog::info("Listening on {}:{}, working directory {}",
               config.host, config.port, config.working_dir.c_str());
  if (!svr.listen(config.host, config.port)) {
    spdlog::error("Failed to listen on {}:{}", config.host, config.port);
    return false;
  }
  return true;
}
