#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatParams(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  if (IsSuccess(res.status)) {
    spdlog::info("{} {} {} from {}", req.method, req.path, res.status, req.remote_addr);
  } else {
    spdlog::warn("{} {} {} from {}", req.method, req.path, res.status, req.remote_addr);
  }
  spdlog::debug("params {}", FormatParams(req.params));
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
  using nlohmann::json;
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendDetail(httplib::Response& res, int status, const std::string& message) {
  SendJson(res, status, {{"detail", message}});
}

std::optional<nlohmann::json> ParseJsonBody(const httplib::Request& req, httplib::Response& res) {
  auto body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    SendDetail(res, 400, "Request body must be a JSON object");
    return std::nullopt;
  }
  return body;
}

} // namespace http_utils
