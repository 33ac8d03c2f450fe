#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Helpers shared by the route handlers: JSON bodies, status codes, request logging

#include <string>
#include <optional>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace http_utils {

std::string FormatParams(const httplib::Params&);
bool IsSuccess(int code);

// One info line per request; parameters at debug level
void LogRequest(const httplib::Request&, const httplib::Response&);

void SendJson(httplib::Response&, int status, const nlohmann::json&);
// {"detail": message}
void SendDetail(httplib::Response&, int status, const std::string& message);

// Sends 400 and returns nothing if the body is not a JSON object
std::optional<nlohmann::json> ParseJsonBody(const httplib::Request&, httplib::Response&);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
