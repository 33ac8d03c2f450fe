#ifndef SERVER_H_
#define SERVER_H_

#include <httplib.h>
#include <nlohmann/json_fwd.hpp>
#include <scriptbox/config.h>
#include <scriptbox/execution.h>

// Routes:
//   POST /api/run-script         {script, scriptType?, timeout?, passcode}
//   POST /api/run-python-script  {script, timeout?, apiKey}
//   GET|HEAD /files/<path>       artifacts under the working directory, Range supported
//   GET /health
// Every connection gets its own thread, so a running script never delays other requests.
// config must outlive svr.
void SetupServer(httplib::Server& svr, const Config& config);

nlohmann::json ReportToJson(const ExecutionReport&);

// Blocks until the server stops; false if it cannot listen
bool RunServer(const Config& config);

#endif  // SERVER_H_
