// MCP server exposing an RPKI relying party's HTTP API and a local
// ROA file decoder.
//
//   rpki-mcp [flags] https://relying-party.example.net:8323

#include "Endpoint.hpp"
#include "Gateway.hpp"
#include "Log.hpp"
#include "MCP.hpp"
#include "Tools.hpp"
#include "fs.hpp"

#include <iostream>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(log_file, "logs/rpki_mcp.log", "persistent, append-only log");
DEFINE_int32(threads, 4, "number of tool calls served at once");
DEFINE_string(user_agent,
              "rpki-mcp/0.1.0",
              "User-Agent for requests to the relying party");

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("rpki-mcp [flags] endpoint-url");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  google::InitGoogleLogging(argv[0]);

  if (argc != 2) {
    std::cerr << gflags::ProgramInvocationShortName()
              << ": exactly one endpoint URL is required\n";
    return 1;
  }
  CHECK_GT(FLAGS_threads, 0) << "--threads must be positive";

  Endpoint    endpoint;
  std::string msg;
  if (!Endpoint::validate(argv[1], msg, endpoint)) {
    std::cerr << gflags::ProgramInvocationShortName() << ": " << msg << '\n';
    return 1;
  }

  fs::path const log_path{FLAGS_log_file};
  if (log_path.has_parent_path()) {
    error_code ec;
    fs::create_directories(log_path.parent_path(), ec);
    CHECK(!ec) << "can't create " << log_path.parent_path() << ": "
               << ec.message();
  }
  Log log{log_path};

  LOG_TO_SINK(&log, INFO) << MCP::server_name << ' ' << MCP::server_version
                          << " starting, endpoint " << endpoint;

  Gateway::Client const   client{endpoint, log, FLAGS_user_agent};
  Tools::Dispatcher const tools{client, log};

  std::ios::sync_with_stdio(false);
  MCP::Server server{tools, std::cin, std::cout,
                     static_cast<std::size_t>(FLAGS_threads)};
  server.run();

  LOG_TO_SINK(&log, INFO) << "end of input, exiting";
}
