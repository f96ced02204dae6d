#include "MCP.hpp"

#include "fake-upstream.hpp"

#include <map>
#include <sstream>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
auto constexpr roas_body = R"({
  "metadata": {"generated": 1714564263, "generatedTime": "2024-05-01T11:51:03Z"},
  "roas": [
    {"asn": "AS65000", "prefix": "192.0.2.0/24", "maxLength": 24, "ta": "arin"}
  ]
})";

auto constexpr session = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"test","version":"1"}}}
{"jsonrpc":"2.0","method":"notifications/initialized"}
{"jsonrpc":"2.0","id":2,"method":"tools/list"}
  {"jsonrpc":"2.0","id":"p","method":"ping"}

{"jsonrpc":"2.0","id":3,"method":"resources/list"}
{not json
{"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"roas","arguments":{"asn":"AS65000"}}}
{"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"validity","arguments":{"asn":"AS65000","prefix":"203.0.113.0/24"}}}
{"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"validity","arguments":{"asn":"AS65000"}}}
{"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"nope"}}
{"jsonrpc":"2.0","id":8,"method":"tools/call","params":{}}
{"jsonrpc":"2.0","id":9,"method":42}
{"id":10,"method":"ping"}
[1,2]
{"jsonrpc":"2.0","id":11,"result":{}}
)";
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const log_path
      = fs::temp_directory_path() / fmt::format("MCP-test-{}.log", ::getpid());

  fake_upstream up({
      {"/json?select-asn=AS65000", {200, roas_body}},
      {"/api/v1/validity/AS65000/203.0.113.0/24", {404, "not found"}},
  });

  Log                     log(log_path);
  Gateway::Client const   rp(Endpoint(up.url()), log, "rpki-mcp-test/1.0");
  Tools::Dispatcher const tools(rp, log);

  std::istringstream in(session);
  std::ostringstream out;

  MCP::Server server(tools, in, out, 2);
  server.run();

  std::map<std::string, json> by_id;
  auto                        anonymous{0};

  std::istringstream lines(out.str());
  for (std::string line; std::getline(lines, line);) {
    auto const msg = json::parse(line);
    CHECK_EQ(msg["jsonrpc"], "2.0");
    if (msg["id"].is_null()) {
      auto const code = msg["error"]["code"].get<int>();
      CHECK(code == MCP::parse_error || code == MCP::invalid_request) << line;
      ++anonymous;
      continue;
    }
    auto const id = msg["id"].dump();
    CHECK(!by_id.count(id)) << "two answers for " << id;
    by_id[id] = msg;
  }

  CHECK_EQ(anonymous, 2);
  CHECK_EQ(by_id.size(), 11u);
  CHECK(!by_id.count("11"));

  auto const& init = by_id.at("1")["result"];
  CHECK_EQ(init["protocolVersion"], "2025-03-26");
  CHECK_EQ(init["serverInfo"]["name"], MCP::server_name);
  CHECK_EQ(init["serverInfo"]["version"], MCP::server_version);
  CHECK(init["capabilities"].contains("tools"));
  CHECK_EQ(init["instructions"], MCP::instructions);

  auto const& listed = by_id.at("2")["result"]["tools"];
  CHECK_EQ(listed.size(), 4u);
  CHECK_EQ(listed[0]["name"], "status");
  CHECK_EQ(listed[3]["name"], "parseRoaFile");
  CHECK_EQ(listed[1]["inputSchema"]["type"], "object");
  CHECK(listed[1]["inputSchema"]["properties"].contains("prefix"));
  CHECK(!listed[2]["description"].get<std::string>().empty());

  CHECK_EQ(by_id.at("\"p\"")["result"], json::object());

  CHECK_EQ(by_id.at("3")["error"]["code"], MCP::method_not_found);

  auto const& call = by_id.at("4")["result"];
  CHECK_EQ(call["isError"], false);
  CHECK_EQ(call["structuredContent"]["roas"][0]["prefix"], "192.0.2.0/24");
  CHECK_EQ(call["content"].size(), 1u);
  CHECK_EQ(call["content"][0]["type"], "text");
  CHECK_EQ(json::parse(call["content"][0]["text"].get<std::string>()),
           call["structuredContent"]);

  auto const& upstream = by_id.at("5")["error"];
  CHECK_EQ(upstream["code"], 404);
  CHECK_EQ(upstream["message"], "not found");

  CHECK_EQ(by_id.at("6")["error"]["code"], MCP::invalid_params);
  CHECK_EQ(by_id.at("7")["error"]["code"], MCP::method_not_found);
  CHECK_EQ(by_id.at("8")["error"]["code"], MCP::invalid_params);
  CHECK_EQ(by_id.at("9")["error"]["code"], MCP::invalid_request);
  CHECK_EQ(by_id.at("10")["error"]["code"], MCP::invalid_request);

  // Straight to handle().
  auto const bare = server.handle(json::parse(
      R"({"jsonrpc":"2.0","id":"x","method":"initialize","params":{}})"));
  CHECK(bare);
  CHECK_EQ((*bare)["result"]["protocolVersion"], MCP::protocol_version);

  CHECK(!server.handle(json::parse(
      R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":4}})")));

  fs::remove(log_path);
}
