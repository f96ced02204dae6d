#ifndef MCP_DOT_HPP
#define MCP_DOT_HPP

#include "Tools.hpp"

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>

#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

// Model Context Protocol server on a pair of streams: one JSON-RPC
// 2.0 message per line in each direction.
// <https://modelcontextprotocol.io/specification/2025-06-18/basic/transports#stdio>

namespace MCP {

auto constexpr protocol_version{"2025-06-18"};

auto constexpr server_name{"rpki-mcp"};
auto constexpr server_version{"0.1.0"};
auto constexpr server_title{"MCP server for RPKI"};
auto constexpr instructions{
    "MCP server that exposes functionalities of RPKI relay parties"};

// JSON-RPC 2.0 error codes.
auto constexpr parse_error{-32700};
auto constexpr invalid_request{-32600};
auto constexpr method_not_found{-32601};
auto constexpr invalid_params{-32602};
auto constexpr internal_error{-32603};

class Server {
public:
  Server(Server const&) = delete;
  Server& operator=(Server const&) = delete;

  Server(Tools::Dispatcher const& tools,
         std::istream&            in,
         std::ostream&            out,
         std::size_t              threads);

  // Serve until end of input, then wait for the tool calls still
  // running and return.
  void run();

  // The response to one message, nothing for a notification.
  std::optional<nlohmann::json> handle(nlohmann::json const& msg) const;

private:
  void answer_(nlohmann::json const& msg);
  void send_(nlohmann::json const& msg);

  nlohmann::json initialize_(nlohmann::json const& params) const;
  nlohmann::json list_tools_() const;

  Tools::Dispatcher const& tools_;

  std::istream& in_;
  std::ostream& out_;
  std::mutex    out_mutex_;

  boost::asio::thread_pool pool_;
};

} // namespace MCP

#endif // MCP_DOT_HPP
