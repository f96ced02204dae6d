#include "MCP.hpp"

#include <exception>
#include <string>

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/post.hpp>

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
// Upstream error bodies are not always UTF-8.
std::string dump(json const& j)
{
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json error_response(json const& id, int code, std::string const& message)
{
  return json{
      {"jsonrpc", "2.0"},
      {"id", id},
      {"error", {{"code", code}, {"message", message}}},
  };
}

json result_response(json const& id, json result)
{
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

bool has_string(json const& msg, char const* key, char const* value)
{
  auto const it = msg.find(key);
  return it != msg.end() && it->is_string() && *it == value;
}

bool is_tool_call(json const& msg)
{
  return msg.is_object() && msg.contains("id")
         && has_string(msg, "method", "tools/call");
}
} // namespace

namespace MCP {

Server::Server(Tools::Dispatcher const& tools,
               std::istream&            in,
               std::ostream&            out,
               std::size_t              threads)
  : tools_(tools)
  , in_(in)
  , out_(out)
  , pool_(threads)
{
}

void Server::run()
{
  std::string line;
  while (std::getline(in_, line)) {
    boost::algorithm::trim(line);
    if (line.empty())
      continue;

    json msg;
    try {
      msg = json::parse(line);
    }
    catch (json::parse_error const& e) {
      LOG(WARNING) << "unparsable message: " << e.what();
      send_(error_response(nullptr, parse_error, e.what()));
      continue;
    }

    // Tool calls may take a while, everything else is answered
    // right here, in order.
    if (is_tool_call(msg)) {
      boost::asio::post(pool_, [this, msg = std::move(msg)] { answer_(msg); });
    }
    else {
      answer_(msg);
    }
  }

  LOG(INFO) << "end of input, waiting for tool calls to finish";
  pool_.join();
}

std::optional<json> Server::handle(json const& msg) const
{
  if (!msg.is_object()) {
    return error_response(nullptr, invalid_request,
                          "message must be a JSON object");
  }

  auto const has_id = msg.contains("id");
  auto const id     = has_id ? msg["id"] : json(nullptr);

  auto const method = msg.find("method");
  if (method == msg.end()) {
    // A response to something we never asked, or junk.
    if (msg.contains("result") || msg.contains("error")) {
      LOG(INFO) << "ignoring response id " << dump(id);
      return std::nullopt;
    }
    return error_response(id, invalid_request, "no method");
  }
  if (!method->is_string() || !has_string(msg, "jsonrpc", "2.0")) {
    return error_response(id, invalid_request, "not a JSON-RPC 2.0 request");
  }

  auto const& name   = method->get_ref<std::string const&>();
  auto const  params = msg.value("params", json::object());

  if (!has_id) {
    LOG(INFO) << "notification " << name;
    return std::nullopt;
  }

  if (name == "initialize")
    return result_response(id, initialize_(params));

  if (name == "ping")
    return result_response(id, json::object());

  if (name == "tools/list")
    return result_response(id, list_tools_());

  if (name == "tools/call") {
    auto const tool = params.find("name");
    if (!params.is_object() || tool == params.end() || !tool->is_string()) {
      return error_response(id, invalid_params, "tools/call needs a name");
    }
    auto const arguments = params.value("arguments", json(nullptr));

    auto const res
        = tools_.call(tool->get_ref<std::string const&>(), arguments);

    if (auto const err = std::get_if<Tools::typed_error>(&res)) {
      return error_response(id, err->code, err->message);
    }

    auto const& payload = std::get<json>(res);
    return result_response(
        id, json{
                {"content", json::array({{{"type", "text"},
                                          {"text", dump(payload)}}})},
                {"structuredContent", payload},
                {"isError", false},
            });
  }

  return error_response(id, method_not_found,
                        "method \"" + name + "\" not found");
}

void Server::answer_(json const& msg)
{
  try {
    if (auto const res = handle(msg))
      send_(*res);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "internal error: " << e.what();
    auto const id = (msg.is_object() && msg.contains("id")) ? msg["id"]
                                                            : json(nullptr);
    send_(error_response(id, internal_error, e.what()));
  }
}

void Server::send_(json const& msg)
{
  auto const line = dump(msg);

  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << '\n' << std::flush;
  LOG_IF(ERROR, !out_) << "write to output failed";
}

json Server::initialize_(json const& params) const
{
  auto const client_version
      = params.is_object() ? params.value("protocolVersion", "") : "";

  LOG(INFO) << "initialize, client protocol version «" << client_version
            << "»";

  return json{
      {"protocolVersion",
       client_version.empty() ? protocol_version : client_version},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo",
       {
           {"name", server_name},
           {"version", server_version},
           {"title", server_title},
       }},
      {"instructions", instructions},
  };
}

json Server::list_tools_() const
{
  auto tools = json::array();
  for (auto const& t : tools_.list()) {
    tools.push_back(json{
        {"name", t.name},
        {"description", t.description},
        {"inputSchema", t.input_schema},
    });
  }
  return json{{"tools", tools}};
}

} // namespace MCP
