#ifndef TOOLS_DOT_HPP
#define TOOLS_DOT_HPP

#include "Gateway.hpp"
#include "Log.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace Tools {

// JSON-RPC 2.0 error codes, for failures that happen before a tool
// gets to run.
auto constexpr method_not_found{-32601};
auto constexpr invalid_params{-32602};

struct typed_error {
  int         code;
  std::string message;
};

using result = std::variant<nlohmann::json, typed_error>;

struct descriptor {
  char const*    name;
  char const*    description;
  nlohmann::json input_schema;
};

// The fixed set of operations offered to a caller: "status",
// "validity", "roas" and "parseRoaFile".  Every error is written to
// the log before it's returned.
class Dispatcher {
public:
  Dispatcher(Dispatcher const&) = delete;
  Dispatcher& operator=(Dispatcher const&) = delete;

  Dispatcher(Gateway::Client const& client, Log& log);

  std::vector<descriptor> const& list() const { return tools_; }

  // Safe to call from several threads at once.
  result call(std::string_view name, nlohmann::json const& arguments) const;

  result status() const;
  result validity(std::string const& asn, std::string const& prefix) const;
  result roas(std::string const& asn) const;
  result parse_roa_file(std::string const& path) const;

private:
  template <typename Fn>
  result run_(std::string_view name, Fn&& fn) const;

  typed_error reject_(int code, std::string message) const;

  Gateway::Client const&        client_;
  Log&                          log_;
  std::vector<descriptor> const tools_;
};

} // namespace Tools

#endif // TOOLS_DOT_HPP
