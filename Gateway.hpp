#ifndef GATEWAY_DOT_HPP
#define GATEWAY_DOT_HPP

#include "Endpoint.hpp"
#include "Log.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace Gateway {

// Text used as the message of an upstream error when the body of the
// response could not be read.
auto constexpr unreadable_body{"<unreadable response body>"};

// Read-only client for a relying party's HTTP API.  Every call makes
// exactly one request, and either returns the decoded response
// re-encoded with the field names from Schema.hpp, or throws one of
// RPKI::network_error, RPKI::upstream_error or RPKI::decode_error.
class Client {
public:
  Client(Client const&) = delete;
  Client& operator=(Client const&) = delete;

  Client(Endpoint endpoint, Log& log, std::string user_agent);

  nlohmann::json get_status() const;
  nlohmann::json get_validity(std::string_view asn,
                              std::string_view prefix) const;
  nlohmann::json get_roas(std::string_view asn) const;

  Endpoint const& endpoint() const { return endpoint_; }

private:
  template <typename Shape>
  nlohmann::json fetch_(std::string const& url) const;

  Endpoint const    endpoint_;
  Log&              log_;
  std::string const user_agent_;
};

} // namespace Gateway

#endif // GATEWAY_DOT_HPP
