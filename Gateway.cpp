#include "Gateway.hpp"

#include "Error.hpp"
#include "HTTP.hpp"
#include "Schema.hpp"
#include "Url.hpp"

#include <exception>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Gateway {

Client::Client(Endpoint endpoint, Log& log, std::string user_agent)
  : endpoint_(std::move(endpoint))
  , log_(log)
  , user_agent_(std::move(user_agent))
{
  CHECK(!endpoint_.empty());
}

template <typename Shape>
nlohmann::json Client::fetch_(std::string const& url) const
{
  LOG_TO_SINK(&log_, INFO) << "GET " << url;

  auto const res = HTTP::get(Url::split(url), user_agent_);

  if (!res.success()) {
    throw RPKI::upstream_error(static_cast<int>(res.status),
                               res.body ? *res.body : unreadable_body);
  }

  if (!res.body) {
    throw RPKI::network_error(
        fmt::format("reading body of {}: {}", url, res.body_error),
        static_cast<int>(res.status));
  }

  Shape value;
  try {
    value = nlohmann::json::parse(*res.body).get<Shape>();
  }
  catch (std::exception const& e) {
    throw RPKI::decode_error(
        fmt::format("error decoding response body: {}", e.what()),
        static_cast<int>(res.status));
  }

  return nlohmann::json(value);
}

nlohmann::json Client::get_status() const
{
  return fetch_<Schema::status>(endpoint_.join("/api/v1/status"));
}

nlohmann::json Client::get_validity(std::string_view asn,
                                    std::string_view prefix) const
{
  return fetch_<Schema::validity>(
      endpoint_.join(fmt::format("/api/v1/validity/{}/{}", asn, prefix)));
}

nlohmann::json Client::get_roas(std::string_view asn) const
{
  return fetch_<Schema::roa_set>(
      endpoint_.join(fmt::format("/json?select-asn={}", asn)));
}

} // namespace Gateway
