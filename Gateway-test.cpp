#include "Gateway.hpp"

#include "Error.hpp"
#include "fake-upstream.hpp"

#include <cstdlib>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
auto constexpr status_body = R"({
  "version": "routinator/0.13.2",
  "serial": 42,
  "now": "2024-05-01T12:00:00+00:00",
  "lastUpdateStart": "2024-05-01T11:50:00+00:00",
  "lastUpdateDone": "2024-05-01T11:51:03+00:00",
  "lastUpdateDuration": 63
})";

auto constexpr validity_body = R"({
  "validated_route": {
    "route": {"origin_asn": "AS65000", "prefix": "192.0.2.0/24"},
    "validity": {
      "state": "valid",
      "description": "At least one VRP Matches the Route Prefix",
      "VRPs": {
        "matched": [{"asn": "AS65000", "prefix": "192.0.2.0/24", "max_length": "24"}],
        "unmatched_as": [],
        "unmatched_length": []
      }
    }
  },
  "generatedTime": "2024-05-01T11:51:03Z"
})";

auto constexpr roas_body = R"({
  "metadata": {"generated": 1714564263, "generatedTime": "2024-05-01T11:51:03Z"},
  "roas": [
    {"asn": "AS65000", "prefix": "192.0.2.0/24", "maxLength": 24, "ta": "arin"},
    {"asn": "AS65000", "prefix": "2001:db8::/32", "maxLength": 48, "ta": "ripe"}
  ]
})";

Endpoint endpoint(fake_upstream const& up, char const* base)
{
  return Endpoint(fmt::format("{}{}", up.url(), base));
}

template <typename Error, typename Fn>
Error fails(Fn&& fn)
{
  try {
    fn();
  }
  catch (Error const& e) {
    LOG(INFO) << e.kind() << " " << e.code() << " " << e.what();
    return e;
  }
  LOG(FATAL) << "should have thrown";
  std::abort();
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const log_path
      = fs::temp_directory_path() / fmt::format("Gateway-test-{}.log", ::getpid());
  Log log(log_path);

  fake_upstream up({
      {"/api/v1/status", {200, status_body}},
      {"/api/v1/validity/AS65000/192.0.2.0/24", {200, validity_body}},
      {"/api/v1/validity/AS65000/203.0.113.0/24", {404, "not found"}},
      {"/json?select-asn=AS65000", {200, roas_body}},

      {"/starting/api/v1/status", {503, R"({"error": "not ready"})"}},
      {"/error-shape/api/v1/status", {200, R"({"error": "initial validation ongoing"})"}},
      {"/neither/api/v1/status", {200, R"({"foo": "bar"})"}},
      {"/not-json/api/v1/status", {200, "<html>hello</html>"}},
      {"/truncated/api/v1/status", {500, "partial", true}},
      {"/short/api/v1/status", {200, status_body, true}},
  });

  Gateway::Client const rp(endpoint(up, ""), log, "rpki-mcp-test/1.0");

  auto const status = rp.get_status();
  CHECK_EQ(status["version"], "routinator/0.13.2");
  CHECK_EQ(status["serial"], 42);
  CHECK_EQ(status["lastUpdateDuration"], 63.0);
  CHECK_EQ(status.size(), 6u);

  auto const valid = rp.get_validity("AS65000", "192.0.2.0/24");
  CHECK_EQ(valid["route"]["originAsn"], "AS65000");
  CHECK_EQ(valid["validity"]["state"], "valid");
  CHECK_EQ(valid["validity"]["vrps"]["matched"][0]["maxLength"], 24);
  CHECK_EQ(valid["generatedTime"], "2024-05-01T11:51:03Z");

  auto const roas = rp.get_roas("AS65000");
  CHECK_EQ(roas["roas"].size(), 2u);
  CHECK_EQ(roas["roas"][0]["prefix"], "192.0.2.0/24");
  CHECK_EQ(roas["roas"][1]["trustAnchor"], "ripe");

  auto const not_found = fails<RPKI::upstream_error>(
      [&] { rp.get_validity("AS65000", "203.0.113.0/24"); });
  CHECK_EQ(not_found.kind(), RPKI::error_kind::upstream);
  CHECK_EQ(not_found.code(), 404);
  CHECK_EQ(std::string(not_found.what()), "not found");

  // A non-2xx answer is an upstream error even if the body would
  // decode.
  auto const starting = fails<RPKI::upstream_error>(
      [&] { Gateway::Client(endpoint(up, "/starting"), log, "t").get_status(); });
  CHECK_EQ(starting.code(), 503);
  CHECK_EQ(std::string(starting.what()), R"({"error": "not ready"})");

  auto const err_shape
      = Gateway::Client(endpoint(up, "/error-shape"), log, "t").get_status();
  CHECK_EQ(err_shape, json::parse(R"({"error": "initial validation ongoing"})"));

  auto const neither = fails<RPKI::decode_error>(
      [&] { Gateway::Client(endpoint(up, "/neither"), log, "t").get_status(); });
  CHECK_EQ(neither.code(), 200);

  auto const not_json = fails<RPKI::decode_error>(
      [&] { Gateway::Client(endpoint(up, "/not-json"), log, "t").get_status(); });
  CHECK_EQ(not_json.code(), 200);
  CHECK_EQ(std::string(not_json.what()).rfind("error decoding response body: ", 0),
           0u);

  auto const truncated = fails<RPKI::upstream_error>([&] {
    Gateway::Client(endpoint(up, "/truncated"), log, "t").get_status();
  });
  CHECK_EQ(truncated.code(), 500);
  CHECK_EQ(std::string(truncated.what()), Gateway::unreadable_body);

  auto const short_body = fails<RPKI::network_error>(
      [&] { Gateway::Client(endpoint(up, "/short"), log, "t").get_status(); });
  CHECK_EQ(short_body.code(), 200);

  // Nobody home.
  auto const refused = fails<RPKI::network_error>([&] {
    Gateway::Client(Endpoint(fmt::format("http://127.0.0.1:{}", closed_port())),
                    log, "t")
        .get_status();
  });
  CHECK_EQ(refused.code(), RPKI::no_status);

  // TLS to something that only speaks plain HTTP: the handshake fails.
  {
    fake_upstream plain({});
    for (auto host : {"127.0.0.1", "localhost"}) {
      auto const ep = Endpoint(fmt::format("https://{}:{}", host, plain.port()));
      auto const no_tls = fails<RPKI::network_error>(
          [&] { Gateway::Client(ep, log, "t").get_status(); });
      CHECK_EQ(no_tls.code(), RPKI::no_status);
    }
    CHECK(plain.targets().empty());
  }

  // A scheme and nothing else.
  auto const no_host = fails<RPKI::network_error>(
      [&] { Gateway::Client(Endpoint("http://"), log, "t").get_status(); });
  CHECK_EQ(no_host.code(), RPKI::no_status);

  auto const targets = up.targets();
  CHECK_EQ(targets.size(), 10u);
  CHECK_EQ(targets[0], "/api/v1/status");
  CHECK_EQ(targets[1], "/api/v1/validity/AS65000/192.0.2.0/24");
  CHECK_EQ(targets[2], "/json?select-asn=AS65000");
  CHECK_EQ(targets[3], "/api/v1/validity/AS65000/203.0.113.0/24");
  CHECK_EQ(targets[4], "/starting/api/v1/status");

  CHECK_EQ(log.write_failures(), 0u);
  fs::remove(log_path);
}
