#include "Schema.hpp"

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
bool fails_to_decode_status(json const& j)
{
  try {
    auto const s = j.get<Schema::status>();
    return false;
  }
  catch (std::exception const& e) {
    return true;
  }
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const status_body = json::parse(R"({
    "version": "routinator/0.13.2",
    "serial": 1234,
    "now": "2024-05-01T12:00:00+00:00",
    "lastUpdateStart": "2024-05-01T11:50:00+00:00",
    "lastUpdateDone": "2024-05-01T11:51:03+00:00",
    "lastUpdateDuration": 63.5,
    "rsyncDurations": {}
  })");

  CHECK(Schema::is_status_success(status_body));
  CHECK(!Schema::is_status_error(status_body));

  auto const s = status_body.get<Schema::status>();
  CHECK_EQ(s.index(), 0u);
  auto const& ok = std::get<Schema::status_success>(s);
  CHECK_EQ(ok.version, "routinator/0.13.2");
  CHECK_EQ(ok.serial, 1234u);
  CHECK_EQ(ok.last_update_duration, 63.5);

  json const out = s;
  CHECK_EQ(out.size(), 6u);
  CHECK_EQ(out["version"], "routinator/0.13.2");
  CHECK_EQ(out["serial"], 1234);
  CHECK_EQ(out["now"], "2024-05-01T12:00:00+00:00");
  CHECK_EQ(out["lastUpdateStart"], "2024-05-01T11:50:00+00:00");
  CHECK_EQ(out["lastUpdateDone"], "2024-05-01T11:51:03+00:00");
  CHECK_EQ(out["lastUpdateDuration"], 63.5);

  auto const err = json::parse(R"({"error": "initial validation ongoing"})")
                       .get<Schema::status>();
  CHECK_EQ(err.index(), 1u);
  CHECK_EQ(json(err), json::parse(R"({"error":"initial validation ongoing"})"));

  // Both shapes at once: the status wins.
  auto both = status_body;
  both["error"] = "oops";
  CHECK_EQ(both.get<Schema::status>().index(), 0u);

  // Neither shape.
  CHECK(fails_to_decode_status(json::parse(R"({"foo": 1})")));
  CHECK(fails_to_decode_status(json::parse(R"({"error": 42})")));
  CHECK(fails_to_decode_status(json::parse("[]")));
  CHECK(fails_to_decode_status(json::parse("null")));
  auto no_serial = status_body;
  no_serial.erase("serial");
  CHECK(fails_to_decode_status(no_serial));
  // Numbers too big for their field are refused, not truncated.
  auto big_serial = status_body;
  big_serial["serial"] = 4294967296u;
  CHECK(!Schema::is_status_success(big_serial));
  CHECK(fails_to_decode_status(big_serial));
  auto negative_serial = status_body;
  negative_serial["serial"] = -1;
  CHECK(fails_to_decode_status(negative_serial));
  auto max_serial = status_body;
  max_serial["serial"] = 4294967295u;
  CHECK_EQ(std::get<Schema::status_success>(max_serial.get<Schema::status>())
               .serial,
           4294967295u);

  auto string_serial = status_body;
  string_serial["serial"] = "1234";
  CHECK(fails_to_decode_status(string_serial));

  // Routinator's validity answer.
  auto const validity_body = json::parse(R"({
    "validated_route": {
      "route": {"origin_asn": "AS65000", "prefix": "192.0.2.0/24"},
      "validity": {
        "state": "invalid",
        "reason": "as",
        "description": "At least one VRP Covers the Route Prefix, but no VRP ASN matches the route origin ASN",
        "VRPs": {
          "matched": [],
          "unmatched_as": [
            {"asn": "AS64511", "prefix": "192.0.2.0/24", "max_length": "24"}
          ],
          "unmatched_length": []
        }
      }
    },
    "generatedTime": "2024-05-01T11:51:03Z"
  })");

  json const v = validity_body.get<Schema::validity>();
  CHECK_EQ(v["route"]["originAsn"], "AS65000");
  CHECK_EQ(v["route"]["prefix"], "192.0.2.0/24");
  CHECK_EQ(v["validity"]["state"], "invalid");
  CHECK(v["validity"]["vrps"]["matched"].empty());
  CHECK(v["validity"]["vrps"]["unmatchedLength"].empty());
  auto const& unmatched = v["validity"]["vrps"]["unmatchedAs"];
  CHECK_EQ(unmatched.size(), 1u);
  CHECK_EQ(unmatched[0]["asn"], "AS64511");
  CHECK_EQ(unmatched[0]["maxLength"], 24);
  CHECK_EQ(v["generatedTime"], "2024-05-01T11:51:03Z");
  CHECK(!v.contains("validated_route"));

  // Already in our own shape decodes to the same thing.
  CHECK_EQ(v.get<Schema::validity>().route.origin_asn, "AS65000");
  CHECK_EQ(json(v.get<Schema::validity>()), v);

  auto bad_length = validity_body;
  bad_length["validated_route"]["validity"]["VRPs"]["unmatched_as"][0]
            ["max_length"]
      = "24x";
  try {
    bad_length.get<Schema::validity>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::exception const& e) {
    LOG(INFO) << e.what();
  }

  auto no_generated = validity_body;
  no_generated.erase("generatedTime");
  try {
    no_generated.get<Schema::validity>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& e) {
    CHECK_EQ(std::string(e.what()), "missing field \"generatedTime\"");
  }

  // The ROA set keeps the upstream order.
  auto const roas_body = json::parse(R"({
    "metadata": {"generated": 1714564263, "generatedTime": "2024-05-01T11:51:03Z"},
    "roas": [
      {"asn": "AS65000", "prefix": "2001:db8::/32", "maxLength": 48, "ta": "ripe"},
      {"asn": "AS65000", "prefix": "192.0.2.0/24", "maxLength": 24, "ta": "arin"},
      {"asn": "AS65000", "prefix": "198.51.100.0/24", "maxLength": 24, "ta": "apnic"}
    ]
  })");

  json const r = roas_body.get<Schema::roa_set>();
  CHECK_EQ(r["metadata"]["generated"], 1714564263);
  CHECK_EQ(r["metadata"]["generatedTime"], "2024-05-01T11:51:03Z");
  CHECK_EQ(r["roas"].size(), 3u);
  CHECK_EQ(r["roas"][0]["prefix"], "2001:db8::/32");
  CHECK_EQ(r["roas"][1]["prefix"], "192.0.2.0/24");
  CHECK_EQ(r["roas"][2]["prefix"], "198.51.100.0/24");
  CHECK_EQ(r["roas"][0]["trustAnchor"], "ripe");
  CHECK_EQ(r["roas"][2]["maxLength"], 24);
  CHECK(!r["roas"][0].contains("ta"));

  auto huge_length = roas_body;
  huge_length["roas"][1]["maxLength"] = 4294967320u;
  try {
    huge_length.get<Schema::roa_set>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << e.what();
  }

  auto huge_string_length = roas_body;
  huge_string_length["roas"][0]["maxLength"] = "4294967320";
  try {
    huge_string_length.get<Schema::roa_set>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << e.what();
  }

  auto huge_generated = json::parse(R"({
    "metadata": {"generated": 18446744073709551615, "generatedTime": "2024-05-01T11:51:03Z"},
    "roas": []
  })");
  try {
    huge_generated.get<Schema::roa_set>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& e) {
    CHECK_EQ(std::string(e.what()),
             "generated 18446744073709551615 is not an integer in range");
  }

  auto no_roas = roas_body;
  no_roas.erase("roas");
  try {
    no_roas.get<Schema::roa_set>();
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& e) {
    CHECK_EQ(std::string(e.what()), "missing field \"roas\"");
  }
}
