#ifndef SCHEMA_DOT_HPP
#define SCHEMA_DOT_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// Shapes of the upstream relying-party responses.  from_json() accepts
// the field names the upstream uses (Routinator's, and our own), and
// throws on a missing field or one of the wrong type; to_json() always
// writes the names below.

namespace Schema {

using json = nlohmann::json;

// GET /api/v1/status

struct status_success {
  std::string   version;
  std::uint32_t serial{0};
  std::string   now;
  std::string   last_update_start;
  std::string   last_update_done;
  double        last_update_duration{0};
};

struct status_error {
  std::string error;
};

using status = std::variant<status_success, status_error>;

bool is_status_success(json const& j);
bool is_status_error(json const& j);

// GET /api/v1/validity/{asn}/{prefix}

struct vrp {
  std::string asn;
  std::string prefix;
  unsigned    max_length{0};
};

struct vrp_sets {
  std::vector<vrp> matched;
  std::vector<vrp> unmatched_as;
  std::vector<vrp> unmatched_length;
};

struct route {
  std::string origin_asn;
  std::string prefix;
};

struct route_validity {
  std::string state;
  std::string description;
  vrp_sets    vrps;
};

struct validity {
  Schema::route  route;
  route_validity validity;
  std::string    generated_time;
};

// GET /json?select-asn={asn}

struct roa {
  std::string asn;
  std::string prefix;
  unsigned    max_length{0};
  std::string trust_anchor;
};

struct roa_metadata {
  std::int64_t generated{0};
  std::string  generated_time;
};

struct roa_set {
  roa_metadata     metadata;
  std::vector<roa> roas;
};

// Tried in order: status_success, status_error.  A body that is
// neither throws.
void from_json(json const& j, status& s);
void to_json(json& j, status const& s);

void from_json(json const& j, status_success& s);
void to_json(json& j, status_success const& s);
void from_json(json const& j, status_error& s);
void to_json(json& j, status_error const& s);

void from_json(json const& j, vrp& v);
void to_json(json& j, vrp const& v);
void from_json(json const& j, vrp_sets& v);
void to_json(json& j, vrp_sets const& v);
void from_json(json const& j, route& r);
void to_json(json& j, route const& r);
void from_json(json const& j, route_validity& v);
void to_json(json& j, route_validity const& v);
void from_json(json const& j, validity& v);
void to_json(json& j, validity const& v);

void from_json(json const& j, roa& r);
void to_json(json& j, roa const& r);
void from_json(json const& j, roa_metadata& m);
void to_json(json& j, roa_metadata const& m);
void from_json(json const& j, roa_set& s);
void to_json(json& j, roa_set const& s);

} // namespace Schema

#endif // SCHEMA_DOT_HPP
