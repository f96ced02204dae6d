#include "Schema.hpp"

#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace Schema {

namespace {
// The first of names that j has.
json const& field(json const& j, std::initializer_list<char const*> names)
{
  if (j.is_object()) {
    for (auto name : names) {
      auto const it = j.find(name);
      if (it != j.end())
        return *it;
    }
  }
  throw std::invalid_argument(
      fmt::format("missing field \"{}\"", *names.begin()));
}

bool is_string(json const& j, char const* name)
{
  auto const it = j.find(name);
  return it != j.end() && it->is_string();
}

// An integer j that T can hold without losing anything.
template <typename T>
bool fits(json const& j)
{
  if (j.is_number_unsigned())
    return std::in_range<T>(j.get<std::uint64_t>());
  if (j.is_number_integer())
    return std::in_range<T>(j.get<std::int64_t>());
  return false;
}

template <typename T>
T integer_of(json const& j, char const* name)
{
  if (!fits<T>(j)) {
    throw std::invalid_argument(
        fmt::format("{} {} is not an integer in range", name, j.dump()));
  }
  return j.is_number_unsigned() ? static_cast<T>(j.get<std::uint64_t>())
                                : static_cast<T>(j.get<std::int64_t>());
}

// Routinator writes a VRP's max_length as a string, "24".
unsigned length_of(json const& j)
{
  if (j.is_number())
    return integer_of<unsigned>(j, "maxLength");

  if (j.is_string()) {
    auto const& s = j.get_ref<std::string const&>();
    unsigned    n{};
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec == std::errc{} && ptr == s.data() + s.size() && !s.empty())
      return n;
  }

  throw std::invalid_argument(fmt::format("invalid maxLength {}", j.dump()));
}
} // namespace

bool is_status_success(json const& j)
{
  if (!j.is_object())
    return false;

  auto const serial = j.find("serial");
  auto const dur    = j.find("lastUpdateDuration");

  return is_string(j, "version") && (serial != j.end())
         && fits<std::uint32_t>(*serial) && is_string(j, "now")
         && is_string(j, "lastUpdateStart") && is_string(j, "lastUpdateDone")
         && (dur != j.end()) && dur->is_number();
}

bool is_status_error(json const& j)
{
  return j.is_object() && is_string(j, "error");
}

void from_json(json const& j, status& s)
{
  if (is_status_success(j)) {
    s = j.get<status_success>();
  }
  else if (is_status_error(j)) {
    s = j.get<status_error>();
  }
  else {
    throw std::invalid_argument("body is neither a status nor an error");
  }
}

void to_json(json& j, status const& s)
{
  std::visit([&j](auto const& v) { to_json(j, v); }, s);
}

void from_json(json const& j, status_success& s)
{
  j.at("version").get_to(s.version);
  s.serial = integer_of<std::uint32_t>(j.at("serial"), "serial");
  j.at("now").get_to(s.now);
  j.at("lastUpdateStart").get_to(s.last_update_start);
  j.at("lastUpdateDone").get_to(s.last_update_done);
  j.at("lastUpdateDuration").get_to(s.last_update_duration);
}

void to_json(json& j, status_success const& s)
{
  j = json{
      {"version", s.version},
      {"serial", s.serial},
      {"now", s.now},
      {"lastUpdateStart", s.last_update_start},
      {"lastUpdateDone", s.last_update_done},
      {"lastUpdateDuration", s.last_update_duration},
  };
}

void from_json(json const& j, status_error& s)
{
  j.at("error").get_to(s.error);
}

void to_json(json& j, status_error const& s) { j = json{{"error", s.error}}; }

void from_json(json const& j, vrp& v)
{
  field(j, {"asn"}).get_to(v.asn);
  field(j, {"prefix"}).get_to(v.prefix);
  v.max_length = length_of(field(j, {"maxLength", "max_length"}));
}

void to_json(json& j, vrp const& v)
{
  j = json{
      {"asn", v.asn},
      {"prefix", v.prefix},
      {"maxLength", v.max_length},
  };
}

void from_json(json const& j, vrp_sets& v)
{
  field(j, {"matched"}).get_to(v.matched);
  field(j, {"unmatchedAs", "unmatched_as"}).get_to(v.unmatched_as);
  field(j, {"unmatchedLength", "unmatched_length"}).get_to(v.unmatched_length);
}

void to_json(json& j, vrp_sets const& v)
{
  j = json{
      {"matched", v.matched},
      {"unmatchedAs", v.unmatched_as},
      {"unmatchedLength", v.unmatched_length},
  };
}

void from_json(json const& j, route& r)
{
  field(j, {"originAsn", "origin_asn"}).get_to(r.origin_asn);
  field(j, {"prefix"}).get_to(r.prefix);
}

void to_json(json& j, route const& r)
{
  j = json{{"originAsn", r.origin_asn}, {"prefix", r.prefix}};
}

void from_json(json const& j, route_validity& v)
{
  field(j, {"state"}).get_to(v.state);
  field(j, {"description"}).get_to(v.description);
  field(j, {"vrps", "VRPs"}).get_to(v.vrps);
}

void to_json(json& j, route_validity const& v)
{
  j = json{
      {"state", v.state},
      {"description", v.description},
      {"vrps", v.vrps},
  };
}

void from_json(json const& j, validity& v)
{
  // Routinator nests route and validity in "validated_route".
  auto const& vr = (j.is_object() && j.contains("validated_route"))
                       ? j.at("validated_route")
                       : j;
  field(vr, {"route"}).get_to(v.route);
  field(vr, {"validity"}).get_to(v.validity);
  field(j, {"generatedTime", "generated_time"}).get_to(v.generated_time);
}

void to_json(json& j, validity const& v)
{
  j = json{
      {"route", v.route},
      {"validity", v.validity},
      {"generatedTime", v.generated_time},
  };
}

void from_json(json const& j, roa& r)
{
  field(j, {"asn"}).get_to(r.asn);
  field(j, {"prefix"}).get_to(r.prefix);
  r.max_length = length_of(field(j, {"maxLength", "max_length"}));
  field(j, {"trustAnchor", "ta"}).get_to(r.trust_anchor);
}

void to_json(json& j, roa const& r)
{
  j = json{
      {"asn", r.asn},
      {"prefix", r.prefix},
      {"maxLength", r.max_length},
      {"trustAnchor", r.trust_anchor},
  };
}

void from_json(json const& j, roa_metadata& m)
{
  m.generated
      = integer_of<std::int64_t>(field(j, {"generated"}), "generated");
  field(j, {"generatedTime", "generated_time"}).get_to(m.generated_time);
}

void to_json(json& j, roa_metadata const& m)
{
  j = json{{"generated", m.generated}, {"generatedTime", m.generated_time}};
}

void from_json(json const& j, roa_set& s)
{
  field(j, {"metadata"}).get_to(s.metadata);
  field(j, {"roas"}).get_to(s.roas);
}

void to_json(json& j, roa_set const& s)
{
  j = json{{"metadata", s.metadata}, {"roas", s.roas}};
}

} // namespace Schema
