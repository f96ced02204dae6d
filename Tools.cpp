#include "Tools.hpp"

#include "Error.hpp"
#include "ROA.hpp"

#include <optional>

#include <fmt/format.h>

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
json string_arg(char const* description)
{
  return json{{"type", "string"}, {"description", description}};
}

json object_schema(json properties, json required)
{
  auto schema = json{{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty())
    schema["required"] = std::move(required);
  return schema;
}

std::vector<Tools::descriptor> make_tools()
{
  return {
      {
          "status",
          "Status of the RPKI relying party",
          object_schema(json::object(), json::array()),
      },
      {
          "validity",
          "RPKI route origin validity of a prefix announced by an AS",
          object_schema(
              {
                  {"asn", string_arg("origin AS number, e.g. AS65000")},
                  {"prefix", string_arg("announced prefix, e.g. 192.0.2.0/24")},
              },
              {"asn", "prefix"}),
      },
      {
          "roas",
          "Validated ROA payloads for an origin AS",
          object_schema({{"asn", string_arg("AS number, e.g. AS65000")}},
                        {"asn"}),
      },
      {
          "parseRoaFile",
          "Decode a ROA (.roa) file into its origin AS and prefixes",
          object_schema({{"path", string_arg("path of a local .roa file")}},
                        {"path"}),
      },
  };
}
} // namespace

namespace Tools {

Dispatcher::Dispatcher(Gateway::Client const& client, Log& log)
  : client_(client)
  , log_(log)
  , tools_(make_tools())
{
}

template <typename Fn>
result Dispatcher::run_(std::string_view name, Fn&& fn) const
{
  try {
    return fn();
  }
  catch (RPKI::error const& e) {
    log_.error(RPKI::c_str(e.kind()), fmt::format("{}: {}", name, e.what()));
    return typed_error{e.code(), e.what()};
  }
}

result Dispatcher::call(std::string_view name, json const& arguments) const
{
  if (!arguments.is_null() && !arguments.is_object()) {
    return reject_(invalid_params,
                   fmt::format("arguments to «{}» must be an object", name));
  }

  std::string missing;
  auto const arg = [&](char const* key) -> std::optional<std::string> {
    if (arguments.is_object()) {
      auto const it = arguments.find(key);
      if (it != arguments.end() && it->is_string())
        return it->get<std::string>();
    }
    if (!missing.empty())
      missing += ", ";
    missing += key;
    return std::nullopt;
  };
  auto const bad_args = [&] {
    return reject_(invalid_params,
                   fmt::format("«{}» requires string argument(s): {}", name,
                               missing));
  };

  if (name == "status") {
    return status();
  }
  if (name == "validity") {
    auto const asn    = arg("asn");
    auto const prefix = arg("prefix");
    if (!asn || !prefix)
      return bad_args();
    return validity(*asn, *prefix);
  }
  if (name == "roas") {
    auto const asn = arg("asn");
    if (!asn)
      return bad_args();
    return roas(*asn);
  }
  if (name == "parseRoaFile") {
    auto const path = arg("path");
    if (!path)
      return bad_args();
    return parse_roa_file(*path);
  }

  return reject_(method_not_found, fmt::format("tool «{}» not found", name));
}

result Dispatcher::status() const
{
  return run_("status", [this] { return client_.get_status(); });
}

result Dispatcher::validity(std::string const& asn,
                            std::string const& prefix) const
{
  return run_("validity",
              [&] { return client_.get_validity(asn, prefix); });
}

result Dispatcher::roas(std::string const& asn) const
{
  return run_("roas", [&] { return client_.get_roas(asn); });
}

result Dispatcher::parse_roa_file(std::string const& path) const
{
  return run_("parseRoaFile",
              [&] { return json(ROA::decode_file(path)); });
}

typed_error Dispatcher::reject_(int code, std::string message) const
{
  log_.error("params", message);
  return typed_error{code, std::move(message)};
}

} // namespace Tools
