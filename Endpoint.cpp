#include "Endpoint.hpp"

#include "Error.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {
constexpr std::string_view schemes[]{"http://"sv, "https://"sv};

bool all_space(std::string_view s)
{
  return std::all_of(begin(s), end(s), [](unsigned char ch) {
    return std::isspace(ch);
  });
}
} // namespace

Endpoint::Endpoint(std::string_view url)
{
  std::string msg;
  set_(url, true /* throw */, msg);
}

bool Endpoint::validate(std::string_view url, std::string& msg, Endpoint& ep)
{
  return ep.set_(url, false /* don't throw */, msg);
}

std::string Endpoint::join(std::string_view path) const
{
  return fmt::format("{}{}", url_, path);
}

bool Endpoint::set_(std::string_view url, bool should_throw, std::string& msg)
{
  auto const fail = [&](std::string m) {
    msg = std::move(m);
    if (should_throw)
      throw RPKI::input_error(msg);
    return false;
  };

  if (url.empty() || all_space(url))
    return fail("endpoint must not be empty");

  auto const has_scheme
      = std::any_of(begin(schemes), end(schemes),
                    [url](auto scheme) { return url.starts_with(scheme); });
  if (!has_scheme)
    return fail(fmt::format("endpoint «{}» must start with http:// or https://",
                            url));

  // Paths are appended as "/api/...", avoid "//api/...".
  if (url.ends_with('/') && !std::any_of(begin(schemes), end(schemes),
                                         [url](auto s) { return url == s; }))
    url.remove_suffix(1);

  url_ = std::string(url.data(), url.length());
  msg.clear();
  return true;
}
