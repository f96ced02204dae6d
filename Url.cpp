#include "Url.hpp"

#include "Error.hpp"
#include "IP6.hpp"

#include <charconv>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::any;
using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::not_one;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::plus;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::star;

using tao::pegtl::abnf::ALPHA;
using tao::pegtl::abnf::DIGIT;

namespace Url {

// <https://tools.ietf.org/html/rfc3986#appendix-A>, but only as much
// as we need to make a request.

// clang-format off
struct https : TAO_PEGTL_ISTRING("https://") {};
struct http  : TAO_PEGTL_ISTRING("http://") {};

struct scheme : sor<https, http> {};

struct ip_literal : seq<one<'['>, plus<not_one<']', '/'>>, one<']'>> {};

struct reg_name : plus<sor<ALPHA, DIGIT, one<'-', '.', '_', '~', '%'>>> {};

struct host : sor<ip_literal, reg_name> {};

struct port : rep_min_max<1, 5, DIGIT> {};

struct path : seq<one<'/'>, star<not_one<'?', '#'>>> {};

struct query : seq<one<'?'>, star<not_one<'#'>>> {};

struct fragment : seq<one<'#'>, star<any>> {};

struct url : seq<scheme,
                 host,
                 opt<one<':'>, port>,
                 opt<path>,
                 opt<query>,
                 opt<fragment>,
                 eof> {};
// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<https> {
  static void apply0(parts& p) { p.tls = true; }
};

template <>
struct action<host> {
  template <typename Input>
  static void apply(Input const& in, parts& p)
  {
    p.host = in.string();
  }
};

template <>
struct action<port> {
  template <typename Input>
  static void apply(Input const& in, parts& p)
  {
    p.port = in.string();
  }
};

template <>
struct action<path> {
  template <typename Input>
  static void apply(Input const& in, parts& p)
  {
    p.target = in.string();
  }
};

template <>
struct action<query> {
  template <typename Input>
  static void apply(Input const& in, parts& p)
  {
    p.target += in.string();
  }
};

std::string parts::host_field() const
{
  auto const h = IP6::is_address(host) ? fmt::format("[{}]", host) : host;
  if (default_port())
    return h;
  return fmt::format("{}:{}", h, port);
}

parts split(std::string_view u)
{
  parts p;

  memory_input<> in{u.data(), u.size(), "url"};
  if (!parse<url, action>(in, p)) {
    throw RPKI::network_error(fmt::format("invalid URL «{}»", u));
  }

  if (IP6::is_address_literal(p.host)) {
    p.host = std::string(IP6::as_address(p.host));
  }
  else if (p.host.front() == '[') {
    throw RPKI::network_error(
        fmt::format("invalid IPv6 address «{}» in URL", p.host));
  }

  if (p.port.empty()) {
    p.port = p.tls ? "443" : "80";
  }
  else {
    unsigned n{};
    auto const [ptr, ec]
        = std::from_chars(p.port.data(), p.port.data() + p.port.size(), n);
    if (ec != std::errc{} || n == 0 || n > 65535) {
      throw RPKI::network_error(fmt::format("invalid port in URL «{}»", u));
    }
  }

  // A query with no path: "http://host?x" targets "/?x".
  if (p.target.empty() || p.target.front() != '/') {
    p.target.insert(0, "/");
  }

  return p;
}

} // namespace Url
