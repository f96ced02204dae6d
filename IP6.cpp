#include "IP6.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <arpa/inet.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

#include <glog/logging.h>

namespace IP6 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {
};

struct h16 : rep_min_max<1, 4, HEXDIG> {
};

struct ls32 : sor<seq<h16, colon, h16>, ipv4_address> {
};

struct dcolon : two<':'> {
};

// clang-format off
struct ipv6_address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                          seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                          seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                          seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                          seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                          seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                          seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};
// clang-format on

struct ipv6_address_literal : seq<one<'['>, ipv6_address, one<']'>> {
};

struct ipv6_address_only : seq<ipv6_address, eof> {
};
struct ipv6_address_literal_only : seq<ipv6_address_literal, eof> {
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<IP6::ipv6_address_only>(in);
}

auto is_address_literal(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<IP6::ipv6_address_literal_only>(in);
}

auto to_prefix(unsigned char const* addr, std::size_t addr_len, unsigned length)
    -> std::string
{
  CHECK_LE(addr_len, address_bytes);
  CHECK_LE(length, address_bits);

  in6_addr a{};

  static_assert(sizeof(a) == address_bytes, "in6_addr is the wrong size");

  auto const a_uint{reinterpret_cast<uint8_t*>(&a)};
  std::copy_n(addr, addr_len, a_uint);

  for (auto bit{length}; bit < address_bits; ++bit) {
    a_uint[bit / 8] &= ~(0x80u >> (bit % 8));
  }

  char str[INET6_ADDRSTRLEN];
  PCHECK(inet_ntop(AF_INET6, &a, str, sizeof(str)) != nullptr);

  return fmt::format("{}/{}", str, length);
}
} // namespace IP6
