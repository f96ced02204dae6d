#include "IP4.hpp"

#include <algorithm>
#include <array>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};

// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet, eof> {
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return parse<ipv4_address>(in);
}

auto to_prefix(unsigned char const* addr, std::size_t addr_len, unsigned length)
    -> std::string
{
  CHECK_LE(addr_len, address_bytes);
  CHECK_LE(length, address_bits);

  std::array<unsigned char, address_bytes> a{};
  std::copy_n(addr, addr_len, a.begin());

  for (auto bit{length}; bit < address_bits; ++bit) {
    a[bit / 8] &= ~(0x80u >> (bit % 8));
  }

  return fmt::format("{}.{}.{}.{}/{}", a[0], a[1], a[2], a[3], length);
}
} // namespace IP4
