#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using IP6::as_address;
  using IP6::is_address;
  using IP6::is_address_literal;
  using IP6::to_prefix;

  CHECK(is_address("::1"));
  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));
  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(is_address("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));
  CHECK(!is_address("2001:db8::1::1"));
  CHECK(!is_address("192.0.2.1"));
  CHECK(!is_address("[::1]"));

  CHECK(is_address_literal("[::1]"));
  CHECK(is_address_literal("[2001:db8::1]"));
  CHECK(!is_address_literal("[IPv6:::1]"));
  CHECK(!is_address_literal("::1"));
  CHECK(!is_address_literal("[::1"));

  CHECK_EQ(as_address("[2001:db8::1]"), "2001:db8::1");

  unsigned char const doc[]{0x20, 0x01, 0x0d, 0xb8};
  CHECK_EQ(to_prefix(doc, sizeof(doc), 32), "2001:db8::/32");

  unsigned char const none[1]{};
  CHECK_EQ(to_prefix(none, 0, 0), "::/0");

  unsigned char const odd[]{0x20, 0x01, 0x0d, 0xb8, 0xff, 0xff};
  CHECK_EQ(to_prefix(odd, sizeof(odd), 36), "2001:db8:f000::/36");
  CHECK_EQ(to_prefix(odd, sizeof(odd), 48), "2001:db8:ffff::/48");
}
