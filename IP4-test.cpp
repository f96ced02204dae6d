#include "IP4.hpp"

#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using IP4::is_address;
  using IP4::to_prefix;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("192.0.2.1"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));
  CHECK(!is_address("0001.0.0.0"));
  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.1.1.1000"));

  CHECK(IP::is_address("192.0.2.1"));
  CHECK(IP::is_address("2001:db8::1"));
  CHECK(!IP::is_address("rpki.example.net"));

  unsigned char const doc[]{192, 0, 2};
  CHECK_EQ(to_prefix(doc, sizeof(doc), 24), "192.0.2.0/24");

  // Missing trailing bytes are zero.
  unsigned char const ten[]{10};
  CHECK_EQ(to_prefix(ten, sizeof(ten), 8), "10.0.0.0/8");
  CHECK_EQ(to_prefix(ten, 0, 0), "0.0.0.0/0");

  unsigned char const half[]{198, 51, 100, 128};
  CHECK_EQ(to_prefix(half, sizeof(half), 25), "198.51.100.128/25");
  CHECK_EQ(to_prefix(half, sizeof(half), 32), "198.51.100.128/32");

  // Bits past the prefix length are cleared.
  unsigned char const host[]{192, 0, 2, 255};
  CHECK_EQ(to_prefix(host, sizeof(host), 26), "192.0.2.192/26");
  CHECK_EQ(to_prefix(host, sizeof(host), 20), "192.0.0.0/20");
}
