#include "Url.hpp"

#include "Error.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const a = Url::split("http://localhost:8323/api/v1/status");
  CHECK(!a.tls);
  CHECK_EQ(a.host, "localhost");
  CHECK_EQ(a.port, "8323");
  CHECK_EQ(a.target, "/api/v1/status");
  CHECK_EQ(a.host_field(), "localhost:8323");

  auto const b = Url::split("https://rpki.example.net/json?select-asn=AS65000");
  CHECK(b.tls);
  CHECK_EQ(b.host, "rpki.example.net");
  CHECK_EQ(b.port, "443");
  CHECK_EQ(b.target, "/json?select-asn=AS65000");
  CHECK_EQ(b.host_field(), "rpki.example.net");

  // Prefixes go into the path as they are.
  auto const c
      = Url::split("http://127.0.0.1/api/v1/validity/AS65000/192.0.2.0/24");
  CHECK_EQ(c.host, "127.0.0.1");
  CHECK_EQ(c.port, "80");
  CHECK_EQ(c.target, "/api/v1/validity/AS65000/192.0.2.0/24");

  auto const d = Url::split("http://[2001:db8::1]:8080/api/v1/status");
  CHECK_EQ(d.host, "2001:db8::1");
  CHECK_EQ(d.port, "8080");
  CHECK_EQ(d.host_field(), "[2001:db8::1]:8080");

  auto const e = Url::split("HTTPS://example.com");
  CHECK(e.tls);
  CHECK_EQ(e.target, "/");

  auto const f = Url::split("http://example.com?x=1#frag");
  CHECK_EQ(f.target, "/?x=1");

  auto const bad_urls = {
      "http://",
      "http:///api",
      "http://exa mple.com/",
      "http://example.com:/",
      "http://example.com:99999/",
      "http://example.com:0/",
      "http://[not-an-address]/",
      "ftp://example.com/",
  };
  for (auto const url : bad_urls) {
    try {
      Url::split(url);
      LOG(FATAL) << "should have thrown for " << url;
    }
    catch (RPKI::network_error const& e) {
      CHECK_EQ(e.code(), RPKI::no_status);
    }
  }
}
