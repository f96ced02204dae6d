#include "Endpoint.hpp"

#include "Error.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::string msg;
  Endpoint    ep;

  CHECK(Endpoint::validate("http://localhost:8323", msg, ep));
  CHECK(msg.empty());
  CHECK_EQ(ep.str(), "http://localhost:8323");

  CHECK(Endpoint::validate("https://rpki.example.net", msg, ep));
  CHECK_EQ(ep.str(), "https://rpki.example.net");

  CHECK(Endpoint::validate("https://rpki.example.net/", msg, ep));
  CHECK_EQ(ep.str(), "https://rpki.example.net");
  CHECK_EQ(ep.join("/api/v1/status"), "https://rpki.example.net/api/v1/status");

  CHECK(Endpoint::validate("http://[::1]:8323/routinator", msg, ep));
  CHECK_EQ(ep.join("/json?select-asn=AS65000"),
           "http://[::1]:8323/routinator/json?select-asn=AS65000");

  // Only the scheme is checked, the rest is the HTTP layer's problem.
  CHECK(Endpoint::validate("http://", msg, ep));
  CHECK(Endpoint::validate("https://not a host", msg, ep));

  Endpoint bad;
  CHECK(!Endpoint::validate("", msg, bad));
  CHECK_EQ(msg, "endpoint must not be empty");
  CHECK(bad.empty());

  CHECK(!Endpoint::validate("   \t", msg, bad));
  CHECK_EQ(msg, "endpoint must not be empty");

  CHECK(!Endpoint::validate("ftp://rpki.example.net", msg, bad));
  CHECK(!msg.empty());
  CHECK(!Endpoint::validate("rpki.example.net:8323", msg, bad));
  CHECK(!Endpoint::validate("HTTP://rpki.example.net", msg, bad));
  CHECK(!Endpoint::validate(" http://rpki.example.net", msg, bad));
  CHECK(!Endpoint::validate("http:/rpki.example.net", msg, bad));
  CHECK(bad.empty());

  try {
    Endpoint const junk{"localhost:8323"};
    LOG(FATAL) << "should have thrown";
  }
  catch (RPKI::input_error const& e) {
    CHECK(e.kind() == RPKI::error_kind::input);
    CHECK_EQ(e.code(), RPKI::no_status);
    CHECK_EQ(std::string(e.what()),
             "endpoint «localhost:8323» must start with http:// or https://");
  }

  try {
    Endpoint const good{"https://rpki.example.net:8323"};
    CHECK_EQ(good, Endpoint{"https://rpki.example.net:8323/"});
  }
  catch (std::exception const& e) {
    LOG(FATAL) << "should not throw " << e.what();
  }
}
