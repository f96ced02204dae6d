#include "ROA.hpp"

#include "Error.hpp"

#include <fstream>
#include <memory>
#include <optional>

#include <unistd.h>

#include <openssl/bio.h>
#include <openssl/cms.h>
#include <openssl/objects.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {

// Just enough DER to build test objects, lengths under 128 octets.
std::string tlv(unsigned char tag, std::string const& content)
{
  CHECK_LT(content.size(), 128u);
  std::string ret;
  ret += static_cast<char>(tag);
  ret += static_cast<char>(content.size());
  ret += content;
  return ret;
}

std::string seq(std::string const& content) { return tlv(0x30, content); }

std::string integer(long long v)
{
  std::string bytes;
  do {
    bytes.insert(bytes.begin(), static_cast<char>(v & 0xff));
    v >>= 8;
  } while (v != 0 && v != -1);
  // Keep the sign bit honest.
  auto const hi = static_cast<unsigned char>(bytes.front());
  if (v == 0 && (hi & 0x80))
    bytes.insert(bytes.begin(), '\0');
  if (v == -1 && !(hi & 0x80))
    bytes.insert(bytes.begin(), '\xff');
  return tlv(0x02, bytes);
}

std::string address(std::string const& bits,
                    unsigned           unused,
                    std::optional<int> max_length = std::nullopt)
{
  auto content = tlv(0x03, static_cast<char>(unused) + bits);
  if (max_length)
    content += integer(*max_length);
  return seq(content);
}

std::string family(std::string const& afi, std::string const& addresses)
{
  return seq(tlv(0x04, afi) + seq(addresses));
}

auto const ipv4 = "\x00\x01"s;
auto const ipv6 = "\x00\x02"s;

std::string attestation(long long asn, std::string const& families)
{
  return seq(integer(asn) + seq(families));
}

// Wrap content in a signed object, with no signers; nothing here
// checks them.
std::string signed_object(std::string const& content,
                          char const*        content_type
                          = ROA::content_type_oid)
{
  std::unique_ptr<BIO, decltype(&BIO_free)> data{
      BIO_new_mem_buf(content.data(), static_cast<int>(content.size())),
      BIO_free};
  CHECK(data);

  std::unique_ptr<CMS_ContentInfo, decltype(&CMS_ContentInfo_free)> cms{
      CMS_sign(nullptr, nullptr, nullptr, nullptr, CMS_BINARY | CMS_PARTIAL),
      CMS_ContentInfo_free};
  CHECK(cms);

  if (content_type) {
    std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)> oid{
        OBJ_txt2obj(content_type, 1), ASN1_OBJECT_free};
    CHECK(oid);
    CHECK_EQ(CMS_set1_eContentType(cms.get(), oid.get()), 1);
  }

  CHECK_EQ(CMS_final(cms.get(), data.get(), nullptr, CMS_BINARY), 1);

  unsigned char* der = nullptr;
  auto const     len = i2d_CMS_ContentInfo(cms.get(), &der);
  CHECK_GT(len, 0);
  std::string ret(reinterpret_cast<char*>(der), len);
  OPENSSL_free(der);
  return ret;
}

std::string decode_fails(std::string const& der)
{
  try {
    ROA::decode(der);
  }
  catch (RPKI::decode_error const& e) {
    CHECK_EQ(e.kind(), RPKI::error_kind::decode);
    CHECK_EQ(e.code(), RPKI::no_status);
    LOG(INFO) << e.what();
    return e.what();
  }
  LOG(FATAL) << "decode should have failed";
  return "";
}

void write_file(fs::path const& path, std::string const& contents)
{
  std::ofstream ofs(path, std::ios::binary);
  ofs << contents;
  CHECK(ofs.good()) << path;
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // AS65000, 192.0.2.0/24
  auto const simple = attestation(
      65000, family(ipv4, address("\xc0\x00\x02"s, 0)));
  CHECK_EQ(simple,
           "\x30\x17\x02\x03\x00\xfd\xe8\x30\x10\x30\x0e\x04\x02\x00\x01"
           "\x30\x08\x30\x06\x03\x04\x00\xc0\x00\x02"s);

  auto roa = ROA::decode(signed_object(simple));
  CHECK_EQ(roa.asn, "AS65000");
  CHECK_EQ(roa.v4_prefixes.size(), 1u);
  CHECK_EQ(roa.v4_prefixes[0], "192.0.2.0/24");
  CHECK(roa.v6_prefixes.empty());

  nlohmann::json const j = roa;
  CHECK_EQ(j, nlohmann::json::parse(R"({
    "asn": "AS65000",
    "v4Prefixes": ["192.0.2.0/24"],
    "v6Prefixes": []
  })"));

  // Both families, a maxLength, a prefix ending mid-octet, and a
  // 32-bit AS number.
  auto const both = attestation(
      4200000000,
      family(ipv4, address("\x0a"s, 0, 24) + address("\xc6\x33\x64\x80"s, 7))
          + family(ipv6, address("\x20\x01\x0d\xb8"s, 0, 48)));
  roa = ROA::decode(signed_object(both));
  CHECK_EQ(roa.asn, "AS4200000000");
  CHECK_EQ(roa.v4_prefixes.size(), 2u);
  CHECK_EQ(roa.v4_prefixes[0], "10.0.0.0/8");
  CHECK_EQ(roa.v4_prefixes[1], "198.51.100.128/25");
  CHECK_EQ(roa.v6_prefixes.size(), 1u);
  CHECK_EQ(roa.v6_prefixes[0], "2001:db8::/32");

  // Families in either order, and the optional SAFI octet.
  auto const v6_first = attestation(
      0, family(ipv6, address("\x20\x01\x0d\xb8\xf0"s, 4))
             + family("\x00\x01\x01"s, address(""s, 0)));
  roa = ROA::decode(signed_object(v6_first));
  CHECK_EQ(roa.asn, "AS0");
  CHECK_EQ(roa.v4_prefixes.size(), 1u);
  CHECK_EQ(roa.v4_prefixes[0], "0.0.0.0/0");
  CHECK_EQ(roa.v6_prefixes.size(), 1u);
  CHECK_EQ(roa.v6_prefixes[0], "2001:db8:f000::/36");

  // An explicit version 0 is fine, anything else is not.
  auto const v0 = seq(tlv(0xa0, integer(0)) + integer(65000)
                      + seq(family(ipv4, address("\xc0\x00\x02"s, 0))));
  CHECK_EQ(ROA::decode(signed_object(v0)).asn, "AS65000");

  auto const v1 = seq(tlv(0xa0, integer(1)) + integer(65000)
                      + seq(family(ipv4, address("\xc0\x00\x02"s, 0))));
  decode_fails(signed_object(v1));

  // Structure that isn't a ROA.
  decode_fails("");
  decode_fails("this is not DER at all");
  decode_fails(signed_object(simple) + "\x00"s);
  decode_fails(signed_object(simple, nullptr)); // id-data
  decode_fails(signed_object(simple, "1.2.840.113549.1.9.16.1.26")); // manifest
  decode_fails(signed_object("\x04\x03roa"s));
  decode_fails(signed_object(simple + "\x00\x00"s));

  // Content that breaks the rules.
  decode_fails(signed_object(attestation(65000, ""s)));
  decode_fails(signed_object(attestation(-1, family(ipv4, address("\x0a"s, 0)))));
  decode_fails(
      signed_object(attestation(4294967296, family(ipv4, address("\x0a"s, 0)))));
  decode_fails(signed_object(
      attestation(65000, family("\x00\x03"s, address("\x0a"s, 0)))));
  decode_fails(signed_object(
      attestation(65000, family("\x00"s, address("\x0a"s, 0)))));
  decode_fails(signed_object(attestation(65000, family(ipv4, ""s))));
  decode_fails(signed_object(
      attestation(65000, family(ipv4, address("\xc0\x00\x02\x00\x01"s, 0)))));
  decode_fails(signed_object(
      attestation(65000, family(ipv4, address("\xc0\x00\x02"s, 0, 16)))));
  decode_fails(signed_object(
      attestation(65000, family(ipv4, address("\xc0\x00\x02"s, 0, 33)))));
  decode_fails(signed_object(
      attestation(65000, family(ipv6, address("\x20\x01\x0d\xb8"s, 0, 129)))));

  CHECK_EQ(decode_fails(signed_object(attestation(
               65000, family("\x00\x03"s, address("\x0a"s, 0))))),
           "unknown address family 3");
  CHECK_EQ(decode_fails(signed_object(simple, nullptr)),
           "eContentType 1.2.840.113549.1.7.1 is not id-ct-routeOriginAuthz");

  // From files.
  auto const dir = fs::temp_directory_path()
                   / fmt::format("ROA-test-{}", ::getpid());
  fs::create_directories(dir);

  auto const good = dir / "good.roa";
  write_file(good, signed_object(both));
  roa = ROA::decode_file(good);
  CHECK_EQ(roa.asn, "AS4200000000");
  CHECK_EQ(roa.v6_prefixes[0], "2001:db8::/32");

  auto const empty = dir / "empty.roa";
  write_file(empty, "");
  try {
    ROA::decode_file(empty);
    LOG(FATAL) << "empty file should not decode";
  }
  catch (RPKI::decode_error const& e) {
    LOG(INFO) << e.what();
  }

  auto const garbage = dir / "garbage.roa";
  write_file(garbage, "garbage");
  try {
    ROA::decode_file(garbage);
    LOG(FATAL) << "garbage should not decode";
  }
  catch (RPKI::decode_error const& e) {
    LOG(INFO) << e.what();
  }

  for (auto const& path : {dir / "no-such-file.roa", dir}) {
    try {
      ROA::decode_file(path);
      LOG(FATAL) << path << " should not be readable";
    }
    catch (RPKI::io_error const& e) {
      CHECK_EQ(e.kind(), RPKI::error_kind::io);
      CHECK_EQ(e.code(), RPKI::no_status);
      CHECK_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
  }

  fs::remove_all(dir);
}
