#include "ROA.hpp"

#include "Error.hpp"
#include "IP4.hpp"
#include "IP6.hpp"

#include <cstdint>
#include <ios>
#include <limits>
#include <memory>

#include <boost/iostreams/device/mapped_file.hpp>

#include <openssl/asn1.h>
#include <openssl/asn1t.h>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/safestack.h>

#include <fmt/format.h>

#include <glog/logging.h>

// <https://tools.ietf.org/html/rfc6482#section-3>
//
// RouteOriginAttestation ::= SEQUENCE {
//    version [0] INTEGER DEFAULT 0,
//    asID  ASID,
//    ipAddrBlocks SEQUENCE (SIZE(1..MAX)) OF ROAIPAddressFamily }
//
// ROAIPAddressFamily ::= SEQUENCE {
//    addressFamily OCTET STRING (SIZE (2..3)),
//    addresses SEQUENCE (SIZE (1..MAX)) OF ROAIPAddress }
//
// ROAIPAddress ::= SEQUENCE {
//    address IPAddress,
//    maxLength INTEGER OPTIONAL }

typedef struct {
  ASN1_BIT_STRING* address;
  ASN1_INTEGER*    maxLength;
} ROAIPAddress;

DECLARE_ASN1_ITEM(ROAIPAddress)
DEFINE_STACK_OF(ROAIPAddress)

typedef struct {
  ASN1_OCTET_STRING* addressFamily;
  STACK_OF(ROAIPAddress) * addresses;
} ROAIPAddressFamily;

DECLARE_ASN1_ITEM(ROAIPAddressFamily)
DEFINE_STACK_OF(ROAIPAddressFamily)

typedef struct {
  ASN1_INTEGER* version;
  ASN1_INTEGER* asID;
  STACK_OF(ROAIPAddressFamily) * ipAddrBlocks;
} RouteOriginAttestation;

DECLARE_ASN1_FUNCTIONS(RouteOriginAttestation)

// clang-format off
ASN1_SEQUENCE(ROAIPAddress) = {
  ASN1_SIMPLE(ROAIPAddress, address, ASN1_BIT_STRING),
  ASN1_OPT(ROAIPAddress, maxLength, ASN1_INTEGER),
} ASN1_SEQUENCE_END(ROAIPAddress)

ASN1_SEQUENCE(ROAIPAddressFamily) = {
  ASN1_SIMPLE(ROAIPAddressFamily, addressFamily, ASN1_OCTET_STRING),
  ASN1_SEQUENCE_OF(ROAIPAddressFamily, addresses, ROAIPAddress),
} ASN1_SEQUENCE_END(ROAIPAddressFamily)

ASN1_SEQUENCE(RouteOriginAttestation) = {
  ASN1_EXP_OPT(RouteOriginAttestation, version, ASN1_INTEGER, 0),
  ASN1_SIMPLE(RouteOriginAttestation, asID, ASN1_INTEGER),
  ASN1_SEQUENCE_OF(RouteOriginAttestation, ipAddrBlocks, ROAIPAddressFamily),
} ASN1_SEQUENCE_END(RouteOriginAttestation)
// clang-format on

IMPLEMENT_ASN1_FUNCTIONS(RouteOriginAttestation)

namespace {

// Address Family Identifiers, RFC 3779 section 2.2.3.1
auto constexpr afi_ipv4{1u};
auto constexpr afi_ipv6{2u};

struct cms_free {
  void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); }
};
struct roa_free {
  void operator()(RouteOriginAttestation* p) const
  {
    RouteOriginAttestation_free(p);
  }
};

// Drain the OpenSSL error queue into something to put in a message.
std::string ssl_errors()
{
  std::string msg;
  while (auto const code = ERR_get_error()) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    if (!msg.empty())
      msg += "; ";
    msg += buf;
  }
  return msg.empty() ? "no detail" : msg;
}

std::uint64_t get_uint64(ASN1_INTEGER const* i, char const* what)
{
  std::uint64_t v{};
  if (ASN1_INTEGER_get_uint64(&v, i) != 1) {
    ERR_clear_error();
    throw RPKI::decode_error(fmt::format("{} is out of range", what));
  }
  return v;
}

std::string oid_string(ASN1_OBJECT const* obj)
{
  char buf[128];
  auto const len = OBJ_obj2txt(buf, sizeof(buf), obj, 1 /* numeric */);
  if (len <= 0 || static_cast<size_t>(len) >= sizeof(buf))
    return "(unknown)";
  return std::string(buf, len);
}

// The CMS wrapper: SignedData with our content type, and the content
// right there in the object.
std::string_view signed_content(CMS_ContentInfo* cms)
{
  if (OBJ_obj2nid(CMS_get0_type(cms)) != NID_pkcs7_signed) {
    throw RPKI::decode_error(
        fmt::format("CMS content type {} is not signedData",
                    oid_string(CMS_get0_type(cms))));
  }

  auto const ect = oid_string(CMS_get0_eContentType(cms));
  if (ect != ROA::content_type_oid) {
    throw RPKI::decode_error(fmt::format(
        "eContentType {} is not id-ct-routeOriginAuthz", ect));
  }

  auto const os = CMS_get0_content(cms);
  if (os == nullptr || *os == nullptr) {
    throw RPKI::decode_error("no encapsulated content");
  }

  return std::string_view(
      reinterpret_cast<char const*>(ASN1_STRING_get0_data(*os)),
      ASN1_STRING_length(*os));
}

void add_prefixes(ROAIPAddressFamily const* fam, ROA::parsed& roa)
{
  auto const afl = ASN1_STRING_length(fam->addressFamily);
  auto const af  = ASN1_STRING_get0_data(fam->addressFamily);
  if (afl < 2 || afl > 3) {
    throw RPKI::decode_error(
        fmt::format("addressFamily is {} octets, must be 2 or 3", afl));
  }

  auto const afi = (unsigned{af[0]} << 8) | af[1];
  if (afi != afi_ipv4 && afi != afi_ipv6) {
    throw RPKI::decode_error(fmt::format("unknown address family {}", afi));
  }

  auto const max_bits
      = (afi == afi_ipv4) ? IP4::address_bits : IP6::address_bits;
  auto& prefixes = (afi == afi_ipv4) ? roa.v4_prefixes : roa.v6_prefixes;

  auto const n = sk_ROAIPAddress_num(fam->addresses);
  if (n <= 0) {
    throw RPKI::decode_error("address family with no addresses");
  }

  for (auto i{0}; i < n; ++i) {
    auto const ra = sk_ROAIPAddress_value(fam->addresses, i);

    auto const bits  = ra->address;
    auto const len   = static_cast<unsigned>(ASN1_STRING_length(bits));
    auto const data  = ASN1_STRING_get0_data(bits);
    auto const flags = bits->flags;

    auto const unused
        = (flags & ASN1_STRING_FLAG_BITS_LEFT) ? (flags & 0x07) : 0;
    if (len == 0 && unused != 0) {
      throw RPKI::decode_error("empty address with unused bits");
    }
    if (len * 8 > max_bits) {
      throw RPKI::decode_error(
          fmt::format("address of {} octets too long for family", len));
    }
    auto const length = static_cast<unsigned>(len * 8 - unused);

    if (ra->maxLength) {
      auto const max_length = get_uint64(ra->maxLength, "maxLength");
      if (max_length < length || max_length > max_bits) {
        throw RPKI::decode_error(fmt::format(
            "maxLength {} invalid for prefix length {}", max_length, length));
      }
    }

    prefixes.push_back((afi == afi_ipv4) ? IP4::to_prefix(data, len, length)
                                         : IP6::to_prefix(data, len, length));
  }
}

} // namespace

namespace ROA {

parsed decode(std::string_view der)
{
  ERR_clear_error();

  auto p   = reinterpret_cast<unsigned char const*>(der.data());
  auto end = p + der.size();

  std::unique_ptr<CMS_ContentInfo, cms_free> cms{
      d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(der.size()))};
  if (!cms) {
    throw RPKI::decode_error(
        fmt::format("not a CMS object: {}", ssl_errors()));
  }
  if (p != end) {
    throw RPKI::decode_error(
        fmt::format("{} octets of trailing data", end - p));
  }

  auto const content = signed_content(cms.get());

  auto cp  = reinterpret_cast<unsigned char const*>(content.data());
  auto cpe = cp + content.size();

  std::unique_ptr<RouteOriginAttestation, roa_free> roa{
      d2i_RouteOriginAttestation(nullptr, &cp,
                                 static_cast<long>(content.size()))};
  if (!roa) {
    throw RPKI::decode_error(
        fmt::format("not a RouteOriginAttestation: {}", ssl_errors()));
  }
  if (cp != cpe) {
    throw RPKI::decode_error(
        fmt::format("{} octets after RouteOriginAttestation", cpe - cp));
  }

  if (roa->version && get_uint64(roa->version, "version") != 0) {
    throw RPKI::decode_error("RouteOriginAttestation version is not 0");
  }

  auto const as_id = get_uint64(roa->asID, "asID");
  if (as_id > std::numeric_limits<std::uint32_t>::max()) {
    throw RPKI::decode_error(fmt::format("asID {} is out of range", as_id));
  }

  parsed ret;
  ret.asn = fmt::format("AS{}", as_id);

  auto const n = sk_ROAIPAddressFamily_num(roa->ipAddrBlocks);
  if (n <= 0) {
    throw RPKI::decode_error("no ipAddrBlocks");
  }
  for (auto i{0}; i < n; ++i) {
    add_prefixes(sk_ROAIPAddressFamily_value(roa->ipAddrBlocks, i), ret);
  }

  return ret;
}

parsed decode_file(fs::path const& path)
{
  error_code ec;

  auto const st = fs::status(path, ec);
  if (ec) {
    throw RPKI::io_error(fmt::format("{}: {}", path.string(), ec.message()));
  }
  if (!fs::is_regular_file(st)) {
    throw RPKI::io_error(fmt::format("{}: not a regular file", path.string()));
  }

  auto const size = fs::file_size(path, ec);
  if (ec) {
    throw RPKI::io_error(fmt::format("{}: {}", path.string(), ec.message()));
  }
  if (size == 0) {
    // mapped_file won't map an empty file.
    return decode(std::string_view{});
  }

  boost::iostreams::mapped_file_source file;
  try {
    file.open(path.string());
  }
  catch (std::ios_base::failure const& e) {
    throw RPKI::io_error(fmt::format("{}: {}", path.string(), e.what()));
  }

  return decode(std::string_view(file.data(), file.size()));
}

void to_json(nlohmann::json& j, parsed const& roa)
{
  j = nlohmann::json{
      {"asn", roa.asn},
      {"v4Prefixes", roa.v4_prefixes},
      {"v6Prefixes", roa.v6_prefixes},
  };
}

} // namespace ROA
