#ifndef ROA_DOT_HPP
#define ROA_DOT_HPP

#include "fs.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// Route Origin Authorizations, RFC 6482, in the RPKI signed object
// profile of RFC 6488.  Decoding is lenient: the CMS structure and
// the RouteOriginAttestation have to be right, but no signature or
// certificate is checked.

namespace ROA {

// OID of the encapsulated content, id-ct-routeOriginAuthz.
auto constexpr content_type_oid{"1.2.840.113549.1.9.16.1.24"};

struct parsed {
  std::string              asn; // "AS65000"
  std::vector<std::string> v4_prefixes;
  std::vector<std::string> v6_prefixes;
};

// Throws RPKI::decode_error.
parsed decode(std::string_view der);

// Throws RPKI::io_error if path can't be read, else as decode().
parsed decode_file(fs::path const& path);

void to_json(nlohmann::json& j, parsed const& roa);

} // namespace ROA

#endif // ROA_DOT_HPP
