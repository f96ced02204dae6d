#ifndef URL_DOT_HPP
#define URL_DOT_HPP

#include <string>
#include <string_view>

namespace Url {

struct parts {
  bool        tls{false}; // https
  std::string host;       // no brackets on an IPv6 literal
  std::string port;       // "80" or "443" unless given
  std::string target;     // path and query, at least "/"

  bool default_port() const { return port == (tls ? "443" : "80"); }

  // Value for the Host: header field.
  std::string host_field() const;
};

// Split an absolute http or https URL, throws RPKI::network_error if
// the URL can't be used to make a request.
parts split(std::string_view url);

} // namespace Url

#endif // URL_DOT_HPP
