#ifndef HTTP_DOT_HPP
#define HTTP_DOT_HPP

#include "Url.hpp"

#include <optional>
#include <string>

namespace HTTP {

struct response {
  unsigned status{0};

  // Empty if the body could not be read, see body_error.
  std::optional<std::string> body;
  std::string                body_error;

  bool success() const { return 200 <= status && status < 300; }
};

// One GET, one attempt, on a connection of its own.  Anything that
// keeps us from getting a status line throws RPKI::network_error.
response get(Url::parts const& url, std::string const& user_agent);

} // namespace HTTP

#endif // HTTP_DOT_HPP
