#include "Error.hpp"

namespace RPKI {

char const* c_str(error_kind kind)
{
  switch (kind) {
  case error_kind::input: return "input";
  case error_kind::network: return "network";
  case error_kind::upstream: return "upstream";
  case error_kind::decode: return "decode";
  case error_kind::io: return "io";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, error_kind kind)
{
  return os << c_str(kind);
}

} // namespace RPKI
