#include "IP.hpp"

#include "IP4.hpp"
#include "IP6.hpp"

namespace IP {
bool is_address(std::string_view addr)
{
  return IP4::is_address(addr) || IP6::is_address(addr);
}
} // namespace IP
