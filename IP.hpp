#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string_view>

namespace IP {
bool is_address(std::string_view addr);
} // namespace IP

#endif // IP_DOT_HPP
