#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace IP4 {
auto constexpr address_bits{32u};
auto constexpr address_bytes{address_bits / 8};

auto is_address(std::string_view addr) -> bool;

// Render the leading bytes of an address and a prefix length in
// CIDR notation, "192.0.2.0/24".  Missing trailing bytes are zero,
// as are any bits past the prefix length.
auto to_prefix(unsigned char const* addr, std::size_t addr_len, unsigned length)
    -> std::string;

} // namespace IP4

#endif // IP4_DOT_HPP
