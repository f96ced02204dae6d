#ifndef ENDPOINT_DOT_HPP
#define ENDPOINT_DOT_HPP

#include <iostream>
#include <string>
#include <string_view>

// Base URL of the upstream relying-party API, e.g.
// "https://rpki-validator.example.net:8323".  Only the scheme is
// checked here; anything else wrong with the URL shows up when the
// first request is made.

class Endpoint {
public:
  Endpoint() = default;

  // Throws RPKI::input_error.
  explicit Endpoint(std::string_view url);

  static bool validate(std::string_view url, std::string& msg, Endpoint& ep);

  bool empty() const { return url_.empty(); }

  std::string const& str() const { return url_; }

  // The endpoint followed by path, which should start with a '/'.
  std::string join(std::string_view path) const;

  bool operator==(Endpoint const& rhs) const { return url_ == rhs.url_; }

private:
  bool set_(std::string_view url, bool should_throw, std::string& msg);

  std::string url_;
};

inline std::ostream& operator<<(std::ostream& os, Endpoint const& ep)
{
  return os << ep.str();
}

#endif // ENDPOINT_DOT_HPP
