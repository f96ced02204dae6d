#ifndef ERROR_DOT_HPP
#define ERROR_DOT_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace RPKI {

// Used as the code of an error that has no HTTP status to report.
constexpr int no_status{-1};

enum class error_kind : uint8_t {
  input,
  network,
  upstream,
  decode,
  io,
};

char const* c_str(error_kind kind);

std::ostream& operator<<(std::ostream& os, error_kind kind);

class error : public std::runtime_error {
public:
  error(error_kind kind, int code, std::string const& msg)
    : std::runtime_error(msg)
    , kind_(kind)
    , code_(code)
  {
  }

  error_kind kind() const { return kind_; }
  int        code() const { return code_; }

private:
  error_kind kind_;
  int        code_;
};

// Bad configuration at startup, never seen by a caller mid-operation.
class input_error : public error {
public:
  explicit input_error(std::string const& msg)
    : error(error_kind::input, no_status, msg)
  {
  }
};

class network_error : public error {
public:
  explicit network_error(std::string const& msg, int code = no_status)
    : error(error_kind::network, code, msg)
  {
  }
};

// The upstream answered with a non-2xx status; msg is the body text.
class upstream_error : public error {
public:
  upstream_error(int status, std::string const& msg)
    : error(error_kind::upstream, status, msg)
  {
  }
};

class decode_error : public error {
public:
  explicit decode_error(std::string const& msg, int code = no_status)
    : error(error_kind::decode, code, msg)
  {
  }
};

class io_error : public error {
public:
  explicit io_error(std::string const& msg)
    : error(error_kind::io, no_status, msg)
  {
  }
};

} // namespace RPKI

#endif // ERROR_DOT_HPP
