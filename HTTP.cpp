#include "HTTP.hpp"

#include "Error.hpp"
#include "IP.hpp"

#include <cstdint>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {
// Routinator's full /json dump is tens of megabytes, a select-asn
// answer is much smaller.
auto constexpr body_limit{std::uint64_t{256} * 1024 * 1024};

template <typename Stream>
HTTP::response exchange(Stream&            stream,
                        Url::parts const&  url,
                        std::string const& user_agent)
{
  beast::error_code ec;

  http::request<http::empty_body> req{http::verb::get, url.target, 11};
  req.set(http::field::host, url.host_field());
  req.set(http::field::user_agent, user_agent);
  req.set(http::field::accept, "application/json");
  req.set(http::field::connection, "close");

  http::write(stream, req, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("write to {}: {}", url.host_field(), ec.message()));
  }

  beast::flat_buffer                       buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(body_limit);

  http::read_header(stream, buffer, parser, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("read from {}: {}", url.host_field(), ec.message()));
  }

  HTTP::response res;
  res.status = parser.get().result_int();

  http::read(stream, buffer, parser, ec);
  if (ec) {
    res.body_error = ec.message();
  }
  else {
    res.body = parser.release().body();
  }

  return res;
}

tcp::resolver::results_type resolve(net::io_context& ioc, Url::parts const& url)
{
  tcp::resolver     resolver{ioc};
  beast::error_code ec;
  auto const        results = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("resolve {}: {}", url.host, ec.message()));
  }
  return results;
}

HTTP::response get_plain(Url::parts const& url, std::string const& user_agent)
{
  net::io_context ioc;
  auto const      endpoints = resolve(ioc, url);

  beast::tcp_stream stream{ioc};
  beast::error_code ec;
  stream.connect(endpoints, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("connect to {}: {}", url.host_field(), ec.message()));
  }

  auto res = exchange(stream, url, user_agent);

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    LOG(WARNING) << "shutdown " << url.host_field() << ": " << ec.message();
  }

  return res;
}

// The context constructor has no error_code overload.
ssl::context tls_context()
{
  try {
    return ssl::context{ssl::context::tls_client};
  }
  catch (boost::system::system_error const& e) {
    throw RPKI::network_error(fmt::format("TLS context: {}", e.what()));
  }
}

HTTP::response get_tls(Url::parts const& url, std::string const& user_agent)
{
  net::io_context ioc;
  auto const      endpoints = resolve(ioc, url);

  auto ctx = tls_context();

  beast::error_code ec;
  ctx.set_default_verify_paths(ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("TLS trust store: {}", ec.message()));
  }
  ctx.set_verify_mode(ssl::verify_peer, ec);
  if (ec) {
    throw RPKI::network_error(fmt::format("TLS verify mode: {}", ec.message()));
  }

  beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

  // No SNI for an address, RFC 6066 section 3.
  if (!IP::is_address(url.host)) {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      ec.assign(static_cast<int>(::ERR_get_error()),
                net::error::get_ssl_category());
      throw RPKI::network_error(
          fmt::format("SNI for {}: {}", url.host, ec.message()));
    }
  }
  stream.set_verify_callback(ssl::host_name_verification(url.host), ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("TLS verify callback: {}", ec.message()));
  }

  beast::get_lowest_layer(stream).connect(endpoints, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("connect to {}: {}", url.host_field(), ec.message()));
  }

  stream.handshake(ssl::stream_base::client, ec);
  if (ec) {
    throw RPKI::network_error(
        fmt::format("TLS handshake with {}: {}", url.host_field(),
                    ec.message()));
  }

  auto res = exchange(stream, url, user_agent);

  // Lots of servers just close the connection.
  stream.shutdown(ec);
  if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
    LOG(WARNING) << "TLS shutdown " << url.host_field() << ": "
                 << ec.message();
  }

  return res;
}
} // namespace

namespace HTTP {

response get(Url::parts const& url, std::string const& user_agent)
{
  return url.tls ? get_tls(url, user_agent) : get_plain(url, user_agent);
}

} // namespace HTTP
