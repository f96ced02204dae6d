#ifndef FAKE_UPSTREAM_DOT_HPP
#define FAKE_UPSTREAM_DOT_HPP

// A relying party for tests: an HTTP/1.1 server on 127.0.0.1 that
// answers each request target with a canned reply.

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

class fake_upstream {
public:
  struct reply {
    unsigned    status{200};
    std::string body;
    // Promise more body than we send, then hang up.
    bool truncate{false};
  };

  fake_upstream(fake_upstream const&) = delete;
  fake_upstream& operator=(fake_upstream const&) = delete;

  explicit fake_upstream(std::map<std::string, reply> replies)
    : replies_(std::move(replies))
    , acceptor_(ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0})
  {
    port_   = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve_(); });
  }

  ~fake_upstream()
  {
    done_ = true;

    // Wake up the accept().
    boost::system::error_code      ec;
    boost::asio::io_context        ioc;
    boost::asio::ip::tcp::socket   sock{ioc};
    sock.connect({boost::asio::ip::make_address("127.0.0.1"), port_}, ec);

    thread_.join();
    for (auto& t : conns_)
      t.join();
  }

  unsigned short port() const { return port_; }

  std::string url() const { return fmt::format("http://127.0.0.1:{}", port_); }

  // Targets of all requests seen so far.
  std::vector<std::string> targets() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_;
  }

private:
  void serve_()
  {
    while (!done_) {
      boost::system::error_code    ec;
      boost::asio::ip::tcp::socket sock{ioc_};
      acceptor_.accept(sock, ec);
      if (ec || done_)
        break;
      conns_.emplace_back(
          [this, s = std::move(sock)]() mutable { answer_(std::move(s)); });
    }
  }

  void answer_(boost::asio::ip::tcp::socket sock)
  {
    namespace http = boost::beast::http;

    boost::system::error_code                ec;
    boost::beast::flat_buffer                buf;
    http::request<http::string_body>         req;
    http::read(sock, buf, req, ec);
    if (ec) {
      LOG(WARNING) << "fake upstream read: " << ec.message();
      return;
    }

    auto const target = std::string(req.target());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      targets_.push_back(target);
    }

    auto const it  = replies_.find(target);
    auto const rep = (it != replies_.end()) ? it->second
                                            : reply{404, "no such target"};

    auto const length = rep.body.size() + (rep.truncate ? 100 : 0);
    auto const msg    = fmt::format("HTTP/1.1 {} Canned\r\n"
                                 "Content-Type: application/json\r\n"
                                 "Content-Length: {}\r\n"
                                 "Connection: close\r\n"
                                 "\r\n"
                                 "{}",
                                 rep.status, length, rep.body);

    boost::asio::write(sock, boost::asio::buffer(msg), ec);
    LOG_IF(WARNING, ec) << "fake upstream write: " << ec.message();

    sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }

  std::map<std::string, reply> const replies_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  unsigned short                 port_{0};

  std::atomic<bool>        done_{false};
  std::thread              thread_;
  std::vector<std::thread> conns_; // only touched by thread_, then ~

  mutable std::mutex       mutex_;
  std::vector<std::string> targets_;
};

// A port on 127.0.0.1 with nobody listening.
inline unsigned short closed_port()
{
  boost::asio::io_context        ioc;
  boost::asio::ip::tcp::acceptor acc{
      ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
  return acc.local_endpoint().port();
}

#endif // FAKE_UPSTREAM_DOT_HPP
