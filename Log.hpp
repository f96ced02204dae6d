#ifndef LOG_DOT_HPP
#define LOG_DOT_HPP

#include "Error.hpp"
#include "fs.hpp"

#include <atomic>
#include <ctime>
#include <string_view>

#include <glog/logging.h>

// The persistent, append-only log.  It's a glog sink, so anything
// sent with LOG_TO_SINK(&log, ...) is also written to the usual glog
// destinations.  Several Log objects (or processes) can share one
// file, each line goes out in a single write(2) on an O_APPEND
// descriptor.

class Log : public google::LogSink {
public:
  Log(Log const&) = delete;
  Log& operator=(Log const&) = delete;

  // Fatal if the file can't be opened or created.
  explicit Log(fs::path path);
  ~Log() override;

  void send(google::LogSeverity severity,
            char const*         full_filename,
            char const*         base_filename,
            int                 line,
            struct ::tm const*  tm_time,
            char const*         message,
            size_t              message_len) override;

  // One line: "<kind>: <detail>" at ERROR.
  void error(std::string_view kind, std::string_view detail);
  void error(RPKI::error const& e) { error(RPKI::c_str(e.kind()), e.what()); }

  fs::path const& path() const { return path_; }

  // Lines that could not be written.
  unsigned long write_failures() const { return write_failures_; }

private:
  fs::path                   path_;
  int                        fd_{-1};
  std::atomic<unsigned long> write_failures_{0};
};

#endif // LOG_DOT_HPP
