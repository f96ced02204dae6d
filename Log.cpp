#include "Log.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

Log::Log(fs::path path)
  : path_(std::move(path))
{
  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0664);
  PCHECK(fd_ >= 0) << "open(\"" << path_.string() << "\") failed";
}

Log::~Log()
{
  if (fd_ >= 0) {
    PLOG_IF(WARNING, ::close(fd_) != 0) << "close " << path_.string();
  }
}

void Log::send(google::LogSeverity severity,
               char const*         full_filename,
               char const*         base_filename,
               int                 line,
               struct ::tm const*  tm_time,
               char const*         message,
               size_t              message_len)
{
  // Log line format: [IWEF] yyyy-mm-dd hh:mm:ss file:line] msg
  auto const msg{fmt::format(
      "{} {:04}-{:02}-{:02} {:02}:{:02}:{:02} {}:{}] {}\n",
      google::GetLogSeverityName(severity)[0], tm_time->tm_year + 1900,
      tm_time->tm_mon + 1, tm_time->tm_mday, tm_time->tm_hour,
      tm_time->tm_min, tm_time->tm_sec, base_filename, line,
      std::string_view(message, message_len))};

  for (;;) {
    auto const s = ::write(fd_, msg.data(), msg.size());
    if (s == static_cast<ssize_t>(msg.size()))
      return;
    if (s < 0 && errno == EINTR)
      continue;
    break;
  }

  // Can't LOG() from inside a sink, and the caller has its own error
  // to report, so count it and say so on stderr.
  ++write_failures_;
  auto const err{errno};
  fmt::print(stderr, "write to {} failed: {}\n", path_.string(),
             std::strerror(err));
}

void Log::error(std::string_view kind, std::string_view detail)
{
  LOG_TO_SINK(this, ERROR) << kind << ": " << detail;
}
