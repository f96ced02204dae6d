#include "Log.hpp"

#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
std::vector<std::string> lines_of(fs::path const& path)
{
  std::ifstream            ifs(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(ifs, line);)
    lines.push_back(line);
  return lines;
}

// "E 2026-10-19 12:34:56 Log.cpp:57] network: connection refused"
bool well_formed(std::string const& line, char severity)
{
  return line.size() > 22 && line[0] == severity && line[1] == ' '
         && line[6] == '-' && line[9] == '-' && line[12] == ' '
         && line[15] == ':' && line[18] == ':' && line[21] == ' '
         && line.find("] ") != std::string::npos;
}

bool ends_with(std::string const& s, std::string const& suffix)
{
  return s.size() >= suffix.size()
         && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const path
      = fs::temp_directory_path() / fmt::format("Log-test-{}.log", ::getpid());
  fs::remove(path);

  {
    Log a(path);
    CHECK_EQ(a.path(), path);
    a.error("network", "connection refused");
    {
      // A second writer on the same file.
      Log b(path);
      b.error("decode", "missing field \"serial\"");
    }
    a.error(RPKI::io_error("/no/such.roa: No such file or directory"));
    CHECK_EQ(a.write_failures(), 0u);
  }

  auto lines = lines_of(path);
  CHECK_EQ(lines.size(), 3u);
  for (auto const& line : lines)
    CHECK(well_formed(line, 'E')) << line;
  CHECK(ends_with(lines[0], "] network: connection refused"));
  CHECK(ends_with(lines[1], "] decode: missing field \"serial\""));
  CHECK(ends_with(lines[2], "] io: /no/such.roa: No such file or directory"));

  // Opening again appends, the old lines stay.
  {
    Log c(path);
    LOG_TO_SINK(&c, INFO) << "GET http://127.0.0.1:8323/api/v1/status";
  }
  lines = lines_of(path);
  CHECK_EQ(lines.size(), 4u);
  CHECK(well_formed(lines[3], 'I')) << lines[3];
  CHECK(ends_with(lines[3], "] GET http://127.0.0.1:8323/api/v1/status"));

  // Lines from many threads never run into each other.
  auto constexpr threads{8};
  auto constexpr per_thread{200};
  {
    Log shared(path);

    std::vector<std::thread> workers;
    for (auto t{0}; t < threads; ++t) {
      workers.emplace_back([&shared, t] {
        for (auto i{0}; i < per_thread; ++i)
          shared.error("network", fmt::format("thread {} line {}", t, i));
      });
    }
    for (auto& w : workers)
      w.join();
    CHECK_EQ(shared.write_failures(), 0u);
  }

  lines = lines_of(path);
  CHECK_EQ(lines.size(), 4u + threads * per_thread);
  for (auto i{4u}; i < lines.size(); ++i) {
    CHECK(well_formed(lines[i], 'E')) << lines[i];
    CHECK_NE(lines[i].find("] network: thread "), std::string::npos) << lines[i];
  }

  fs::remove(path);
}
