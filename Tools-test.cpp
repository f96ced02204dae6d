#include "Tools.hpp"

#include "Error.hpp"
#include "fake-upstream.hpp"

#include <fstream>
#include <future>
#include <iterator>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using json = nlohmann::json;

namespace {
auto constexpr roas_body = R"({
  "metadata": {"generated": 1714564263, "generatedTime": "2024-05-01T11:51:03Z"},
  "roas": [
    {"asn": "AS65000", "prefix": "192.0.2.0/24", "maxLength": 24, "ta": "arin"}
  ]
})";

std::string slurp(fs::path const& path)
{
  std::ifstream ifs(path);
  CHECK(ifs) << path;
  return std::string(std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>());
}

bool contains(std::string const& haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string::npos;
}

Tools::typed_error const& error_of(Tools::result const& res)
{
  auto const err = std::get_if<Tools::typed_error>(&res);
  CHECK(err != nullptr) << "expected an error, got "
                        << std::get<json>(res).dump();
  return *err;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const dir
      = fs::temp_directory_path() / fmt::format("Tools-test-{}", ::getpid());
  fs::create_directories(dir);

  Log log(dir / "rpki_mcp.log");

  fake_upstream up({
      {"/api/v1/status", {503, "initial validation ongoing"}},
      {"/api/v1/validity/AS65000/203.0.113.0/24", {404, "not found"}},
      {"/json?select-asn=AS65000", {200, roas_body}},
  });

  Gateway::Client const   rp(Endpoint(up.url()), log, "rpki-mcp-test/1.0");
  Tools::Dispatcher const tools(rp, log);

  auto const& list = tools.list();
  CHECK_EQ(list.size(), 4u);
  CHECK_EQ(std::string(list[0].name), "status");
  CHECK_EQ(std::string(list[1].name), "validity");
  CHECK_EQ(std::string(list[2].name), "roas");
  CHECK_EQ(std::string(list[3].name), "parseRoaFile");
  CHECK_EQ(list[1].input_schema["required"], json::parse(R"(["asn","prefix"])"));
  CHECK(!list[0].input_schema.contains("required"));

  // Upstream failures come back with the HTTP status as their code.
  auto const res = tools.call("validity", {{"asn", "AS65000"}, {"prefix", "203.0.113.0/24"}});
  auto const& nf = error_of(res);
  CHECK_EQ(nf.code, 404);
  CHECK_EQ(nf.message, "not found");

  auto const roas = tools.call("roas", {{"asn", "AS65000"}});
  CHECK_EQ(std::get<json>(roas)["roas"][0]["trustAnchor"], "arin");

  // A TLS failure is a network error like any other, and is logged.
  fake_upstream           plain({});
  Gateway::Client const   tls_rp(
      Endpoint(fmt::format("https://127.0.0.1:{}", plain.port())), log,
      "rpki-mcp-test/1.0");
  Tools::Dispatcher const tls_tools(tls_rp, log);
  auto const no_tls = tls_tools.call("status", json::object());
  CHECK_EQ(error_of(no_tls).code, RPKI::no_status);
  CHECK(contains(error_of(no_tls).message, "TLS handshake with 127.0.0.1:"));

  // Local file trouble.
  auto const missing = tools.parse_roa_file((dir / "missing.roa").string());
  CHECK_EQ(error_of(missing).code, RPKI::no_status);

  {
    std::ofstream ofs(dir / "junk.roa");
    ofs << "junk";
  }
  auto const junk
      = tools.call("parseRoaFile", {{"path", (dir / "junk.roa").string()}});
  CHECK_EQ(error_of(junk).code, RPKI::no_status);

  // Arguments.
  auto const no_args = tools.call("validity", {{"asn", "AS65000"}});
  CHECK_EQ(error_of(no_args).code, Tools::invalid_params);
  CHECK(contains(error_of(no_args).message, "prefix"));

  auto const wrong_type = tools.call("roas", {{"asn", 65000}});
  CHECK_EQ(error_of(wrong_type).code, Tools::invalid_params);

  auto const not_object = tools.call("roas", json::array({"AS65000"}));
  CHECK_EQ(error_of(not_object).code, Tools::invalid_params);

  auto const unknown = tools.call("rsync", json::object());
  CHECK_EQ(error_of(unknown).code, Tools::method_not_found);

  // Concurrent calls don't get in each other's way: one fails, the
  // other doesn't.
  for (auto i{0}; i < 8; ++i) {
    auto s = std::async(std::launch::async, [&] { return tools.status(); });
    auto r = std::async(std::launch::async,
                        [&] { return tools.roas("AS65000"); });

    auto const sr = s.get();
    CHECK_EQ(error_of(sr).code, 503);
    CHECK_EQ(error_of(sr).message, "initial validation ongoing");

    auto const rr = r.get();
    CHECK_EQ(std::get<json>(rr)["roas"].size(), 1u);
  }

  // Every error made it to the log, once per line.
  auto const text = slurp(log.path());
  CHECK(contains(text, "upstream: validity: not found\n"));
  CHECK(contains(text, "upstream: status: initial validation ongoing\n"));
  CHECK(contains(text, "network: status: TLS handshake with 127.0.0.1:"));
  CHECK(contains(text, "io: parseRoaFile: "));
  CHECK(contains(text, "decode: parseRoaFile: "));
  CHECK(contains(text, "params: «validity» requires string argument(s): prefix\n"));
  CHECK(contains(text, "params: tool «rsync» not found\n"));
  CHECK(contains(text, "GET " + up.url() + "/json?select-asn=AS65000\n"));
  CHECK_EQ(log.write_failures(), 0u);

  fs::remove_all(dir);
}
