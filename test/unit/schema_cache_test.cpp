#include <xsc/canonical_key.hpp>
#include <xsc/document_parser.hpp>
#include <xsc/errors.hpp>
#include <xsc/schema_cache.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace xsc;

namespace fs = std::filesystem;

namespace {

  cache_options
  quiet_options() {
    cache_options opts;
    opts.log = nullptr;
    return opts;
  }

  // Counts requests so tests can tell when the network would be used.
  struct mock_http {
    std::unordered_map<std::string, http_response> responses;
    std::shared_ptr<std::atomic<int>> calls =
        std::make_shared<std::atomic<int>>(0);

    http_transport
    transport() const {
      return [responses = responses,
              calls = calls](const std::string& url) -> http_response {
        ++*calls;
        auto it = responses.find(url);
        if (it == responses.end()) return {404, "", std::nullopt};
        return it->second;
      };
    }
  };

  fs::path
  make_tmp_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("xsc_cache_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
  }

  void
  write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
  }

  std::string
  file_key(const fs::path& path) {
    return "file://" + path.string();
  }

  std::string
  version_of(const std::shared_ptr<const document>& schema) {
    const auto* v = schema->find_attribute("version");
    return v ? *v : "";
  }

  document
  schema_doc(const std::string& id, const std::string& version = "1") {
    std::vector<attribute> attrs;
    if (!id.empty()) attrs.emplace_back(qname("", "id"), id);
    attrs.emplace_back(qname("", "version"), version);
    return document(qname("http://www.w3.org/2001/XMLSchema", "schema"),
                    std::move(attrs));
  }

  bool
  accept_all(const document&) {
    return true;
  }

} // namespace

// ---------------------------------------------------------------------------
// add / load / remove
// ---------------------------------------------------------------------------

TEST_CASE("cache: table is created on first admission", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK_FALSE(cache.has_table());
  CHECK(cache.find("anything") == nullptr);
  CHECK(cache.load_all().empty());
  CHECK_FALSE(cache.has_table());

  CHECK(cache.add("k", schema_doc("id")).empty());
  CHECK(cache.has_table());
}

TEST_CASE("cache: ensure_table is idempotent under concurrent first use",
          "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  std::vector<schema_store*> seen(8, nullptr);

  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < seen.size(); ++i) {
    workers.emplace_back(
        [&cache, &seen, i] { seen[i] = &cache.ensure_table(); });
  }
  for (auto& w : workers)
    w.join();

  for (auto* table : seen) {
    CHECK(table == seen.front());
  }
}

TEST_CASE("cache: add is idempotent", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  auto doc = schema_doc("urn:person");

  CHECK(cache.add("person", doc, accept_all).empty());
  CHECK(cache.add("person", doc, accept_all).empty());

  auto rows = cache.load_all();
  REQUIRE(rows.size() == 1);
  CHECK(*rows[0].schema == doc);
  CHECK(rows[0].mtime == timestamp{});
}

TEST_CASE("cache: add overwrites by key", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());

  CHECK(cache.add("k", schema_doc("", "1")).empty());
  CHECK(cache.add("k", schema_doc("", "2")).empty());

  CHECK(cache.load_all().size() == 1);
  CHECK(version_of(cache.load("k")) == "2");
}

TEST_CASE("cache: lookup by source key and by identifier", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add("/schemas/person.xsd", schema_doc("urn:person")).empty());

  auto by_source = cache.load("/schemas/person.xsd");
  auto by_uri = cache.load("file:///schemas/person.xsd");
  auto by_id = cache.load("urn:person");

  CHECK(by_source == by_id);
  CHECK(by_uri == by_id);
}

TEST_CASE("cache: rejected add inserts nothing", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());

  auto result =
      cache.add("k", schema_doc("id"), [](const document&) { return false; });

  REQUIRE(result.size() == 1);
  CHECK(result[0].source_key == "k");
  CHECK(result[0].reason == "validation rejected");
  CHECK(cache.find("k") == nullptr);
}

TEST_CASE("cache: validator exceptions become failures", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());

  auto result = cache.add("k", schema_doc("id"), [](const document&) -> bool {
    throw std::runtime_error("boom");
  });

  REQUIRE(result.size() == 1);
  CHECK(result[0].reason.find("boom") != std::string::npos);
  CHECK(cache.find("k") == nullptr);
}

TEST_CASE("cache: load miss throws schema_not_found", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add("present", schema_doc("")).empty());

  try {
    cache.load("/absent.xsd");
    FAIL("expected schema_not_found");
  } catch (const schema_not_found& e) {
    CHECK(e.key() == "file:///absent.xsd");
  }
}

TEST_CASE("cache: remove by source key or identifier", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add("a", schema_doc("urn:a")).empty());
  CHECK(cache.add("b", schema_doc("urn:b")).empty());

  cache.remove("a");
  CHECK(cache.find("a") == nullptr);
  CHECK(cache.find("urn:a") == nullptr);

  cache.remove("urn:b");
  CHECK(cache.find("b") == nullptr);
  CHECK(cache.load_all().empty());
}

TEST_CASE("cache: remove of an absent key is a no-op", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK_NOTHROW(cache.remove("missing"));

  CHECK(cache.add("a", schema_doc("urn:a")).empty());
  CHECK_NOTHROW(cache.remove("missing"));
  CHECK(cache.load_all().size() == 1);
}

TEST_CASE("cache: custom identifier attribute", "[schema_cache]") {
  auto opts = quiet_options();
  opts.id_attribute = "name";
  schema_cache cache(opts, mock_http{}.transport());

  document grammar(qname("http://relaxng.org/ns/structure/1.0", "grammar"),
                   {attribute(qname("", "name"), "people")});
  CHECK(cache.add("g", grammar).empty());

  CHECK(cache.load("people") == cache.load("g"));
}

// ---------------------------------------------------------------------------
// add_uri / load_uri
// ---------------------------------------------------------------------------

TEST_CASE("cache: add_uri with unknown scheme inserts nothing",
          "[schema_cache]") {
  mock_http http;
  schema_cache cache(quiet_options(), http.transport());

  try {
    cache.add_uri("ftp://host/s.xsd");
    FAIL("expected unknown_uri_scheme");
  } catch (const unknown_uri_scheme& e) {
    CHECK(e.key() == "ftp://host/s.xsd");
  }
  CHECK(cache.load_all().empty());
  CHECK(*http.calls == 0);
}

TEST_CASE("cache: add_uri over http records Last-Modified",
          "[schema_cache]") {
  const timestamp modified{std::chrono::seconds{1600000000}};
  mock_http http;
  http.responses["https://example.com/s.xsd"] = {200, R"(<schema id="urn:s"/>)",
                                                 modified};
  http.responses["https://example.com/anon.xsd"] = {200, "<schema/>",
                                                    std::nullopt};
  schema_cache cache(quiet_options(), http.transport());

  CHECK(cache.add_uri("https://example.com/s.xsd").empty());
  CHECK(cache.add_uri("https://example.com/anon.xsd").empty());

  for (const auto& row : cache.load_all()) {
    if (row.source_key == "https://example.com/s.xsd") {
      CHECK(row.id_key == "urn:s");
      CHECK(row.mtime == modified);
    } else {
      CHECK(row.id_key == "https://example.com/anon.xsd");
      CHECK(row.mtime == timestamp{});
    }
  }
  CHECK(cache.load("urn:s") == cache.load("https://example.com/s.xsd"));
}

TEST_CASE("cache: add_uri failures propagate without inserting",
          "[schema_cache]") {
  mock_http http;
  http.responses["http://example.com/bad.xsd"] = {200, "<unclosed",
                                                  std::nullopt};
  schema_cache cache(quiet_options(), http.transport());

  CHECK_THROWS_AS(cache.add_uri("http://example.com/bad.xsd"), parse_error);
  CHECK_THROWS_AS(cache.add_uri("http://example.com/missing.xsd"),
                  network_error);
  CHECK_THROWS_AS(cache.add_uri("file:///nonexistent/xsc/s.xsd"), io_error);
  CHECK(cache.load_all().empty());
}

TEST_CASE("cache: load_uri fetches a file once and caches it",
          "[schema_cache]") {
  auto dir = make_tmp_dir("load_uri");
  write_text(dir / "s.xsd", R"(<schema version="1"/>)");
  schema_cache cache(quiet_options(), mock_http{}.transport());

  auto key = file_key(dir / "s.xsd");
  auto schema = cache.load_uri(key);
  REQUIRE(schema);
  CHECK(version_of(schema) == "1");

  // Cached: a changed file is not re-read by load
  write_text(dir / "s.xsd", R"(<schema version="2"/>)");
  CHECK(cache.load(key) == schema);
  CHECK(cache.load_uri(key) == schema);

  fs::remove_all(dir);
}

TEST_CASE("cache: load_uri retries exactly once", "[schema_cache]") {
  mock_http http;
  http.responses["http://example.com/s.xsd"] = {200, "<schema/>",
                                                std::nullopt};
  schema_cache cache(quiet_options(), http.transport());

  CHECK(cache.load_uri("http://example.com/s.xsd"));
  CHECK(cache.load_uri("http://example.com/s.xsd"));
  CHECK(*http.calls == 1);

  CHECK_THROWS_AS(cache.load_uri("http://example.com/missing.xsd"),
                  network_error);
  CHECK(*http.calls == 2);
}

TEST_CASE("cache: load_uri on an opaque key propagates the scheme error",
          "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK_THROWS_AS(cache.load_uri("no-such-schema"), unknown_uri_scheme);
}

// ---------------------------------------------------------------------------
// add_path
// ---------------------------------------------------------------------------

TEST_CASE("cache: add_path loads every file and injects identifiers",
          "[schema_cache]") {
  auto dir = make_tmp_dir("add_path");
  write_text(dir / "person.xsd", R"(<schema id="urn:person"/>)");
  write_text(dir / "nested" / "anon.xsd", "<schema/>");
  schema_cache cache(quiet_options(), mock_http{}.transport());

  CHECK(cache.add_path(dir.string()).empty());

  CHECK(cache.load_all().size() == 2);
  CHECK(cache.load("urn:person") == cache.load((dir / "person.xsd").string()));

  auto anon_key = file_key(dir / "nested" / "anon.xsd");
  auto anon = cache.load(anon_key);
  CHECK(schema_id(*anon) == anon_key);

  for (const auto& row : cache.load_all()) {
    CHECK(row.mtime != timestamp{});
  }

  fs::remove_all(dir);
}

TEST_CASE("cache: add_path refreshes only files with a newer mtime",
          "[schema_cache]") {
  auto dir = make_tmp_dir("staleness");
  auto file = dir / "s.xsd";
  write_text(file, R"(<schema id="urn:s" version="1"/>)");
  auto original_mtime = fs::last_write_time(file);

  int parses = 0;
  parse_fn counting_parse = [&parses](std::string_view xml) {
    ++parses;
    return parse_document(xml);
  };

  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add_path(dir.string(), counting_parse, accept_all).empty());
  CHECK(parses == 1);
  CHECK_FALSE(cache.is_outdated(file.string()));

  // Content changes but the mtime does not advance: left alone
  write_text(file, R"(<schema id="urn:s" version="2"/>)");
  fs::last_write_time(file, original_mtime);
  CHECK(cache.add_path(dir.string(), counting_parse, accept_all).empty());
  CHECK(parses == 1);
  CHECK(version_of(cache.load("urn:s")) == "1");

  // The mtime moves forward: refreshed
  fs::last_write_time(file, original_mtime + std::chrono::seconds(2));
  CHECK(cache.is_outdated(file.string()));
  CHECK(cache.add_path(dir.string(), counting_parse, accept_all).empty());
  CHECK(parses == 2);
  CHECK(version_of(cache.load("urn:s")) == "2");
  CHECK(cache.load_all().size() == 1);

  fs::remove_all(dir);
}

TEST_CASE("cache: an older mtime is not a refresh", "[schema_cache]") {
  auto dir = make_tmp_dir("older");
  auto file = dir / "s.xsd";
  write_text(file, R"(<schema version="1"/>)");
  auto original_mtime = fs::last_write_time(file);

  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add_path(dir.string()).empty());

  fs::last_write_time(file, original_mtime - std::chrono::hours(1));
  CHECK_FALSE(cache.is_outdated(file.string()));
  CHECK(cache.list_outdated(dir.string()).empty());

  fs::remove_all(dir);
}

TEST_CASE("cache: rows added without mtime are never outdated",
          "[schema_cache]") {
  auto dir = make_tmp_dir("no_mtime");
  auto file = dir / "s.xsd";
  write_text(file, R"(<schema version="disk"/>)");

  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add(file.string(), schema_doc("", "memory")).empty());

  CHECK_FALSE(cache.is_outdated(file.string()));
  CHECK(cache.add_path(dir.string()).empty());
  CHECK(version_of(cache.load(file.string())) == "memory");

  fs::remove_all(dir);
}

TEST_CASE("cache: add_path isolates malformed files", "[schema_cache]") {
  auto dir = make_tmp_dir("partial");
  write_text(dir / "good.xsd", R"(<schema id="urn:good"/>)");
  write_text(dir / "bad.xsd", "<schema><oops></schema>");

  std::ostringstream log;
  auto opts = quiet_options();
  opts.log = &log;
  schema_cache cache(opts, mock_http{}.transport());

  auto result = cache.add_path(dir.string());

  REQUIRE(result.size() == 1);
  CHECK(result[0].source_key == file_key(dir / "bad.xsd"));
  CHECK(result[0].mtime != timestamp{});
  CHECK(result[0].reason.find("parse error") != std::string::npos);

  CHECK(cache.load((dir / "good.xsd").string()));
  CHECK(cache.load("urn:good"));
  CHECK(cache.find((dir / "bad.xsd").string()) == nullptr);

  CHECK(log.str().find("xsc: warning: " + file_key(dir / "bad.xsd")) !=
        std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("cache: add_path reports validation rejections", "[schema_cache]") {
  auto dir = make_tmp_dir("rejected");
  write_text(dir / "schema.xsd", "<schema/>");
  write_text(dir / "other.xml", "<catalog/>");

  schema_cache cache(quiet_options(), mock_http{}.transport());
  auto result = cache.add_path(dir.string(), parse_document,
                               [](const document& d) {
                                 return d.name().local_name() == "schema";
                               });

  REQUIRE(result.size() == 1);
  CHECK(result[0].source_key == file_key(dir / "other.xml"));
  CHECK(result[0].reason == "validation rejected");
  CHECK(cache.load_all().size() == 1);

  // Still missing from the cache, so retried on the next scan
  CHECK(cache.is_outdated((dir / "other.xml").string()));

  fs::remove_all(dir);
}

TEST_CASE("cache: add_path on a missing directory throws", "[schema_cache]") {
  auto dir = make_tmp_dir("gone");
  fs::remove_all(dir);

  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK_THROWS_AS(cache.add_path(dir.string()), io_error);
}

TEST_CASE("cache: add_path accepts a file URI", "[schema_cache]") {
  auto dir = make_tmp_dir("uri_root");
  write_text(dir / "s.xsd", "<schema/>");

  schema_cache cache(quiet_options(), mock_http{}.transport());
  CHECK(cache.add_path(file_key(dir)).empty());
  CHECK(cache.load_all().size() == 1);

  fs::remove_all(dir);
}

TEST_CASE("cache: empty file paths are typed misses", "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  cache.add("urn:present", schema_doc("urn:present"));

  CHECK_FALSE(cache.find("file://"));
  try {
    cache.load("file://");
    FAIL("expected schema_not_found");
  } catch (const schema_not_found& e) {
    CHECK(e.key() == "file://");
  }

  CHECK_NOTHROW(cache.remove("file://"));
  CHECK_NOTHROW(cache.remove(""));
  CHECK(cache.load_all().size() == 1);

  try {
    cache.add_uri("file://");
    FAIL("expected io_error");
  } catch (const io_error& e) {
    CHECK(e.key() == "file://");
  }
  CHECK_THROWS_AS(cache.load_uri("file://"), io_error);
  CHECK_THROWS_AS(cache.add_path(""), io_error);
  CHECK_THROWS_AS(cache.add_path("file://"), io_error);
  CHECK(cache.load_all().size() == 1);
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_CASE("cache: concurrent add and load of distinct keys",
          "[schema_cache]") {
  schema_cache cache(quiet_options(), mock_http{}.transport());
  constexpr int threads = 6;
  constexpr int per_thread = 100;
  std::atomic<int> errors{0};

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&cache, &errors, t] {
      for (int i = 0; i < per_thread; ++i) {
        auto key = "k" + std::to_string(t) + "-" + std::to_string(i);
        if (!cache.add(key, schema_doc("id-" + key)).empty()) ++errors;
        if (!cache.find("id-" + key)) ++errors;
      }
    });
  }
  for (auto& w : workers)
    w.join();

  CHECK(errors.load() == 0);
  CHECK(cache.load_all().size() == threads * per_thread);
}

TEST_CASE("cache: concurrent add_path calls share one log", "[schema_cache]") {
  constexpr int dirs = 4;
  constexpr int bad_per_dir = 25;

  std::vector<fs::path> roots;
  for (int d = 0; d < dirs; ++d) {
    auto dir = make_tmp_dir("shared_log_" + std::to_string(d));
    for (int i = 0; i < bad_per_dir; ++i) {
      write_text(dir / ("bad" + std::to_string(i) + ".xsd"), "<schema>");
    }
    roots.push_back(dir);
  }

  std::ostringstream log;
  auto opts = quiet_options();
  opts.log = &log;
  schema_cache cache(opts, mock_http{}.transport());
  std::atomic<int> failures{0};

  std::vector<std::thread> workers;
  for (const auto& root : roots) {
    workers.emplace_back([&cache, &failures, root] {
      failures += static_cast<int>(cache.add_path(root.string()).size());
    });
  }
  for (auto& w : workers)
    w.join();

  CHECK(failures.load() == dirs * bad_per_dir);

  // Every warning lands on its own line, intact
  std::istringstream lines(log.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    CHECK(line.rfind("xsc: warning: file://", 0) == 0);
    ++count;
  }
  CHECK(count == dirs * bad_per_dir);

  for (const auto& root : roots)
    fs::remove_all(root);
}
