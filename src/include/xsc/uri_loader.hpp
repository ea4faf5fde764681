#pragma once

#include <xsc/cache_types.hpp>

#include <functional>
#include <optional>
#include <string>

namespace xsc {

  struct http_response {
    long status = 0;
    std::string body;
    // Parsed Last-Modified header, if the server sent a usable one
    std::optional<timestamp> last_modified;
  };

  // Performs a GET for `url`. Throws network_error when no response could be
  // obtained; any response, whatever its status, is returned.
  using http_transport = std::function<http_response(const std::string& url)>;

  struct fetched_schema {
    std::string source_key;
    timestamp mtime{};
    std::string content;
  };

  // Fetches schemas by canonical source key, dispatching on the URI scheme.
  class uri_loader {
    http_transport transport_;
    std::string id_attribute_;

  public:
    explicit uri_loader(http_transport transport,
                        std::string id_attribute = "id");

    // file://  bytes and filesystem mtime (io_error on failure)
    // http(s):// GET; non-200 is a network_error, mtime from Last-Modified
    //            or timestamp{} when absent
    // other    unknown_uri_scheme
    fetched_schema
    fetch(const std::string& source_key) const;

    // Fetches and parses. A document without an identifier gets
    // `source_key` as its identifier. Throws parse_error on malformed
    // content.
    schema_candidate
    load(const std::string& source_key) const;
  };

} // namespace xsc
