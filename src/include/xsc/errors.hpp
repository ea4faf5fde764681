#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace xsc {

  // Base of every failure reported by the cache. `key()` is the canonical
  // key of the offending schema, or empty when none applies.
  class cache_error : public std::runtime_error {
    std::string key_;

  public:
    cache_error(std::string key, const std::string& message)
        : std::runtime_error(message), key_(std::move(key)) {}

    const std::string&
    key() const noexcept {
      return key_;
    }
  };

  class schema_not_found : public cache_error {
  public:
    explicit schema_not_found(const std::string& key)
        : cache_error(key, "schema not found: " + key) {}
  };

  class unknown_uri_scheme : public cache_error {
  public:
    explicit unknown_uri_scheme(const std::string& key)
        : cache_error(key, "unknown URI scheme: " + key) {}
  };

  class io_error : public cache_error {
    std::string detail_;

  public:
    io_error(const std::string& key, const std::string& detail)
        : cache_error(key, "I/O error: " + key + ": " + detail),
          detail_(detail) {}

    const std::string&
    detail() const noexcept {
      return detail_;
    }
  };

  class network_error : public cache_error {
    long status_ = 0;

  public:
    network_error(const std::string& key, const std::string& detail)
        : cache_error(key, "fetch failed: " + key + ": " + detail) {}

    network_error(const std::string& key, long status)
        : cache_error(key, "fetch failed: " + key + ": HTTP status " +
                               std::to_string(status)),
          status_(status) {}

    // HTTP status of the response, 0 when no response was received.
    long
    status() const noexcept {
      return status_;
    }
  };

  class parse_error : public cache_error {
    std::size_t line_ = 0;
    std::string detail_;

  public:
    parse_error(std::size_t line, const std::string& detail)
        : cache_error("", "XML parse error at line " + std::to_string(line) +
                              ": " + detail),
          line_(line), detail_(detail) {}

    parse_error(const std::string& key, std::size_t line,
                const std::string& detail)
        : cache_error(key, "XML parse error in " + key + " at line " +
                               std::to_string(line) + ": " + detail),
          line_(line), detail_(detail) {}

    std::size_t
    line() const noexcept {
      return line_;
    }

    const std::string&
    detail() const noexcept {
      return detail_;
    }
  };

} // namespace xsc
