#pragma once

#include <xsc/document.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xsc {

  // Modification time of a cached schema. The epoch value (timestamp{}) marks
  // a row that is never considered stale.
  using timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

  inline std::int64_t
  to_unix_seconds(timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               t.time_since_epoch())
        .count();
  }

  struct cache_row {
    std::string source_key;
    std::optional<std::string> id_key;
    timestamp mtime{};
    std::shared_ptr<const document> schema;
  };

  // A document offered for admission. When `schema` is empty the document
  // could not be read or parsed and `error` says why.
  struct schema_candidate {
    std::string source_key;
    timestamp mtime{};
    std::optional<document> schema;
    std::string error;
  };

  struct store_failure {
    std::string source_key;
    timestamp mtime{};
    std::string reason;
  };

  // Empty when every candidate was admitted.
  using store_result = std::vector<store_failure>;

} // namespace xsc
