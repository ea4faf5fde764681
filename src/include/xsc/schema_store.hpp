#pragma once

#include <xsc/cache_types.hpp>

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace xsc {

  // Table of cache rows keyed by source key, with a secondary index on the
  // identifier key. Safe for concurrent use: lookups share the lock, inserts
  // and erasures take it exclusively.
  class schema_store {
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, cache_row> rows_;
    // id key -> source keys carrying it, in admission order
    std::unordered_map<std::string, std::vector<std::string>> by_id_;

    void
    unindex(const cache_row& row);

  public:
    schema_store() = default;

    schema_store(const schema_store&) = delete;
    schema_store&
    operator=(const schema_store&) = delete;

    std::optional<cache_row>
    find_by_source(const std::string& source_key) const;

    // With several rows declaring the same identifier, the most recently
    // admitted one wins.
    std::optional<cache_row>
    find_by_id(const std::string& id_key) const;

    // Replaces any row with the same source key.
    void
    insert(cache_row row);

    std::size_t
    erase_by_source(const std::string& source_key);

    // Removes every row declaring `id_key`.
    std::size_t
    erase_by_id(const std::string& id_key);

    std::vector<cache_row>
    rows() const;

    std::size_t
    size() const;
  };

} // namespace xsc
